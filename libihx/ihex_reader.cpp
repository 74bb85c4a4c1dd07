#include "ihex_reader.hpp"
#include <fmt/format.h>
using namespace ihx;

static bool from_hex(uint8_t & res, char ch)
{
	if ('0' <= ch && ch <= '9')
		res = ch - '0';
	else if ('a' <= ch && ch <= 'f')
		res = ch - 'a' + 10;
	else if ('A' <= ch && ch <= 'F')
		res = ch - 'A' + 10;
	else
		return false;

	return true;
}

static bool from_base_16(uint8_t * out, string_ref b16)
{
	for (; b16.size() >= 2; b16 = b16 + 2)
	{
		uint8_t b1, b2;
		if (!from_hex(b1, b16[0]) || !from_hex(b2, b16[1]))
			return false;

		*out++ = (b1 << 4) | b2;
	}

	return true;
}

static char const * describe(ihex_parse_error::kind_t kind)
{
	switch (kind)
	{
	case ihex_parse_error::k_missing_leading_colon:
		return "missing leading colon";
	case ihex_parse_error::k_odd_digit_count:
		return "odd number of hex digits";
	case ihex_parse_error::k_unexpected_character:
		return "unexpected character";
	case ihex_parse_error::k_mismatched_record_length:
		return "byte count does not match record length";
	case ihex_parse_error::k_checksum_mismatch:
		return "checksum mismatch";
	case ihex_parse_error::k_unknown_record_type:
		return "unknown record type";
	case ihex_parse_error::k_invalid_record_length:
		return "invalid length for record type";
	}

	return "ihex parsing failed";
}

ihex_parse_error::ihex_parse_error(kind_t kind, int line)
	: m_kind(kind), m_line(line)
{
}

const char * ihex_parse_error::what() const throw()
{
	if (m_what.empty())
		m_what = fmt::format("line {}: {}", m_line, describe(m_kind));
	return m_what.c_str();
}

ihex_parse_error::kind_t ihex_parse_error::kind() const
{
	return m_kind;
}

int ihex_parse_error::line() const
{
	return m_line;
}

ihex_reader::ihex_reader(std::istream & in)
	: m_in(in), m_line(0)
{
}

ihex_reader::ihex_reader(string_ref const & text)
	: m_owned(new std::istringstream(text.to_string())), m_in(*m_owned), m_line(0)
{
}

int ihex_reader::line() const
{
	return m_line;
}

bool ihex_reader::next(ihex_record & rec)
{
	std::string line;
	for (;;)
	{
		if (!std::getline(m_in, line))
			return false;
		++m_line;

		if (!line.empty() && line.end()[-1] == '\r')
			line.erase(line.end() - 1);

		if (!line.empty())
			break;
	}

	if (line[0] != ':')
		throw ihex_parse_error(ihex_parse_error::k_missing_leading_colon, m_line);
	if (line.size() % 2 != 1)
		throw ihex_parse_error(ihex_parse_error::k_odd_digit_count, m_line);

	m_bytes.resize(line.size() / 2);
	if (!from_base_16(m_bytes.data(), string_ref(line) + 1))
		throw ihex_parse_error(ihex_parse_error::k_unexpected_character, m_line);

	// length, address (2), type and checksum
	if (m_bytes.size() < 5 || m_bytes[0] != m_bytes.size() - 5)
		throw ihex_parse_error(ihex_parse_error::k_mismatched_record_length, m_line);

	uint8_t sum = 0;
	for (size_t i = 0; i < m_bytes.size(); ++i)
		sum += m_bytes[i];
	if (sum != 0)
		throw ihex_parse_error(ihex_parse_error::k_checksum_mismatch, m_line);

	uint8_t length = m_bytes[0];
	uint16_t address = (m_bytes[1] << 8) | m_bytes[2];
	uint8_t rectype = m_bytes[3];
	uint8_t const * payload = m_bytes.data() + 4;

	switch (rectype)
	{
	case rk_data:
		rec = make_data_record(address, buffer_ref(payload, length));
		break;
	case rk_end_of_file:
		if (length != 0)
			throw ihex_parse_error(ihex_parse_error::k_invalid_record_length, m_line);
		rec = make_end_of_file_record();
		break;
	case rk_extended_segment_address:
	case rk_extended_linear_address:
		if (length != 2)
			throw ihex_parse_error(ihex_parse_error::k_invalid_record_length, m_line);
		rec = rectype == rk_extended_segment_address
			? make_extended_segment_record((payload[0] << 8) | payload[1])
			: make_extended_linear_record((payload[0] << 8) | payload[1]);
		break;
	case rk_start_segment_address:
		if (length != 4)
			throw ihex_parse_error(ihex_parse_error::k_invalid_record_length, m_line);
		rec = make_start_segment_record((payload[0] << 8) | payload[1], (payload[2] << 8) | payload[3]);
		break;
	case rk_start_linear_address:
		if (length != 4)
			throw ihex_parse_error(ihex_parse_error::k_invalid_record_length, m_line);
		rec = make_start_linear_record(
			(uint32_t(payload[0]) << 24) | (uint32_t(payload[1]) << 16) | (payload[2] << 8) | payload[3]);
		break;
	default:
		throw ihex_parse_error(ihex_parse_error::k_unknown_record_type, m_line);
	}

	return true;
}
