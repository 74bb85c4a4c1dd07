#ifndef LIBIHX_IHEX_READER_HPP
#define LIBIHX_IHEX_READER_HPP

#include "record_source.hpp"
#include "vector_ref.hpp"
#include <istream>
#include <sstream>
#include <memory>
#include <string>
#include <exception>

namespace ihx {

class ihex_parse_error
	: public std::exception
{
public:
	enum kind_t
	{
		k_missing_leading_colon,
		k_odd_digit_count,
		k_unexpected_character,
		k_mismatched_record_length,
		k_checksum_mismatch,
		k_unknown_record_type,
		k_invalid_record_length,
	};

	ihex_parse_error(kind_t kind, int line);

	const char * what() const throw();
	kind_t kind() const;
	int line() const;

private:
	kind_t m_kind;
	int m_line;
	mutable std::string m_what;
};

// Reads IHEX text one line per call to `next`. Each line is checked for
// syntax, length and checksum before a record is returned. Address
// composition is left to the consumer.
class ihex_reader
	: public record_source
{
public:
	explicit ihex_reader(std::istream & in);
	explicit ihex_reader(string_ref const & text);

	bool next(ihex_record & rec);

	// The number of the last line read, 1-based.
	int line() const;

private:
	std::unique_ptr<std::istringstream> m_owned;
	std::istream & m_in;
	int m_line;
	std::vector<uint8_t> m_bytes;

	ihex_reader(ihex_reader const &);
	ihex_reader & operator=(ihex_reader const &);
};

} // namespace ihx

#endif // LIBIHX_IHEX_READER_HPP
