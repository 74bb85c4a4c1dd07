#include "unpack.hpp"
#include <fmt/format.h>
#include <algorithm>
using namespace ihx;

ihex_unpack_error::ihex_unpack_error(kind_t kind, uint64_t address, uint64_t limit)
	: m_kind(kind), m_address(address), m_limit(limit)
{
}

const char * ihex_unpack_error::what() const throw()
{
	if (m_what.empty())
	{
		if (m_kind == k_address_too_high)
			m_what = fmt::format("address ({}) greater than binary size ({})", m_address, m_limit);
		else
			m_what = fmt::format("address (0x{:X}) below base offset (0x{:X})", m_address, m_limit);
	}
	return m_what.c_str();
}

ihex_unpack_error::kind_t ihex_unpack_error::kind() const
{
	return m_kind;
}

uint64_t ihex_unpack_error::address() const
{
	return m_address;
}

uint64_t ihex_unpack_error::limit() const
{
	return m_limit;
}

size_t ihx::unpack(record_source & source, mutable_buffer_ref image, unpack_options const & opts)
{
	// Absolute base set by the last extended address record. Until the
	// first such record, data offsets index the image directly.
	// Addresses are 64-bit so that they cannot wrap where size_t is 32 bits.
	uint64_t base_address = 0;
	bool rebased = false;
	size_t used_bytes = 0;

	ihex_record rec;
	while (source.next(rec))
	{
		if (opts.trace)
			opts.trace(fmt::format("base_address=0x{:04X} rec={}", base_address, to_string(rec)));

		switch (rec.kind)
		{
		case rk_data:
			{
				uint64_t start = base_address + rec.offset;
				if (rebased)
				{
					if (start < opts.base_offset)
						throw ihex_unpack_error(ihex_unpack_error::k_address_below_offset, start, opts.base_offset);
					start -= opts.base_offset;
				}

				uint64_t end = start + rec.data.size();
				if (end > image.size())
					throw ihex_unpack_error(ihex_unpack_error::k_address_too_high, end, image.size());

				std::copy(rec.data.begin(), rec.data.end(), image.begin() + static_cast<size_t>(start));
				used_bytes += rec.data.size();
			}
			break;
		case rk_extended_segment_address:
			base_address = uint64_t(rec.base) << 4;
			rebased = true;
			break;
		case rk_extended_linear_address:
			base_address = uint64_t(rec.base) << 16;
			rebased = true;
			break;
		case rk_end_of_file:
			return used_bytes;
		case rk_start_segment_address:
		case rk_start_linear_address:
			// Entry points don't affect the image.
			break;
		}
	}

	return used_bytes;
}

size_t ihx::unpack(record_source & source, mutable_buffer_ref image, size_t base_offset)
{
	return unpack(source, image, unpack_options(base_offset));
}

ihex_image ihx::unpack_to_new_buffer(record_source & source, size_t binary_size, unpack_options const & opts)
{
	ihex_image res;
	res.data.assign(binary_size, ihex_fill_byte);
	res.used_bytes = unpack(source, res.data, opts);
	return res;
}

ihex_image ihx::unpack_to_new_buffer(record_source & source, size_t binary_size, size_t base_offset)
{
	return unpack_to_new_buffer(source, binary_size, unpack_options(base_offset));
}
