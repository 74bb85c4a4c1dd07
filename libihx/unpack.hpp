#ifndef LIBIHX_UNPACK_HPP
#define LIBIHX_UNPACK_HPP

#include "record_source.hpp"
#include "vector_ref.hpp"
#include <array>
#include <vector>
#include <string>
#include <functional>
#include <exception>
#include <stdint.h>
#include <stddef.h>

namespace ihx {

// Unprogrammed flash reads as all ones.
static uint8_t const ihex_fill_byte = 0xFF;

class ihex_unpack_error
	: public std::exception
{
public:
	enum kind_t
	{
		// `address` is the end of the offending record, `limit` the image size.
		k_address_too_high,

		// `address` is the absolute record address, `limit` the base offset.
		k_address_below_offset,
	};

	ihex_unpack_error(kind_t kind, uint64_t address, uint64_t limit);

	const char * what() const throw();
	kind_t kind() const;
	uint64_t address() const;
	uint64_t limit() const;

private:
	kind_t m_kind;
	uint64_t m_address;
	uint64_t m_limit;
	mutable std::string m_what;
};

struct unpack_options
{
	explicit unpack_options(size_t base_offset = 0)
		: base_offset(base_offset)
	{
	}

	// Subtracted from every address set by an extended address record.
	size_t base_offset;

	// Receives one line per record before the record is applied.
	std::function<void (std::string const &)> trace;
};

struct ihex_image
{
	std::vector<uint8_t> data;
	size_t used_bytes;
};

template <size_t N>
struct ihex_fixed_image
{
	std::array<uint8_t, N> data;
	size_t used_bytes;
};

// Applies records from `source` to `image` until the source is exhausted
// or an end of file record is seen. Returns the total length of the data
// records applied; overlapping records are counted once per record.
//
// Errors are not rolled back: on failure `image` keeps every record that
// was applied before the failing one. Parse errors thrown by the source
// propagate unchanged.
size_t unpack(record_source & source, mutable_buffer_ref image, unpack_options const & opts);
size_t unpack(record_source & source, mutable_buffer_ref image, size_t base_offset = 0);

ihex_image unpack_to_new_buffer(record_source & source, size_t binary_size, unpack_options const & opts);
ihex_image unpack_to_new_buffer(record_source & source, size_t binary_size, size_t base_offset = 0);

template <size_t N>
ihex_fixed_image<N> unpack_to_array(record_source & source, unpack_options const & opts)
{
	ihex_fixed_image<N> res;
	res.data.fill(ihex_fill_byte);
	res.used_bytes = unpack(source, res.data, opts);
	return res;
}

template <size_t N>
ihex_fixed_image<N> unpack_to_array(record_source & source, size_t base_offset = 0)
{
	return unpack_to_array<N>(source, unpack_options(base_offset));
}

} // namespace ihx

#endif // LIBIHX_UNPACK_HPP
