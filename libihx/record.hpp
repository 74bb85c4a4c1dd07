#ifndef LIBIHX_RECORD_HPP
#define LIBIHX_RECORD_HPP

#include "vector_ref.hpp"
#include <string>
#include <vector>
#include <stdint.h>

namespace ihx {

// The enumerator values match the record type field of an IHEX line.
enum ihex_record_kind
{
	rk_data = 0,
	rk_end_of_file = 1,
	rk_extended_segment_address = 2,
	rk_start_segment_address = 3,
	rk_extended_linear_address = 4,
	rk_start_linear_address = 5,
};

struct ihex_record
{
	ihex_record()
		: kind(rk_end_of_file), offset(0), base(0), cs(0), ip(0), eip(0)
	{
	}

	ihex_record_kind kind;

	// rk_data
	uint16_t offset;
	std::vector<uint8_t> data;

	// rk_extended_segment_address, rk_extended_linear_address
	uint16_t base;

	// rk_start_segment_address
	uint16_t cs;
	uint16_t ip;

	// rk_start_linear_address
	uint32_t eip;
};

ihex_record make_data_record(uint16_t offset, buffer_ref const & data);
ihex_record make_extended_segment_record(uint16_t base);
ihex_record make_extended_linear_record(uint16_t base);
ihex_record make_end_of_file_record();
ihex_record make_start_segment_record(uint16_t cs, uint16_t ip);
ihex_record make_start_linear_record(uint32_t eip);

std::string to_string(ihex_record const & rec);

} // namespace ihx

#endif // LIBIHX_RECORD_HPP
