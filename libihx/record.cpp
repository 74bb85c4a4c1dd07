#include "record.hpp"
#include <fmt/format.h>
using namespace ihx;

ihex_record ihx::make_data_record(uint16_t offset, buffer_ref const & data)
{
	ihex_record res;
	res.kind = rk_data;
	res.offset = offset;
	res.data.assign(data.begin(), data.end());
	return res;
}

ihex_record ihx::make_extended_segment_record(uint16_t base)
{
	ihex_record res;
	res.kind = rk_extended_segment_address;
	res.base = base;
	return res;
}

ihex_record ihx::make_extended_linear_record(uint16_t base)
{
	ihex_record res;
	res.kind = rk_extended_linear_address;
	res.base = base;
	return res;
}

ihex_record ihx::make_end_of_file_record()
{
	return ihex_record();
}

ihex_record ihx::make_start_segment_record(uint16_t cs, uint16_t ip)
{
	ihex_record res;
	res.kind = rk_start_segment_address;
	res.cs = cs;
	res.ip = ip;
	return res;
}

ihex_record ihx::make_start_linear_record(uint32_t eip)
{
	ihex_record res;
	res.kind = rk_start_linear_address;
	res.eip = eip;
	return res;
}

std::string ihx::to_string(ihex_record const & rec)
{
	switch (rec.kind)
	{
	case rk_data:
		return fmt::format("data(offset=0x{:04X}, len={})", rec.offset, rec.data.size());
	case rk_end_of_file:
		return "end_of_file";
	case rk_extended_segment_address:
		return fmt::format("extended_segment_address(0x{:04X})", rec.base);
	case rk_start_segment_address:
		return fmt::format("start_segment_address(cs=0x{:04X}, ip=0x{:04X})", rec.cs, rec.ip);
	case rk_extended_linear_address:
		return fmt::format("extended_linear_address(0x{:04X})", rec.base);
	case rk_start_linear_address:
		return fmt::format("start_linear_address(0x{:08X})", rec.eip);
	}

	return fmt::format("unknown({})", static_cast<int>(rec.kind));
}
