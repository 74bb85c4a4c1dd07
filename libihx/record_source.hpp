#ifndef LIBIHX_RECORD_SOURCE_HPP
#define LIBIHX_RECORD_SOURCE_HPP

#include "record.hpp"
#include <vector>
#include <stddef.h>

namespace ihx {

// Produces records one at a time. `next` returns false once the sequence
// is exhausted and throws if the next record cannot be produced.
class record_source
{
public:
	virtual ~record_source() {}
	virtual bool next(ihex_record & rec) = 0;
};

class vector_record_source
	: public record_source
{
public:
	explicit vector_record_source(std::vector<ihex_record> records);

	bool next(ihex_record & rec);

	// The number of records handed out so far.
	size_t consumed() const;

private:
	std::vector<ihex_record> m_records;
	size_t m_pos;
};

} // namespace ihx

#endif // LIBIHX_RECORD_SOURCE_HPP
