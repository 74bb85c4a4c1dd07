#include "record_source.hpp"
#include <utility>
using namespace ihx;

vector_record_source::vector_record_source(std::vector<ihex_record> records)
	: m_records(std::move(records)), m_pos(0)
{
}

bool vector_record_source::next(ihex_record & rec)
{
	if (m_pos == m_records.size())
		return false;

	rec = m_records[m_pos++];
	return true;
}

size_t vector_record_source::consumed() const
{
	return m_pos;
}
