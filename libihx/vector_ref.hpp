#ifndef LIBIHX_VECTOR_REF_HPP
#define LIBIHX_VECTOR_REF_HPP

#include <string.h>
#include <string>
#include <vector>
#include <array>
#include <algorithm>
#include <stdint.h>
#include <stddef.h>

namespace ihx {

template <typename T, typename Derived>
class vector_ref_base
{
public:
	vector_ref_base(T const * first, T const * last)
		: first(first), last(last)
	{
	}

	vector_ref_base(T const * first, size_t size)
		: first(first), last(first + size)
	{
	}

	vector_ref_base(std::vector<T> const & v)
		: first(v.data()), last(v.data() + v.size())
	{
	}

	T const * begin() const { return first; }
	T const * end() const { return last; }

	T const * data() const { return first; }
	size_t size() const { return static_cast<size_t>(last - first); }

	T const & operator[](size_t i) const { return first[i]; }

	friend Derived operator+(vector_ref_base const & lhs, size_t rhs)
	{
		return Derived(lhs.begin() + (std::min)(lhs.size(), rhs), lhs.end());
	}

private:
	T const * first;
	T const * last;
};

class buffer_ref
	: public vector_ref_base<uint8_t, buffer_ref>
{
	typedef vector_ref_base<uint8_t, buffer_ref> base_type;
public:
	buffer_ref(uint8_t const * first, size_t size)
		: base_type(first, size)
	{
	}

	buffer_ref(std::vector<uint8_t> const & v)
		: base_type(v)
	{
	}
};

class string_ref
	: public vector_ref_base<char, string_ref>
{
	typedef vector_ref_base<char, string_ref> base_type;
public:
	string_ref(char const * first, char const * last)
		: base_type(first, last)
	{
	}

	string_ref(char const * str)
		: base_type(str, strlen(str))
	{
	}

	string_ref(std::string const & str)
		: base_type(str.data(), str.size())
	{
	}

	std::string to_string() const
	{
		return std::string(this->data(), this->size());
	}
};

// A writable window over caller-owned storage. The referenced bytes
// must outlive the reference.
class mutable_buffer_ref
{
public:
	mutable_buffer_ref(uint8_t * first, size_t size)
		: m_first(first), m_size(size)
	{
	}

	mutable_buffer_ref(std::vector<uint8_t> & v)
		: m_first(v.data()), m_size(v.size())
	{
	}

	template <size_t N>
	mutable_buffer_ref(std::array<uint8_t, N> & v)
		: m_first(v.data()), m_size(N)
	{
	}

	uint8_t * begin() const { return m_first; }
	size_t size() const { return m_size; }

private:
	uint8_t * m_first;
	size_t m_size;
};

} // namespace ihx

#endif // LIBIHX_VECTOR_REF_HPP
