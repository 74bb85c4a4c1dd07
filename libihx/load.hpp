#ifndef LIBIHX_LOAD_HPP
#define LIBIHX_LOAD_HPP

#include "unpack.hpp"
#include <string>
#include <stdexcept>

namespace ihx {

class load_error
	: public std::runtime_error
{
public:
	enum kind_t
	{
		k_open_failed,
		k_read_failed,
	};

	load_error(kind_t kind, std::string const & path, int error_number);

	kind_t kind() const;
	std::string const & path() const;
	int error_number() const;

private:
	kind_t m_kind;
	std::string m_path;
	int m_errno;
};

// Reads the whole file at `path` and unpacks it into a new image of
// `binary_size` bytes. Throws load_error on I/O failures; parse and
// unpack errors propagate as thrown by ihex_reader and unpack.
ihex_image load_from_path(std::string const & path, size_t binary_size, unpack_options const & opts);
ihex_image load_from_path(std::string const & path, size_t binary_size, size_t base_offset = 0);

} // namespace ihx

#endif // LIBIHX_LOAD_HPP
