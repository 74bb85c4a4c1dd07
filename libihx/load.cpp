#include "load.hpp"
#include "ihex_reader.hpp"
#include "detail/scoped_unix_fd.hpp"
#include <fmt/format.h>
#include <string.h>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
using namespace ihx;

static std::string format_load_error(load_error::kind_t kind, std::string const & path, int error_number)
{
	return fmt::format("{} {}: {}",
		kind == load_error::k_open_failed? "failed to open": "failed to read",
		path, strerror(error_number));
}

load_error::load_error(kind_t kind, std::string const & path, int error_number)
	: std::runtime_error(format_load_error(kind, path, error_number)),
	m_kind(kind), m_path(path), m_errno(error_number)
{
}

load_error::kind_t load_error::kind() const
{
	return m_kind;
}

std::string const & load_error::path() const
{
	return m_path;
}

int load_error::error_number() const
{
	return m_errno;
}

static std::string read_file(std::string const & path)
{
	detail::scoped_unix_fd fd(open(path.c_str(), O_RDONLY | O_CLOEXEC));
	if (fd.empty())
		throw load_error(load_error::k_open_failed, path, errno);

	std::string res;
	char chunk[4096];
	for (;;)
	{
		ssize_t r = read(fd.get(), chunk, sizeof chunk);
		if (r < 0)
		{
			if (errno == EINTR)
				continue;
			throw load_error(load_error::k_read_failed, path, errno);
		}

		if (r == 0)
			break;

		res.append(chunk, r);
	}

	return res;
}

ihex_image ihx::load_from_path(std::string const & path, size_t binary_size, unpack_options const & opts)
{
	std::string text = read_file(path);
	ihex_reader reader(text);
	return unpack_to_new_buffer(reader, binary_size, opts);
}

ihex_image ihx::load_from_path(std::string const & path, size_t binary_size, size_t base_offset)
{
	return load_from_path(path, binary_size, unpack_options(base_offset));
}
