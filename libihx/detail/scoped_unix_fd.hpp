#ifndef LIBIHX_DETAIL_SCOPED_UNIX_FD_HPP
#define LIBIHX_DETAIL_SCOPED_UNIX_FD_HPP

#include <unistd.h>

namespace ihx {
namespace detail {

class scoped_unix_fd
{
public:
	explicit scoped_unix_fd(int fd = -1)
		: m_fd(fd)
	{
	}

	~scoped_unix_fd()
	{
		if (!this->empty())
			close(m_fd);
	}

	bool empty() const
	{
		return m_fd < 0;
	}

	int get() const
	{
		return m_fd;
	}

private:
	int m_fd;

	scoped_unix_fd(scoped_unix_fd const &);
	scoped_unix_fd & operator=(scoped_unix_fd const &);
};

} // namespace detail
} // namespace ihx

#endif // LIBIHX_DETAIL_SCOPED_UNIX_FD_HPP
