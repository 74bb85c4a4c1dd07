#include "test.h"
#include <libihx/load.hpp>
#include <libihx/ihex_reader.hpp>
#include <fstream>
#include <string>
#include <cassert>
#include <errno.h>
#include <stdlib.h>
#include <unistd.h>

namespace {

class temp_file
{
public:
	explicit temp_file(std::string const & content)
	{
		char name[] = "/tmp/libihx_testXXXXXX";
		int fd = mkstemp(name);
		assert(fd >= 0);
		close(fd);
		m_path = name;

		std::ofstream fout(m_path.c_str(), std::ios::binary);
		fout << content;
	}

	~temp_file()
	{
		unlink(m_path.c_str());
	}

	std::string const & path() const
	{
		return m_path;
	}

private:
	std::string m_path;
};

}

TEST_CASE(LoadFromPath, "load")
{
	temp_file f(
		":020000040800F2\n"
		":0400100001020304E2\n"
		":0400000508000131BD\n"
		":00000001FF\n");

	ihx::ihex_image img = ihx::load_from_path(f.path(), 0x20, 0x08000000);
	assert(img.used_bytes == 4);
	assert(img.data.size() == 0x20);
	assert(img.data[0x10] == 1 && img.data[0x13] == 4);
	assert(img.data[0x0F] == 0xFF && img.data[0x14] == 0xFF);
}

TEST_CASE(LoadStopsAtEndOfFile, "load")
{
	// Lines after the end of file record are never read.
	temp_file f(
		":0100000011EE\n"
		":00000001FF\n"
		"GARBAGE\n");

	ihx::ihex_image img = ihx::load_from_path(f.path(), 2);
	assert(img.used_bytes == 1);
	assert(img.data[0] == 0x11 && img.data[1] == 0xFF);
}

TEST_CASE(LoadMissingFile, "load")
{
	try
	{
		ihx::load_from_path("/nonexistent/libihx/image.hex", 16);
		assert(false);
	}
	catch (ihx::load_error const & e)
	{
		assert(e.kind() == ihx::load_error::k_open_failed);
		assert(e.error_number() == ENOENT);
		assert(e.path() == "/nonexistent/libihx/image.hex");
	}
}

TEST_CASE(LoadDirectory, "load")
{
	try
	{
		ihx::load_from_path("/tmp", 16);
		assert(false);
	}
	catch (ihx::load_error const & e)
	{
		assert(e.kind() == ihx::load_error::k_read_failed);
		assert(e.error_number() == EISDIR);
	}
}

TEST_CASE(LoadImageTooSmall, "load")
{
	temp_file f(
		":0400000001020304F2\n"
		":00000001FF\n");

	try
	{
		ihx::load_from_path(f.path(), 3);
		assert(false);
	}
	catch (ihx::ihex_unpack_error const & e)
	{
		assert(e.kind() == ihx::ihex_unpack_error::k_address_too_high);
		assert(e.address() == 4 && e.limit() == 3);
	}
}

TEST_CASE(LoadMalformedFile, "load")
{
	temp_file f(
		":0400000001020304F2\n"
		":0400000001020304F3\n");

	try
	{
		ihx::load_from_path(f.path(), 16);
		assert(false);
	}
	catch (ihx::ihex_parse_error const & e)
	{
		assert(e.kind() == ihx::ihex_parse_error::k_checksum_mismatch);
		assert(e.line() == 2);
	}
}
