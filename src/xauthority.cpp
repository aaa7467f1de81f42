//           Copyright Maarten L. Hekkelman 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include "myssh/error.hpp"
#include "myssh/xauthority.hpp"

#include <boost/filesystem/path.hpp>
#include <boost/process/args.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/io.hpp>
#include <boost/process/pipe.hpp>
#include <boost/process/search_path.hpp>

#include <fstream>
#include <istream>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <vector>

namespace bp = boost::process;

namespace myssh
{

namespace
{

	// Returns false when nothing at all could be read
	bool read_uint16(std::istream &is, uint16_t &v)
	{
		uint8_t b[2];
		is.read(reinterpret_cast<char *>(b), sizeof(b));

		switch (is.gcount())
		{
			case 0:
				return false;
			case 1:
				throw system_ns::system_error(error::make_error_code(error::unexpected_end_of_data));
			default:
				v = b[0] << 8 | b[1];
				return true;
		}
	}

	template <typename Container>
	void read_field(std::istream &is, Container &field)
	{
		uint16_t len;
		if (not read_uint16(is, len))
			throw system_ns::system_error(error::make_error_code(error::unexpected_end_of_data));

		field.resize(len);
		if (len > 0)
		{
			is.read(reinterpret_cast<char *>(field.data()), len);
			if (static_cast<std::size_t>(is.gcount()) != len)
				throw system_ns::system_error(error::make_error_code(error::unexpected_end_of_data));
		}
	}

	template <typename Container>
	void write_field(std::ostream &os, const Container &field)
	{
		if (field.size() > std::numeric_limits<uint16_t>::max())
			throw std::length_error("X authority field too long");

		const char len[2] = {
			static_cast<char>(field.size() >> 8),
			static_cast<char>(field.size())};

		os.write(len, sizeof(len));
		os.write(reinterpret_cast<const char *>(field.data()), field.size());
	}

	bool matches(const xauth_entry &entry, const x11_display &display)
	{
		if (entry.number != display.number)
			return false;

		switch (entry.family)
		{
			case family_local:
			case family_wild:
				return true;

			case family_internet:
			case family_internet6:
				return not display.host.empty();

			default:
				return false;
		}
	}

} // namespace

// --------------------------------------------------------------------

bool xauth_reader::next(xauth_entry &entry)
{
	if (m_done)
		return false;

	try
	{
		uint16_t family;
		if (not read_uint16(m_is, family))
		{
			m_done = true;
			return false;
		}

		entry.family = family;
		read_field(m_is, entry.address);
		read_field(m_is, entry.number);
		read_field(m_is, entry.name);
		read_field(m_is, entry.data);
	}
	catch (const system_ns::system_error &)
	{
		m_done = true;
		throw;
	}

	return true;
}

void write_xauth_entry(std::ostream &os, const xauth_entry &entry)
{
	const char family[2] = {
		static_cast<char>(entry.family >> 8),
		static_cast<char>(entry.family)};

	os.write(family, sizeof(family));

	write_field(os, entry.address);
	write_field(os, entry.number);
	write_field(os, entry.name);
	write_field(os, entry.data);
}

// --------------------------------------------------------------------

blob fetch_xauth_cookie(const std::string &xauth_location, const std::string &display)
{
	boost::filesystem::path exe(xauth_location);
	if (not exe.has_parent_path())
		exe = bp::search_path(xauth_location);

	if (exe.empty())
		throw system_ns::system_error(
			make_error_code(system_ns::errc::no_such_file_or_directory),
			xauth_location);

	bp::ipstream out;
	bp::child xauth(bp::exe = exe, bp::args = std::vector<std::string>{"extract", "-", display},
		bp::std_in < bp::null, bp::std_out > out);

	blob cookie;
	bool found = false;

	try
	{
		xauth_reader reader(out);
		for (auto &entry : reader)
		{
			cookie = entry.data;
			found = true;
		}
	}
	catch (const system_ns::system_error &)
	{
		xauth.terminate();
		throw;
	}

	xauth.wait();

	if (not found)
		throw system_ns::system_error(error::make_error_code(error::cookie_not_found), display);

	return cookie;
}

blob read_xauthority_cookie(const std::string &path, const x11_display &display)
{
	std::ifstream file(path, std::ios::binary);
	if (not file.is_open())
		throw system_ns::system_error(error::make_error_code(error::cookie_not_found), path);

	blob cookie;
	bool found = false;

	xauth_reader reader(file);
	for (auto &entry : reader)
	{
		if (not matches(entry, display))
			continue;

		cookie = entry.data;
		found = true;
	}

	if (not found)
		throw system_ns::system_error(error::make_error_code(error::cookie_not_found), display.to_string());

	return cookie;
}

} // namespace myssh
