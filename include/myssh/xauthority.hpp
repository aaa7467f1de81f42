//           Copyright Maarten L. Hekkelman 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file xauthority.hpp
/// Reading and writing X authority data, the format of ~/.Xauthority
/// and of the output of `xauth extract`.
///
/// The data is a flat sequence of entries, each consisting of a 16 bit
/// family followed by four fields: address, display number, authorization
/// name and authorization data. Each field is prefixed by its 16 bit length.
/// All numbers are big endian.

#include "myssh/types.hpp"
#include "myssh/x11_display.hpp"

#include <iosfwd>
#include <iterator>
#include <string>

namespace myssh
{

/// \brief Address families as found in X authority entries
enum xauth_family : uint16_t
{
	family_internet = 0,
	family_decnet = 1,
	family_chaos = 2,
	family_server_interpreted = 5,
	family_internet6 = 6,
	family_localhost = 252,
	family_krb5_principal = 253,
	family_netname = 254,
	family_local = 256,
	family_wild = 65535
};

/// \brief A single entry in an X authority file
struct xauth_entry
{
	uint16_t family = 0;
	blob address;       ///< host name for family_local, raw address bytes otherwise
	std::string number; ///< the display number, as text
	std::string name;   ///< e.g. MIT-MAGIC-COOKIE-1
	blob data;          ///< the secret
};

// --------------------------------------------------------------------
/// \brief Decode X authority entries from a stream, one at a time
///
/// The reader never buffers more than a single entry. A stream that ends
/// cleanly between two entries ends the sequence; a stream that ends in
/// the middle of an entry throws a system_error with code
/// error::unexpected_end_of_data.
///
/// \code
/// xauth_reader reader(file);
/// for (auto &entry : reader)
/// 	std::cout << entry.number << '\n';
/// \endcode

class xauth_reader
{
  public:
	/// \brief Input iterator over the entries of a reader
	class iterator
	{
	  public:
		using iterator_category = std::input_iterator_tag;
		using value_type = xauth_entry;
		using difference_type = std::ptrdiff_t;
		using pointer = const xauth_entry *;
		using reference = const xauth_entry &;

		iterator() = default;

		reference operator*() const { return m_entry; }
		pointer operator->() const { return &m_entry; }

		iterator &operator++()
		{
			if (not m_reader->next(m_entry))
				m_reader = nullptr;
			return *this;
		}

		bool operator==(const iterator &rhs) const { return m_reader == rhs.m_reader; }
		bool operator!=(const iterator &rhs) const { return m_reader != rhs.m_reader; }

	  private:
		friend class xauth_reader;

		explicit iterator(xauth_reader *reader)
			: m_reader(reader)
		{
			operator++();
		}

		xauth_reader *m_reader = nullptr;
		xauth_entry m_entry;
	};

	explicit xauth_reader(std::istream &is)
		: m_is(is)
	{
	}

	xauth_reader(const xauth_reader &) = delete;
	xauth_reader &operator=(const xauth_reader &) = delete;

	/// \brief Decode the next entry into \a entry
	///
	/// \result false if the stream ended cleanly before a new entry
	bool next(xauth_entry &entry);

	/// \brief Start iterating, the sequence cannot be restarted
	iterator begin() { return iterator(this); }
	iterator end() { return {}; }

  private:
	std::istream &m_is;
	bool m_done = false;
};

/// \brief Encode \a entry in the X authority format
///
/// Throws std::length_error when a field does not fit its 16 bit length.
void write_xauth_entry(std::ostream &os, const xauth_entry &entry);

// --------------------------------------------------------------------

/// \brief Ask the xauth program for the cookie of \a display
///
/// Runs `xauth_location extract - display` and decodes its output, the data
/// of the last entry is returned. Throws error::cookie_not_found if xauth
/// did not return any entries.
blob fetch_xauth_cookie(const std::string &xauth_location, const std::string &display);

/// \brief Read the cookie for \a display from the authority file at \a path
///
/// Unlike fetch_xauth_cookie, which takes the last entry xauth prints, this
/// filters the file first: only entries with the display number of \a display
/// count, family_local and family_wild entries match any display, internet
/// entries only displays reached over tcp. Of those the last one wins.
/// Throws error::cookie_not_found if there is no match.
blob read_xauthority_cookie(const std::string &path, const x11_display &display);

} // namespace myssh
