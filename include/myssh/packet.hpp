//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \brief Encoding of SSH request data, RFC 4251 section 5

#include "myssh/types.hpp"

#include <exception>
#include <string_view>
#include <type_traits>

namespace myssh
{

/// \brief exception thrown in case of an invalid packet
class packet_exception : public std::exception
{
  public:
	const char *what() const noexcept override
	{
		return "invalid or truncated packet";
	}
};

/// \brief outgoing data, the payload of a request
class opacket
{
  public:
	opacket() = default;

	opacket(const opacket &rhs) = default;
	opacket(opacket &&rhs) = default;
	opacket &operator=(const opacket &rhs) = default;
	opacket &operator=(opacket &&rhs) = default;

	/// \brief View the contents of this packet
	operator blob() const { return m_data; }

	/// \brief Access to the underlying data
	const uint8_t *data() const { return m_data.data(); }

	/// \brief Return the size of the data contained in this packet
	std::size_t size() const { return m_data.size(); }

	/// \brief Store the value \a v, big endian
	template <typename T, typename std::enable_if_t<std::is_integral_v<T>, int> = 0>
	opacket &operator<<(T v)
	{
		for (int i = sizeof(T) - 1; i >= 0; --i)
			m_data.push_back(static_cast<uint8_t>(v >> (i * 8)));

		return *this;
	}

	/// \brief Store a boolean, a single byte
	opacket &operator<<(bool v)
	{
		m_data.push_back(v ? 1 : 0);
		return *this;
	}

	/// \brief Store a string, prefixed by its uint32 length
	opacket &operator<<(std::string_view v);

	/// \brief Store a string of bytes, prefixed by its uint32 length
	opacket &operator<<(const blob &v);

  protected:
	blob m_data;
};

/// \brief incomming data
class ipacket
{
  public:
	/// \brief Constructor taking raw data
	explicit ipacket(blob data)
		: m_data(std::move(data))
	{
	}

	/// \brief Return true if all data has been read
	bool empty() const { return m_offset == m_data.size(); }

	/// \brief Read data values from an ipacket
	template <typename T, typename std::enable_if_t<std::is_integral_v<T>, int> = 0>
	ipacket &operator>>(T &v)
	{
		v = 0;

		if (m_offset + sizeof(T) > m_data.size())
			throw packet_exception();

		for (int i = sizeof(T) - 1; i >= 0; --i)
			v = v << 8 | m_data[m_offset++];

		return *this;
	}

	ipacket &operator>>(bool &v);
	ipacket &operator>>(std::string &v);
	ipacket &operator>>(blob &v);

  private:
	blob m_data;
	std::size_t m_offset = 0;
};

} // namespace myssh
