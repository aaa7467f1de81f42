//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include "myssh/packet.hpp"

namespace myssh
{

opacket &opacket::operator<<(std::string_view v)
{
	operator<<(static_cast<uint32_t>(v.length()));
	const uint8_t *s = reinterpret_cast<const uint8_t *>(v.data());
	m_data.insert(m_data.end(), s, s + v.length());
	return *this;
}

opacket &opacket::operator<<(const blob &v)
{
	operator<<(static_cast<uint32_t>(v.size()));
	m_data.insert(m_data.end(), v.begin(), v.end());
	return *this;
}

// --------------------------------------------------------------------

ipacket &ipacket::operator>>(bool &v)
{
	if (m_offset + 1 > m_data.size())
		throw packet_exception();

	v = m_data[m_offset++] != 0;
	return *this;
}

ipacket &ipacket::operator>>(std::string &v)
{
	uint32_t len;
	operator>>(len);
	if (m_offset + len > m_data.size())
		throw packet_exception();

	const char *s = reinterpret_cast<const char *>(m_data.data() + m_offset);
	v.assign(s, len);
	m_offset += len;

	return *this;
}

ipacket &ipacket::operator>>(blob &v)
{
	uint32_t len;
	operator>>(len);
	if (m_offset + len > m_data.size())
		throw packet_exception();

	v.assign(m_data.begin() + m_offset, m_data.begin() + m_offset + len);
	m_offset += len;

	return *this;
}

} // namespace myssh
