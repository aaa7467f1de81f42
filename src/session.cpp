//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include "myssh/session.hpp"

namespace myssh
{

opacket &operator<<(opacket &out, const x11_request &req)
{
	return out << req.single_connection
			   << req.auth_protocol
			   << req.auth_cookie
			   << req.screen;
}

ipacket &operator>>(ipacket &in, x11_request &req)
{
	return in >> req.single_connection
			  >> req.auth_protocol
			  >> req.auth_cookie
			  >> req.screen;
}

} // namespace myssh
