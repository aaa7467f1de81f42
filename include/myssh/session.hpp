//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file session.hpp
/// The parts of an SSH session the X11 forwarding code depends upon.
///
/// The SSH transport itself lives elsewhere, these interfaces are all
/// the forwarding code gets to see of it.

#include "myssh/packet.hpp"
#include "myssh/stream.hpp"

#include <memory>
#include <string>

namespace myssh
{

// --------------------------------------------------------------------
/// \brief A channel opened by the server, of type "x11"

class forwarded_channel : public byte_stream
{
  public:
	/// \brief Answer all channel requests on this channel with a failure
	virtual void discard_requests() = 0;

	/// \brief Originator address and port, as sent in the channel open message
	virtual std::string originator() const = 0;
};

// --------------------------------------------------------------------
/// \brief The type specific data of an "x11-req" channel request, RFC 4254 6.3.1

struct x11_request
{
	bool single_connection = false;
	std::string auth_protocol;
	std::string auth_cookie; ///< hex encoded
	uint32_t screen = 0;
};

opacket &operator<<(opacket &out, const x11_request &req);
ipacket &operator>>(ipacket &in, x11_request &req);

// --------------------------------------------------------------------
/// \brief An interactive SSH session

class ssh_session
{
  public:
	virtual ~ssh_session() = default;

	/// \brief The executor on which the session's operations complete
	virtual asio_ns::any_io_executor get_executor() = 0;

	/// \brief Send the channel request \a request with data \a payload on the session channel
	///
	/// \result true if the server answered with success. With \a want_reply
	/// set to false the result is always true.
	virtual asio_ns::awaitable<bool> async_channel_request(std::string request, bool want_reply, blob payload) = 0;

	/// \brief Wait for the server to open the next "x11" channel
	///
	/// The channel open is confirmed before it is returned. Returns
	/// a null pointer once the session is closed.
	virtual asio_ns::awaitable<std::shared_ptr<forwarded_channel>> async_accept_x11() = 0;
};

} // namespace myssh
