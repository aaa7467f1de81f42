//           Copyright Maarten L. Hekkelman 2013
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file x11_channel.hpp
/// Proxying a single forwarded X11 connection to the local X server

#include "myssh/session.hpp"
#include "myssh/x11_display.hpp"

#include <memory>

namespace myssh
{

/// \brief What every X11 proxy of a session needs to know, immutable once created
struct x11_context
{
	blob real_cookie;   ///< the cookie the local X server expects
	blob pseudo_cookie; ///< the cookie handed to the SSH server
	x11_endpoint target;
};

/// \brief Copy data between \a channel and \a display until both directions end
///
/// When the channel stops sending, the send side of \a display is shut down.
/// When the display stops sending, \a channel is closed. Both directions are
/// awaited, the result is the first error either of them encountered. The
/// end of data, or a read aborted by the other direction closing the stream,
/// is not an error.
///
/// Must be awaited from a coroutine running on a strand.
asio_ns::awaitable<system_ns::error_code> async_relay(
	std::shared_ptr<byte_stream> channel, std::shared_ptr<byte_stream> display);

/// \brief Handle the forwarded X11 connection \a channel
///
/// Reads and checks the connection setup, connects to the X server,
/// sends it the setup with the real cookie and then relays all data.
/// Any failure is thrown as a system_error, in which case the client
/// does not receive an X11 error reply. Both the channel and the
/// connection to the X server are closed when this returns.
asio_ns::awaitable<void> async_proxy_x11(
	std::shared_ptr<forwarded_channel> channel, std::shared_ptr<const x11_context> context);

} // namespace myssh
