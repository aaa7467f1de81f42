//           Copyright Maarten L. Hekkelman 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file x11_display.hpp
/// Parsing X display names and connecting to the X server they name

#include "myssh/stream.hpp"

#include <memory>
#include <string>

namespace myssh
{

/// \brief Where the sockets of local X servers live, the display number is appended
const std::string kX11SocketPrefix("/tmp/.X11-unix/X");

/// \brief X servers listening on tcp use this port plus their display number
const uint16_t kX11TcpPortBase = 6000;

/// \brief The parts of a display name, [host]:number[.screen]
struct x11_display
{
	std::string host; ///< empty for a local display
	std::string number;
	std::string screen; ///< optional

	std::string to_string() const;
};

/// \brief Parse a display name like ":0", "localhost:10.0" or "[::1]:1"
///
/// Throws a system_error with code error::malformed_display if \a name
/// does not contain a colon followed by a display number.
x11_display parse_display(const std::string &name);

/// \brief The address of an X server
struct x11_endpoint
{
	std::string socket_path; ///< set for a local display
	std::string host;
	uint16_t port = 0;

	bool is_local() const { return not socket_path.empty(); }

	std::string to_string() const;
};

/// \brief Translate \a display into the address of its X server
///
/// Local displays are reached using the unix socket \a socket_prefix
/// followed by the display number, others over tcp.
x11_endpoint resolve_display(const x11_display &display,
	const std::string &socket_prefix = kX11SocketPrefix);

/// \brief Connect to the X server at \a target
///
/// Failures are thrown as system_error with code error::dial_failed,
/// the message contains the target and the underlying cause.
asio_ns::awaitable<std::shared_ptr<byte_stream>> async_connect_display(
	asio_ns::any_io_executor executor, x11_endpoint target);

} // namespace myssh
