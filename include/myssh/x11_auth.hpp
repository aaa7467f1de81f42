//           Copyright Maarten L. Hekkelman 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file x11_auth.hpp
/// Checking and replacing the authorization data in the connection setup
/// an X11 client sends, see the X protocol, "Connection Setup".
///
/// The setup starts with a fixed header of 12 bytes:
///
///   1  byte order: 'B' (msb first) or 'l' (lsb first)
///   1  unused
///   2  protocol major version
///   2  protocol minor version
///   2  length of authorization-protocol-name (n)
///   2  length of authorization-protocol-data (d)
///   2  unused
///
/// followed by the name and data, each padded to a multiple of four bytes.

#include "myssh/stream.hpp"
#include "myssh/types.hpp"

namespace myssh
{

/// \brief The size of the fixed part of the connection setup
const std::size_t kX11SetupHeaderSize = 12;

/// \brief The number of bytes needed to pad \a n to a multiple of four
constexpr std::size_t pad(std::size_t n)
{
	return (4 - n % 4) % 4;
}

/// \brief Return the size of the padded name and data following \a header
///
/// \param header	The first kX11SetupHeaderSize bytes of the connection
/// Throws error::unsupported_byte_order for an unknown byte order marker.
std::size_t x11_setup_size(const uint8_t *header);

/// \brief Check the authorization in a connection setup and replace it
///
/// \param header			The first kX11SetupHeaderSize bytes of the connection
/// \param auth				The x11_setup_size(header) bytes following it
/// \param pseudo_cookie	The cookie the client must present
/// \param real_cookie		The cookie the X server expects
/// \result The new header, name and data to send to the X server
///
/// Throws error::unsupported_auth_protocol or error::cookie_mismatch if the
/// client is not authorized. The real cookie is never part of an error.
blob rewrite_x11_setup(const uint8_t *header, const blob &auth,
	const blob &pseudo_cookie, const blob &real_cookie);

/// \brief Read the connection setup from \a client and return it rewritten
///
/// Exactly the header, name and data are read from \a client; anything
/// following it is left for the caller to relay.
asio_ns::awaitable<blob> async_exchange_x11_cookie(byte_stream &client,
	const blob &pseudo_cookie, const blob &real_cookie);

} // namespace myssh
