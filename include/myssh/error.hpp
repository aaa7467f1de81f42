//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file error.hpp
/// The error codes reported by the X11 forwarding code

#include "myssh/asio.hpp"

#include <type_traits>

namespace myssh
{

namespace error
{

	/// \brief Errors in setting up or running X11 forwarding
	enum x11_errors
	{
		malformed_display = 1,     ///< DISPLAY does not look like [host]:number[.screen]
		dial_failed,               ///< Could not connect to the local X server
		cookie_not_found,          ///< No authority entry for the display
		unexpected_end_of_data,    ///< Authority data ended in the middle of a record
		unsupported_byte_order,    ///< Connection setup with an unknown byte order marker
		unsupported_auth_protocol, ///< Client used something other than MIT-MAGIC-COOKIE-1
		cookie_mismatch,           ///< Client presented the wrong cookie
		forwarding_rejected        ///< The server refused the x11-req request
	};

	/// \brief The category for x11_errors
	system_ns::error_category &x11_category();

	inline system_ns::error_code make_error_code(x11_errors e)
	{
		return system_ns::error_code(static_cast<int>(e), x11_category());
	}

} // namespace error

} // namespace myssh

// --------------------------------------------------------------------

namespace boost::system
{

template <>
struct is_error_code_enum<myssh::error::x11_errors>
{
	static const bool value = true;
};

} // namespace boost::system
