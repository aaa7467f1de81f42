//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include "myssh/error.hpp"

namespace myssh
{

namespace error
{
	namespace detail
	{

		class x11_category : public system_ns::error_category
		{
		  public:
			const char *name() const noexcept override
			{
				return "myssh.x11";
			}

			std::string message(int value) const override
			{
				switch (value)
				{
					case malformed_display:
						return "malformed display name";
					case dial_failed:
						return "could not connect to the X display";
					case cookie_not_found:
						return "no X11 authority cookie found for display";
					case unexpected_end_of_data:
						return "unexpected end of X authority data";
					case unsupported_byte_order:
						return "unsupported X11 byte order";
					case unsupported_auth_protocol:
						return "unsupported X11 authorization protocol";
					case cookie_mismatch:
						return "X11 authorization cookie does not match";
					case forwarding_rejected:
						return "X11 forwarding request was rejected";
					default:
						return "unknown x11 error";
				}
			}
		};

	} // namespace detail

	system_ns::error_category &x11_category()
	{
		static detail::x11_category impl;
		return impl;
	}

} // namespace error

} // namespace myssh
