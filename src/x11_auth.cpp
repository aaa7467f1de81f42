//           Copyright Maarten L. Hekkelman 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include "myssh/error.hpp"
#include "myssh/x11_auth.hpp"

#include <cryptopp/misc.h>

#include <stdexcept>
#include <string_view>

namespace myssh
{

namespace
{

	const uint8_t kMSBFirst = 'B', kLSBFirst = 'l';

	bool msb_first(const uint8_t *header)
	{
		switch (header[0])
		{
			case kMSBFirst:
				return true;
			case kLSBFirst:
				return false;
			default:
				throw system_ns::system_error(error::make_error_code(error::unsupported_byte_order));
		}
	}

	uint16_t read_card16(const uint8_t *p, bool msb)
	{
		return msb ? (p[0] << 8 | p[1]) : (p[1] << 8 | p[0]);
	}

	void write_card16(blob &b, uint16_t v, bool msb)
	{
		if (msb)
		{
			b.push_back(static_cast<uint8_t>(v >> 8));
			b.push_back(static_cast<uint8_t>(v));
		}
		else
		{
			b.push_back(static_cast<uint8_t>(v));
			b.push_back(static_cast<uint8_t>(v >> 8));
		}
	}

} // namespace

// --------------------------------------------------------------------

std::size_t x11_setup_size(const uint8_t *header)
{
	bool msb = msb_first(header);

	std::size_t n = read_card16(header + 6, msb);
	std::size_t d = read_card16(header + 8, msb);

	return n + pad(n) + d + pad(d);
}

blob rewrite_x11_setup(const uint8_t *header, const blob &auth,
	const blob &pseudo_cookie, const blob &real_cookie)
{
	bool msb = msb_first(header);

	std::size_t n = read_card16(header + 6, msb);
	std::size_t d = read_card16(header + 8, msb);

	if (auth.size() != n + pad(n) + d + pad(d))
		throw std::invalid_argument("authorization data does not match the setup header");

	std::string_view name(reinterpret_cast<const char *>(auth.data()), n);
	if (name != kX11AuthProtocol)
		throw system_ns::system_error(error::make_error_code(error::unsupported_auth_protocol));

	const uint8_t *data = auth.data() + n + pad(n);
	if (d != pseudo_cookie.size() or not CryptoPP::VerifyBufsEqual(data, pseudo_cookie.data(), d))
		throw system_ns::system_error(error::make_error_code(error::cookie_mismatch));

	blob result(header, header + 8);
	result.reserve(kX11SetupHeaderSize + n + pad(n) + real_cookie.size() + pad(real_cookie.size()));

	write_card16(result, static_cast<uint16_t>(real_cookie.size()), msb);
	result.insert(result.end(), 2, 0);

	result.insert(result.end(), auth.begin(), auth.begin() + n + pad(n));
	result.insert(result.end(), real_cookie.begin(), real_cookie.end());
	result.insert(result.end(), pad(real_cookie.size()), 0);

	return result;
}

asio_ns::awaitable<blob> async_exchange_x11_cookie(byte_stream &client,
	const blob &pseudo_cookie, const blob &real_cookie)
{
	uint8_t header[kX11SetupHeaderSize];
	co_await async_read_exactly(client, asio_ns::buffer(header));

	blob auth(x11_setup_size(header));
	co_await async_read_exactly(client, asio_ns::buffer(auth));

	co_return rewrite_x11_setup(header, auth, pseudo_cookie, real_cookie);
}

} // namespace myssh
