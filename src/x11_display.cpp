//           Copyright Maarten L. Hekkelman 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include "myssh/error.hpp"
#include "myssh/x11_display.hpp"

#include <boost/lexical_cast.hpp>
#include <boost/regex.hpp>

#include <limits>

namespace myssh
{

std::string x11_display::to_string() const
{
	std::string result = host + ':' + number;
	if (not screen.empty())
		result += '.' + screen;
	return result;
}

x11_display parse_display(const std::string &name)
{
	// the last :number[.screen] is the display, all before it the host
	static const boost::regex rx(R"((.*?):(\d+)(?:\.(\d+))?)");

	boost::smatch m;
	if (not boost::regex_match(name, m, rx))
		throw system_ns::system_error(error::make_error_code(error::malformed_display), name);

	return {m[1].str(), m[2].str(), m[3].matched ? m[3].str() : std::string()};
}

// --------------------------------------------------------------------

std::string x11_endpoint::to_string() const
{
	if (is_local())
		return "unix:" + socket_path;
	return host + ':' + boost::lexical_cast<std::string>(port);
}

x11_endpoint resolve_display(const x11_display &display, const std::string &socket_prefix)
{
	x11_endpoint result;

	unsigned long number;
	if (not boost::conversion::try_lexical_convert(display.number, number) or
		number > std::numeric_limits<uint16_t>::max() - kX11TcpPortBase)
	{
		throw system_ns::system_error(error::make_error_code(error::malformed_display), display.to_string());
	}

	if (display.host.empty())
		result.socket_path = socket_prefix + display.number;
	else
	{
		result.host = display.host;
		result.port = static_cast<uint16_t>(kX11TcpPortBase + number);
	}

	return result;
}

// --------------------------------------------------------------------

asio_ns::awaitable<std::shared_ptr<byte_stream>> async_connect_display(
	asio_ns::any_io_executor executor, x11_endpoint target)
{
	using asio_ns::ip::tcp;
	using asio_ns::local::stream_protocol;

	try
	{
		if (target.is_local())
		{
			stream_protocol::socket socket(executor);
			co_await socket.async_connect(stream_protocol::endpoint(target.socket_path), asio_ns::use_awaitable);
			co_return std::make_shared<local_stream>(std::move(socket));
		}

		// the resolver does not like the brackets around ipv6 addresses
		std::string host = target.host;
		if (host.length() > 2 and host.front() == '[' and host.back() == ']')
			host = host.substr(1, host.length() - 2);

		tcp::resolver resolver(executor);
		auto endpoints = co_await resolver.async_resolve(host, boost::lexical_cast<std::string>(target.port), asio_ns::use_awaitable);

		tcp::socket socket(executor);
		co_await asio_ns::async_connect(socket, endpoints, asio_ns::use_awaitable);

		socket.set_option(tcp::no_delay(true));

		co_return std::make_shared<tcp_stream>(std::move(socket));
	}
	catch (const system_ns::system_error &e)
	{
		throw system_ns::system_error(error::make_error_code(error::dial_failed),
			target.to_string() + ": " + e.code().message());
	}
}

} // namespace myssh
