//           Copyright Maarten L. Hekkelman 2013
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include "myssh/detail/join_group.hpp"
#include "myssh/error.hpp"
#include "myssh/x11_forwarding.hpp"
#include "myssh/xauthority.hpp"

#include <boost/algorithm/hex.hpp>

#include <cryptopp/osrng.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace myssh
{

x11_options x11_options::from_environment()
{
	x11_options result;

	if (const char *display = std::getenv("DISPLAY"); display != nullptr)
		result.display = display;

	return result;
}

// --------------------------------------------------------------------

x11_forwarder::x11_forwarder(std::shared_ptr<ssh_session> session, x11_options options)
	: m_session(std::move(session))
	, m_options(std::move(options))
	, m_message_handler([](const std::string &msg) { std::clog << "x11: " << msg << '\n'; })
	, m_error_handler([](const std::string &msg) { std::clog << "x11: " << msg << '\n'; })
{
}

void x11_forwarder::set_message_callbacks(message_callback_type message_handler, message_callback_type error_handler)
{
	m_message_handler = std::move(message_handler);
	m_error_handler = std::move(error_handler);
}

void x11_forwarder::message(const std::string &msg)
{
	if (m_message_handler)
		m_message_handler(msg);
}

void x11_forwarder::error_message(const std::string &msg)
{
	if (m_error_handler)
		m_error_handler(msg);
}

// --------------------------------------------------------------------

asio_ns::awaitable<void> x11_forwarder::async_start()
{
	auto display = parse_display(m_options.display);

	auto context = std::make_shared<x11_context>();

	if (m_options.authority_file.empty())
		context->real_cookie = fetch_xauth_cookie(m_options.xauth_location, m_options.display);
	else
		context->real_cookie = read_xauthority_cookie(m_options.authority_file, display);

	CryptoPP::AutoSeededRandomPool rng;
	context->pseudo_cookie.resize(kX11CookieSize);
	rng.GenerateBlock(context->pseudo_cookie.data(), context->pseudo_cookie.size());

	context->target = resolve_display(display, m_options.socket_prefix);

	x11_request req;
	req.single_connection = false;
	req.auth_protocol = kX11AuthProtocol;
	boost::algorithm::hex_lower(context->pseudo_cookie.begin(), context->pseudo_cookie.end(),
		std::back_inserter(req.auth_cookie));
	req.screen = 0;

	opacket out;
	out << req;

	if (not co_await m_session->async_channel_request("x11-req", true, out))
		throw system_ns::system_error(error::make_error_code(error::forwarding_rejected));

	m_context = std::move(context);

	message("forwarding display " + display.to_string() + " to " + m_context->target.to_string());
}

asio_ns::awaitable<void> x11_forwarder::async_run()
{
	if (not m_context)
		throw std::logic_error("x11 forwarding was not started");

	auto strand = asio_ns::make_strand(m_session->get_executor());
	co_await asio_ns::co_spawn(strand, accept_loop(), asio_ns::use_awaitable);
}

asio_ns::awaitable<void> x11_forwarder::accept_loop()
{
	auto self = shared_from_this();

	detail::join_group proxies(co_await asio_ns::this_coro::executor);

	// the running proxies must finish before the group goes out of scope,
	// also when the session fails
	std::exception_ptr failure;

	try
	{
		for (;;)
		{
			auto channel = co_await m_session->async_accept_x11();
			if (not channel)
				break;

			channel->discard_requests();

			proxies.spawn(asio_ns::make_strand(m_session->get_executor()), proxy(std::move(channel)));
		}
	}
	catch (const std::exception &)
	{
		failure = std::current_exception();
	}

	co_await proxies.async_wait();

	if (failure)
		std::rethrow_exception(failure);
}

asio_ns::awaitable<void> x11_forwarder::proxy(std::shared_ptr<forwarded_channel> channel)
{
	auto originator = channel->originator();

	try
	{
		message("connection from " + originator);

		co_await async_proxy_x11(std::move(channel), m_context);

		message("connection from " + originator + " closed");
	}
	catch (const std::exception &e)
	{
		error_message("connection from " + originator + ": " + e.what());
	}
}

} // namespace myssh
