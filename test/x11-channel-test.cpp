//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include "test-support.hpp"

#include "myssh/error.hpp"
#include "myssh/x11_channel.hpp"

#include <gtest/gtest.h>

using namespace myssh;
using myssh::test::make_setup;

namespace
{

const blob kPseudo(kX11CookieSize, 0x42);
const blob kReal{ 0x10, 0x20, 0x30, 0x40, 0x50, 0x60, 0x70, 0x80, 0x90, 0xa0, 0xb0, 0xc0, 0xd0, 0xe0, 0xf0, 0x00 };

std::shared_ptr<const x11_context> make_context(const std::string &socket_prefix)
{
	auto context = std::make_shared<x11_context>();
	context->pseudo_cookie = kPseudo;
	context->real_cookie = kReal;
	context->target = resolve_display(parse_display(":1"), socket_prefix);
	return context;
}

} // namespace

// --------------------------------------------------------------------

TEST(X11Relay, CopiesBothWays)
{
	asio_ns::io_context io;
	auto channel = test::make_stream_pair(io);
	auto display = test::make_stream_pair(io);

	system_ns::error_code result = asio_ns::error::timed_out;

	test::run(io, [&]() -> asio_ns::awaitable<void>
		{
			auto relay = [&]() -> asio_ns::awaitable<void>
			{
				result = co_await async_relay(channel.first, display.first);
			};

			auto x11_client = [&]() -> asio_ns::awaitable<void>
			{
				co_await async_write_all(*channel.second, asio_ns::buffer(std::string("request")));
				channel.second->shutdown_write();

				auto reply = co_await test::async_read_all(*channel.second);
				EXPECT_EQ(reply, "reply");
			};

			auto x_server = [&]() -> asio_ns::awaitable<void>
			{
				auto request = co_await test::async_read_all(*display.second);
				EXPECT_EQ(request, "request");

				co_await async_write_all(*display.second, asio_ns::buffer(std::string("reply")));
				display.second->close();
			};

			detail::join_group group(co_await asio_ns::this_coro::executor);

			group.spawn(relay());
			group.spawn(x11_client());
			group.spawn(x_server());

			co_await group.async_wait();
		}());

	EXPECT_FALSE(result) << result.message();
}

TEST(X11Relay, ReportsFirstError)
{
	asio_ns::io_context io;
	auto channel = std::make_shared<test::failing_stream>(asio_ns::error::connection_reset);
	auto display = test::make_stream_pair(io);

	system_ns::error_code result;

	test::run(io, [&]() -> asio_ns::awaitable<void>
		{
			auto relay = [&]() -> asio_ns::awaitable<void>
			{
				result = co_await async_relay(channel, display.first);
			};

			// the X server sees the end of data and hangs up
			auto x_server = [&]() -> asio_ns::awaitable<void>
			{
				auto request = co_await test::async_read_all(*display.second);
				EXPECT_EQ(request, "");
				display.second->close();
			};

			detail::join_group group(co_await asio_ns::this_coro::executor);

			group.spawn(relay());
			group.spawn(x_server());

			co_await group.async_wait();
		}());

	EXPECT_EQ(result, asio_ns::error::connection_reset);
	EXPECT_TRUE(channel->is_closed());
}

// --------------------------------------------------------------------

TEST(X11Proxy, Loopback)
{
	asio_ns::io_context io;
	test::fake_x_server server(io);

	auto context = make_context(server.socket_prefix());
	auto pair = test::make_channel_pair(io);
	auto channel = pair.first;
	auto client = pair.second;

	auto setup = make_setup('l', kX11AuthProtocol, kPseudo);
	auto expected = make_setup('l', kX11AuthProtocol, kReal);

	test::run(io, [&]() -> asio_ns::awaitable<void>
		{
			auto x11_client = [&]() -> asio_ns::awaitable<void>
			{
				co_await async_write_all(*client, asio_ns::buffer(setup));
				co_await async_write_all(*client, asio_ns::buffer(std::string("ping")));

				auto reply = co_await test::async_read_all(*client);
				EXPECT_EQ(reply, "pong");
			};

			auto x_server = [&]() -> asio_ns::awaitable<void>
			{
				auto x = co_await server.async_accept();

				blob prefix(expected.size());
				co_await async_read_exactly(*x, asio_ns::buffer(prefix));
				EXPECT_EQ(prefix, expected);

				char ping[4];
				co_await async_read_exactly(*x, asio_ns::buffer(ping));
				EXPECT_EQ(std::string(ping, 4), "ping");

				co_await async_write_all(*x, asio_ns::buffer(std::string("pong")));
				x->close();
			};

			detail::join_group group(co_await asio_ns::this_coro::executor);

			group.spawn(async_proxy_x11(channel, context));
			group.spawn(x11_client());
			group.spawn(x_server());

			co_await group.async_wait();
		}());
}

TEST(X11Proxy, RejectsForgedCookie)
{
	asio_ns::io_context io;
	test::fake_x_server server(io);

	auto context = make_context(server.socket_prefix());
	auto pair = test::make_channel_pair(io);
	auto channel = pair.first;
	auto client = pair.second;

	auto setup = make_setup('B', kX11AuthProtocol, kReal);

	auto ec = test::error_of([&]
		{
			test::run(io, [&]() -> asio_ns::awaitable<void>
				{
					co_await async_write_all(*client, asio_ns::buffer(setup));
					co_await async_proxy_x11(channel, context);
				}());
		});

	EXPECT_EQ(ec, error::cookie_mismatch);

	// the client sees the connection closed without any reply
	auto reply = test::run(io, test::async_read_all(*client));
	EXPECT_EQ(reply, "");
}

TEST(X11Proxy, DialFailure)
{
	asio_ns::io_context io;
	test::temp_dir dir;

	auto context = make_context((dir.path() / "X").string());
	auto pair = test::make_channel_pair(io);
	auto channel = pair.first;
	auto client = pair.second;

	auto setup = make_setup('B', kX11AuthProtocol, kPseudo);

	auto ec = test::error_of([&]
		{
			test::run(io, [&]() -> asio_ns::awaitable<void>
				{
					co_await async_write_all(*client, asio_ns::buffer(setup));
					co_await async_proxy_x11(channel, context);
				}());
		});

	EXPECT_EQ(ec, error::dial_failed);

	auto reply = test::run(io, test::async_read_all(*client));
	EXPECT_EQ(reply, "");
}
