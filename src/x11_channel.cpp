//           Copyright Maarten L. Hekkelman 2013
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include "myssh/detail/join_group.hpp"
#include "myssh/x11_auth.hpp"
#include "myssh/x11_channel.hpp"

namespace myssh
{

namespace
{

	bool is_end_of_data(const system_ns::error_code &ec)
	{
		return ec == asio_ns::error::eof or ec == asio_ns::error::operation_aborted;
	}

	void record(system_ns::error_code &result, const system_ns::error_code &ec)
	{
		if (not result and not is_end_of_data(ec))
			result = ec;
	}

	asio_ns::awaitable<void> copy(byte_stream &in, byte_stream &out, system_ns::error_code &result)
	{
		uint8_t data[8192];

		try
		{
			for (;;)
			{
				auto length = co_await in.async_read_some(asio_ns::buffer(data));
				co_await async_write_all(out, asio_ns::buffer(data, length));
			}
		}
		catch (const system_ns::system_error &e)
		{
			record(result, e.code());
		}
	}

	asio_ns::awaitable<void> copy_to_display(std::shared_ptr<byte_stream> channel,
		std::shared_ptr<byte_stream> display, system_ns::error_code &result)
	{
		co_await copy(*channel, *display, result);

		try
		{
			display->shutdown_write();
		}
		catch (const system_ns::system_error &e)
		{
			// the X server may have hung up already
			if (e.code() != asio_ns::error::not_connected)
				record(result, e.code());
		}
	}

	asio_ns::awaitable<void> copy_to_channel(std::shared_ptr<byte_stream> display,
		std::shared_ptr<byte_stream> channel, system_ns::error_code &result)
	{
		co_await copy(*display, *channel, result);
		channel->close();
	}

} // namespace

// --------------------------------------------------------------------

asio_ns::awaitable<system_ns::error_code> async_relay(
	std::shared_ptr<byte_stream> channel, std::shared_ptr<byte_stream> display)
{
	system_ns::error_code result;

	detail::join_group relays(co_await asio_ns::this_coro::executor);

	relays.spawn(copy_to_display(channel, display, result));
	relays.spawn(copy_to_channel(display, channel, result));

	co_await relays.async_wait();

	co_return result;
}

asio_ns::awaitable<void> async_proxy_x11(
	std::shared_ptr<forwarded_channel> channel, std::shared_ptr<const x11_context> context)
{
	std::shared_ptr<byte_stream> display;

	try
	{
		auto prefix = co_await async_exchange_x11_cookie(*channel,
			context->pseudo_cookie, context->real_cookie);

		display = co_await async_connect_display(co_await asio_ns::this_coro::executor, context->target);

		co_await async_write_all(*display, asio_ns::buffer(prefix));
	}
	catch (const system_ns::system_error &)
	{
		channel->close();
		if (display)
			display->close();
		throw;
	}

	auto ec = co_await async_relay(channel, display);

	channel->close();
	display->close();

	if (ec)
		throw system_ns::system_error(ec);
}

} // namespace myssh
