//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include "myssh/stream.hpp"

namespace myssh
{

asio_ns::awaitable<void> async_read_exactly(byte_stream &stream, asio_ns::mutable_buffer buffer)
{
	while (buffer.size() > 0)
	{
		auto n = co_await stream.async_read_some(buffer);
		buffer += n;
	}
}

asio_ns::awaitable<void> async_write_all(byte_stream &stream, asio_ns::const_buffer buffer)
{
	while (buffer.size() > 0)
	{
		auto n = co_await stream.async_write_some(buffer);
		buffer += n;
	}
}

} // namespace myssh
