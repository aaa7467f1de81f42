//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file stream.hpp
/// The byte stream abstraction used for relaying data. Both forwarded
/// SSH channels and the sockets to the X server implement it.

#include "myssh/asio.hpp"

#include <memory>

namespace myssh
{

// --------------------------------------------------------------------
/// \brief A bidirectional stream of bytes
///
/// Reads and writes follow the asio conventions: failures are thrown as
/// system_error and the end of data is reported as asio_ns::error::eof.
/// At most one read and one write may be outstanding at any time.

class byte_stream
{
  public:
	virtual ~byte_stream() = default;

	/// \brief Read at least one byte into \a buffer
	virtual asio_ns::awaitable<std::size_t> async_read_some(asio_ns::mutable_buffer buffer) = 0;

	/// \brief Write at least one byte from \a buffer
	virtual asio_ns::awaitable<std::size_t> async_write_some(asio_ns::const_buffer buffer) = 0;

	/// \brief Signal the peer no more data will be written
	virtual void shutdown_write() = 0;

	/// \brief Close the stream, pending operations are aborted
	virtual void close() = 0;
};

/// \brief Fill all of \a buffer, throws asio_ns::error::eof when the stream ends first
asio_ns::awaitable<void> async_read_exactly(byte_stream &stream, asio_ns::mutable_buffer buffer);

/// \brief Write all of \a buffer
asio_ns::awaitable<void> async_write_all(byte_stream &stream, asio_ns::const_buffer buffer);

// --------------------------------------------------------------------
/// \brief byte_stream implementation for stream sockets, tcp or local

template <typename Protocol>
class socket_stream : public byte_stream
{
  public:
	using socket_type = typename Protocol::socket;

	explicit socket_stream(socket_type &&socket)
		: m_socket(std::move(socket))
	{
	}

	socket_stream(const socket_stream &) = delete;
	socket_stream &operator=(const socket_stream &) = delete;

	~socket_stream()
	{
		close();
	}

	socket_type &socket() { return m_socket; }

	asio_ns::awaitable<std::size_t> async_read_some(asio_ns::mutable_buffer buffer) override
	{
		return m_socket.async_read_some(buffer, asio_ns::use_awaitable);
	}

	asio_ns::awaitable<std::size_t> async_write_some(asio_ns::const_buffer buffer) override
	{
		return m_socket.async_write_some(buffer, asio_ns::use_awaitable);
	}

	void shutdown_write() override
	{
		m_socket.shutdown(socket_type::shutdown_send);
	}

	void close() override
	{
		if (m_socket.is_open())
		{
			// the peer may already be gone, that is fine
			system_ns::error_code ec;
			m_socket.close(ec);
		}
	}

  private:
	socket_type m_socket;
};

using tcp_stream = socket_stream<asio_ns::ip::tcp>;
using local_stream = socket_stream<asio_ns::local::stream_protocol>;

} // namespace myssh
