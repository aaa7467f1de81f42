//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file test-support.hpp
/// Socket pairs, a fake X server and a scripted SSH session for the tests

#include "myssh/detail/join_group.hpp"
#include "myssh/session.hpp"
#include "myssh/stream.hpp"
#include "myssh/x11_auth.hpp"

#include <boost/filesystem.hpp>

#include <chrono>
#include <deque>
#include <future>
#include <stdexcept>
#include <string>
#include <utility>

namespace myssh::test
{

/// \brief Run \a coro on \a io until it is done and return its result
template <typename T>
T run(asio_ns::io_context &io, asio_ns::awaitable<T> coro)
{
	auto result = asio_ns::co_spawn(io, std::move(coro), asio_ns::use_future);

	while (result.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
	{
		if (io.run_one() == 0)
			throw std::runtime_error("io_context ran out of work");
	}

	return result.get();
}

/// \brief Call \a f and return the code of the system_error it throws
template <typename F>
system_ns::error_code error_of(F &&f)
{
	try
	{
		f();
	}
	catch (const system_ns::system_error &e)
	{
		return e.code();
	}

	return {};
}

inline blob to_blob(const std::string &s)
{
	return blob(s.begin(), s.end());
}

// --------------------------------------------------------------------

using local_socket = asio_ns::local::stream_protocol::socket;

inline std::pair<std::shared_ptr<local_stream>, std::shared_ptr<local_stream>> make_stream_pair(asio_ns::io_context &io)
{
	local_socket a(io), b(io);
	asio_ns::local::connect_pair(a, b);

	return { std::make_shared<local_stream>(std::move(a)), std::make_shared<local_stream>(std::move(b)) };
}

/// \brief Read from \a stream until the end of data
inline asio_ns::awaitable<std::string> async_read_all(byte_stream &stream)
{
	std::string result;
	char data[1024];

	try
	{
		for (;;)
		{
			auto n = co_await stream.async_read_some(asio_ns::buffer(data));
			result.append(data, n);
		}
	}
	catch (const system_ns::system_error &e)
	{
		if (e.code() != asio_ns::error::eof)
			throw;
	}

	co_return result;
}

/// \brief Build a connection setup as an X11 client would send it
inline blob make_setup(uint8_t byte_order, const std::string &name, const blob &data)
{
	auto card16 = [byte_order](blob &b, uint16_t v)
	{
		if (byte_order == 'B')
			b.insert(b.end(), { static_cast<uint8_t>(v >> 8), static_cast<uint8_t>(v) });
		else
			b.insert(b.end(), { static_cast<uint8_t>(v), static_cast<uint8_t>(v >> 8) });
	};

	blob result{ byte_order, 0 };
	card16(result, 11);
	card16(result, 0);
	card16(result, static_cast<uint16_t>(name.length()));
	card16(result, static_cast<uint16_t>(data.size()));
	result.insert(result.end(), 2, 0);

	result.insert(result.end(), name.begin(), name.end());
	result.insert(result.end(), pad(name.length()), 0);
	result.insert(result.end(), data.begin(), data.end());
	result.insert(result.end(), pad(data.size()), 0);

	return result;
}

// --------------------------------------------------------------------
/// \brief A forwarded channel on top of one end of a socket pair

class test_channel : public forwarded_channel
{
  public:
	explicit test_channel(local_socket &&socket)
		: m_stream(std::move(socket))
	{
	}

	asio_ns::awaitable<std::size_t> async_read_some(asio_ns::mutable_buffer buffer) override
	{
		return m_stream.async_read_some(buffer);
	}

	asio_ns::awaitable<std::size_t> async_write_some(asio_ns::const_buffer buffer) override
	{
		return m_stream.async_write_some(buffer);
	}

	void shutdown_write() override { m_stream.shutdown_write(); }
	void close() override { m_stream.close(); }

	void discard_requests() override { m_discarding = true; }
	std::string originator() const override { return "127.0.0.1:40000"; }

	bool is_discarding_requests() const { return m_discarding; }

  private:
	local_stream m_stream;
	bool m_discarding = false;
};

/// \brief Returns a channel and the stream of the X11 client at the other end
inline std::pair<std::shared_ptr<test_channel>, std::shared_ptr<local_stream>> make_channel_pair(asio_ns::io_context &io)
{
	local_socket a(io), b(io);
	asio_ns::local::connect_pair(a, b);

	return { std::make_shared<test_channel>(std::move(a)), std::make_shared<local_stream>(std::move(b)) };
}

// --------------------------------------------------------------------
/// \brief A stream whose every operation fails with \a m_error

class failing_stream : public byte_stream
{
  public:
	explicit failing_stream(system_ns::error_code ec)
		: m_error(ec)
	{
	}

	asio_ns::awaitable<std::size_t> async_read_some(asio_ns::mutable_buffer) override
	{
		throw system_ns::system_error(m_error);
		co_return 0;
	}

	asio_ns::awaitable<std::size_t> async_write_some(asio_ns::const_buffer) override
	{
		throw system_ns::system_error(m_error);
		co_return 0;
	}

	void shutdown_write() override {}
	void close() override { m_closed = true; }

	bool is_closed() const { return m_closed; }

  private:
	system_ns::error_code m_error;
	bool m_closed = false;
};

// --------------------------------------------------------------------
/// \brief A temporary directory, removed with all its contents when done

class temp_dir
{
  public:
	temp_dir()
		: m_path(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("myssh-%%%%-%%%%"))
	{
		boost::filesystem::create_directory(m_path);
	}

	~temp_dir()
	{
		boost::system::error_code ec;
		boost::filesystem::remove_all(m_path, ec);
	}

	temp_dir(const temp_dir &) = delete;
	temp_dir &operator=(const temp_dir &) = delete;

	const boost::filesystem::path &path() const { return m_path; }

  private:
	boost::filesystem::path m_path;
};

// --------------------------------------------------------------------
/// \brief Listens on the unix socket of display :1 in a temporary directory

class fake_x_server
{
  public:
	explicit fake_x_server(asio_ns::io_context &io)
		: m_acceptor(io, asio_ns::local::stream_protocol::endpoint(socket_prefix() + "1"))
	{
	}

	/// \brief Use this as socket_prefix to reach the server as display :1
	std::string socket_prefix() const { return (m_dir.path() / "X").string(); }

	asio_ns::awaitable<std::shared_ptr<local_stream>> async_accept()
	{
		auto socket = co_await m_acceptor.async_accept(asio_ns::use_awaitable);
		co_return std::make_shared<local_stream>(std::move(socket));
	}

  private:
	temp_dir m_dir;
	asio_ns::local::stream_protocol::acceptor m_acceptor;
};

// --------------------------------------------------------------------
/// \brief An SSH session handing out a fixed list of x11 channels

class test_session : public ssh_session
{
  public:
	explicit test_session(asio_ns::io_context &io, bool accept_requests = true)
		: m_executor(io.get_executor())
		, m_accept_requests(accept_requests)
	{
	}

	asio_ns::any_io_executor get_executor() override { return m_executor; }

	asio_ns::awaitable<bool> async_channel_request(std::string request, bool want_reply, blob payload) override
	{
		m_request = std::move(request);
		m_want_reply = want_reply;
		m_payload = std::move(payload);
		co_return m_accept_requests;
	}

	asio_ns::awaitable<std::shared_ptr<forwarded_channel>> async_accept_x11() override
	{
		std::shared_ptr<forwarded_channel> result;

		if (not m_channels.empty())
		{
			result = m_channels.front();
			m_channels.pop_front();
		}
		else if (m_failure)
			throw system_ns::system_error(m_failure);

		co_return result;
	}

	void add_channel(std::shared_ptr<forwarded_channel> channel)
	{
		m_channels.push_back(std::move(channel));
	}

	/// \brief Fail with \a ec instead of reporting the end of the session
	void fail_after_channels(system_ns::error_code ec)
	{
		m_failure = ec;
	}

	std::string m_request;
	bool m_want_reply = false;
	blob m_payload;

  private:
	asio_ns::any_io_executor m_executor;
	bool m_accept_requests;
	std::deque<std::shared_ptr<forwarded_channel>> m_channels;
	system_ns::error_code m_failure;
};

} // namespace myssh::test
