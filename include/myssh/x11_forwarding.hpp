//           Copyright Maarten L. Hekkelman 2013
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file x11_forwarding.hpp
/// X11 forwarding for an interactive SSH session.
///
/// \code
/// auto forwarder = std::make_shared<myssh::x11_forwarder>(session, myssh::x11_options::from_environment());
/// co_await forwarder->async_start();
/// co_await forwarder->async_run();
/// \endcode

#include "myssh/session.hpp"
#include "myssh/x11_channel.hpp"

#include <functional>
#include <memory>
#include <string>

namespace myssh
{

/// \brief Settings for X11 forwarding
struct x11_options
{
	std::string display;                        ///< the local display, e.g. ":0"
	std::string xauth_location = "xauth";       ///< the xauth program, searched for in PATH
	std::string authority_file;                 ///< read the cookie from this file instead of running xauth
	std::string socket_prefix = kX11SocketPrefix; ///< unix sockets of local displays

	/// \brief Forwarding is only possible when there is a display
	bool enabled() const { return not display.empty(); }

	/// \brief Default options, with the display taken from DISPLAY
	static x11_options from_environment();
};

// --------------------------------------------------------------------
/// \brief Forwards the X11 connections opened by the server of \a session
///
/// Each forwarded connection is checked against a random cookie that was
/// handed to the server. Connections presenting it are passed to the local
/// X server with the real cookie, others are closed.

class x11_forwarder : public std::enable_shared_from_this<x11_forwarder>
{
  public:
	/// \brief The callback type for message handlers, may be called from several threads at once
	using message_callback_type = std::function<void(const std::string &)>;

	x11_forwarder(std::shared_ptr<ssh_session> session, x11_options options);

	x11_forwarder(const x11_forwarder &) = delete;
	x11_forwarder &operator=(const x11_forwarder &) = delete;

	/// \brief Set the handlers for informational and error messages
	///
	/// By default both are written to std::clog.
	void set_message_callbacks(message_callback_type message_handler, message_callback_type error_handler);

	/// \brief Request X11 forwarding on the session
	///
	/// Fetches the cookie for the display, creates the pseudo cookie and
	/// sends the x11-req request. Errors are thrown as system_error, with
	/// code error::forwarding_rejected when the server refuses. Call once.
	asio_ns::awaitable<void> async_start();

	/// \brief Accept forwarded connections until the session closes
	///
	/// Every connection is handled independently on its own strand. Returns
	/// after the session stopped handing out connections and all of them
	/// have finished. An error accepting a connection is rethrown once the
	/// connections already accepted have finished.
	asio_ns::awaitable<void> async_run();

	/// \brief The context shared by all connections, null before async_start
	std::shared_ptr<const x11_context> get_context() const { return m_context; }

  private:
	asio_ns::awaitable<void> accept_loop();
	asio_ns::awaitable<void> proxy(std::shared_ptr<forwarded_channel> channel);

	void message(const std::string &msg);
	void error_message(const std::string &msg);

	std::shared_ptr<ssh_session> m_session;
	x11_options m_options;
	std::shared_ptr<const x11_context> m_context;
	message_callback_type m_message_handler;
	message_callback_type m_error_handler;
};

} // namespace myssh
