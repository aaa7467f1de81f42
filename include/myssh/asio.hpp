//          Copyright Maarten L. Hekkelman 2023
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file asio.hpp
/// The Boost.Asio parts used throughout myssh, and short names for
/// the asio and system namespaces.

#include <utility> // std::exchange, used but not included by boost/asio/awaitable.hpp in Boost 1.74

#include <boost/asio.hpp>

#if not defined(__cpp_impl_coroutine) or not defined(BOOST_ASIO_HAS_CO_AWAIT)
#error "myssh needs C++20 coroutines with co_await support in Boost.Asio"
#endif

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/local/connect_pair.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

namespace asio_ns = ::boost::asio;
namespace system_ns = ::boost::system;
