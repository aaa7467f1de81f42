//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \brief A group of coroutines that can be awaited as a whole

#include "myssh/asio.hpp"

#include <exception>
#include <utility>

namespace myssh::detail
{

// --------------------------------------------------------------------
/// \brief Keeps track of spawned coroutines
///
/// The group must be created and awaited on the executor of the owning
/// coroutine, and that executor must be a strand (or single threaded).
/// Completions of the spawned coroutines are dispatched back onto it, the
/// coroutines themselves may run on any executor. A group must be awaited
/// before it is destroyed.

class join_group
{
  public:
	explicit join_group(asio_ns::any_io_executor owner)
		: m_owner(owner)
		, m_timer(owner, asio_ns::steady_timer::time_point::max())
	{
	}

	join_group(const join_group &) = delete;
	join_group &operator=(const join_group &) = delete;

	/// \brief Start \a task on \a executor as member of this group
	template <typename Executor>
	void spawn(Executor executor, asio_ns::awaitable<void> task)
	{
		++m_pending;

		asio_ns::co_spawn(executor, std::move(task),
			asio_ns::bind_executor(m_owner, [this](std::exception_ptr e)
				{
					if (e and not m_exception)
						m_exception = e;

					if (--m_pending == 0)
						m_timer.cancel();
				}));
	}

	/// \brief Start \a task on the owner's executor
	void spawn(asio_ns::awaitable<void> task)
	{
		spawn(m_owner, std::move(task));
	}

	/// \brief The number of members still running
	std::size_t pending() const { return m_pending; }

	/// \brief Wait until all members have finished
	///
	/// Rethrows the first exception that escaped a member.
	asio_ns::awaitable<void> async_wait()
	{
		while (m_pending > 0)
		{
			system_ns::error_code ec;
			co_await m_timer.async_wait(asio_ns::redirect_error(asio_ns::use_awaitable, ec));
		}

		if (m_exception)
			std::rethrow_exception(std::exchange(m_exception, nullptr));
	}

  private:
	asio_ns::any_io_executor m_owner;
	asio_ns::steady_timer m_timer;
	std::size_t m_pending = 0;
	std::exception_ptr m_exception;
};

} // namespace myssh::detail
