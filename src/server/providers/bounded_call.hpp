/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

bounded_call.hpp - Runs a blocking collaborator call with a deadline.*/

#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>

namespace mmq {

/*
=============
CallWithTimeout

Runs `fn` on a detached worker and waits up to `timeout` for its result.
Returns std::nullopt when the deadline passes; the stalled call is abandoned
and finishes in the background, so `fn` must own everything it touches.
Exceptions thrown by `fn` are rethrown to the caller.
=============
*/
template <typename Fn>
std::optional<std::invoke_result_t<Fn>> CallWithTimeout(Fn fn, std::chrono::milliseconds timeout) {
	using Result = std::invoke_result_t<Fn>;

	auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
	std::future<Result> result = task->get_future();

	std::thread worker([task]() { (*task)(); });
	worker.detach();

	if (result.wait_for(timeout) != std::future_status::ready)
		return std::nullopt;

	return result.get();
}

} // namespace mmq
