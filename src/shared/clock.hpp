/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

clock.hpp - Injectable monotonic clock used for activity, sweep and guess timing.*/

#pragma once

#include <chrono>
#include <functional>

namespace mmq {

using SteadyClock = std::chrono::steady_clock;
using ClockFn = std::function<SteadyClock::time_point()>;

inline SteadyClock::time_point SteadyNow() {
	return SteadyClock::now();
}

} // namespace mmq
