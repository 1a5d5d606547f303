//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BTMUX_DAEMON_ENGINE_PLATFORM_STEADY_EXECUTOR_HPP_INCLUDED
#define BTMUX_DAEMON_ENGINE_PLATFORM_STEADY_EXECUTOR_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <libcyphal/platform/single_threaded_executor.hpp>
#include <libcyphal/types.hpp>

#include <chrono>

namespace btmux
{
namespace daemon
{
namespace engine
{
namespace platform
{

/// Single threaded executor driven by the monotonic system clock.
///
/// The daemon has no awaitable resources of its own (sightings are pushed from other threads),
/// so the run loop only needs to sleep until the next scheduled callback.
///
class SteadyExecutor final : public libcyphal::platform::SingleThreadedExecutor
{
public:
    SteadyExecutor() = default;

    CETL_NODISCARD libcyphal::TimePoint now() const noexcept override
    {
        const auto since_epoch = std::chrono::steady_clock::now().time_since_epoch();
        return libcyphal::TimePoint{std::chrono::duration_cast<libcyphal::Duration>(since_epoch)};
    }

};  // SteadyExecutor

}  // namespace platform
}  // namespace engine
}  // namespace daemon
}  // namespace btmux

#endif  // BTMUX_DAEMON_ENGINE_PLATFORM_STEADY_EXECUTOR_HPP_INCLUDED
