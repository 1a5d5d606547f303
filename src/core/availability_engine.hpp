//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BTMUX_CORE_AVAILABILITY_ENGINE_HPP_INCLUDED
#define BTMUX_CORE_AVAILABILITY_ENGINE_HPP_INCLUDED

#include "btmux/core/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <queue>
#include <unordered_map>
#include <vector>

namespace btmux
{
namespace core
{

/// One logical availability countdown per device.
///
/// Deadlines live in a min-heap; rescheduling pushes a new entry and bumps the device generation,
/// so entries left behind are skipped lazily when they surface.
/// Not synchronized; the owner serializes access.
///
class AvailabilityEngine final
{
public:
    AvailabilityEngine() = default;

    /// Extends the device deadline to cover the sighting validity window.
    ///
    /// The deadline never moves backwards here: the device stays available while any observer
    /// would still consider it so.
    ///
    void onSighting(const DeviceId& device, TimePoint timestamp, Duration observer_timeout);

    /// Sets the device deadline exactly (it may shrink), arming the timer if needed.
    ///
    void arm(const DeviceId& device, TimePoint deadline);

    void disarm(const DeviceId& device);

    /// Pops every timer whose deadline has passed. Fired timers are removed;
    /// re-arming requires a fresh call to `onSighting` or `arm`.
    ///
    /// @return Devices whose timer has fired, in deadline order.
    ///
    std::vector<DeviceId> expire(TimePoint now);

    CETL_NODISCARD cetl::optional<TimePoint> deadlineOf(const DeviceId& device) const;
    CETL_NODISCARD cetl::optional<TimePoint> nextDeadline();

    CETL_NODISCARD bool isArmed(const DeviceId& device) const
    {
        return timers_.find(device) != timers_.end();
    }

    CETL_NODISCARD std::size_t armedCount() const noexcept
    {
        return timers_.size();
    }

    CETL_NODISCARD std::size_t scheduledCount() const noexcept
    {
        return heap_.size();
    }

private:
    using Generation = std::uint64_t;

    struct Timer final
    {
        TimePoint  deadline;
        Generation generation;
    };

    struct Scheduled final
    {
        TimePoint  deadline;
        Generation generation;
        DeviceId   device;

        friend bool operator>(const Scheduled& lhs, const Scheduled& rhs) noexcept
        {
            return lhs.deadline > rhs.deadline;
        }
    };

    void schedule(const DeviceId& device, TimePoint deadline);
    bool isCurrent(const Scheduled& scheduled) const;
    void dropObsoleteTop();
    void compactIfNeeded();

    std::unordered_map<DeviceId, Timer>                                          timers_;
    std::priority_queue<Scheduled, std::vector<Scheduled>, std::greater<>>        heap_;
    Generation                                                                   next_generation_{0};

};  // AvailabilityEngine

}  // namespace core
}  // namespace btmux

#endif  // BTMUX_CORE_AVAILABILITY_ENGINE_HPP_INCLUDED
