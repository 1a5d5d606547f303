//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "availability_engine.hpp"

#include "btmux/core/types.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <functional>
#include <queue>
#include <utility>
#include <vector>

namespace btmux
{
namespace core
{

void AvailabilityEngine::onSighting(const DeviceId& device, const TimePoint timestamp, const Duration observer_timeout)
{
    const auto candidate = timestamp + observer_timeout;

    const auto it = timers_.find(device);
    if ((it != timers_.end()) && (it->second.deadline >= candidate))
    {
        return;
    }
    schedule(device, candidate);
}

void AvailabilityEngine::arm(const DeviceId& device, const TimePoint deadline)
{
    const auto it = timers_.find(device);
    if ((it != timers_.end()) && (it->second.deadline == deadline))
    {
        return;
    }
    schedule(device, deadline);
}

void AvailabilityEngine::disarm(const DeviceId& device)
{
    // Scheduled heap entries of the device become obsolete and are skipped later.
    timers_.erase(device);
    compactIfNeeded();
}

std::vector<DeviceId> AvailabilityEngine::expire(const TimePoint now)
{
    std::vector<DeviceId> fired;
    while (!heap_.empty() && (heap_.top().deadline < now))
    {
        const auto& top = heap_.top();
        if (isCurrent(top))
        {
            timers_.erase(top.device);
            fired.push_back(top.device);
        }
        heap_.pop();
    }
    return fired;
}

cetl::optional<TimePoint> AvailabilityEngine::deadlineOf(const DeviceId& device) const
{
    const auto it = timers_.find(device);
    if (it == timers_.end())
    {
        return cetl::nullopt;
    }
    return it->second.deadline;
}

cetl::optional<TimePoint> AvailabilityEngine::nextDeadline()
{
    dropObsoleteTop();
    if (heap_.empty())
    {
        return cetl::nullopt;
    }
    return heap_.top().deadline;
}

void AvailabilityEngine::schedule(const DeviceId& device, const TimePoint deadline)
{
    const auto generation = next_generation_++;
    timers_[device]       = Timer{deadline, generation};
    heap_.push(Scheduled{deadline, generation, device});
    compactIfNeeded();
}

bool AvailabilityEngine::isCurrent(const Scheduled& scheduled) const
{
    const auto it = timers_.find(scheduled.device);
    return (it != timers_.end()) && (it->second.generation == scheduled.generation);
}

void AvailabilityEngine::dropObsoleteTop()
{
    while (!heap_.empty() && !isCurrent(heap_.top()))
    {
        heap_.pop();
    }
}

void AvailabilityEngine::compactIfNeeded()
{
    constexpr std::size_t slack = 64;  // NOLINT(*-magic-numbers)
    if (heap_.size() <= (2 * timers_.size()) + slack)
    {
        return;
    }

    std::vector<Scheduled> current;
    current.reserve(timers_.size());
    for (const auto& device_and_timer : timers_)
    {
        current.push_back(Scheduled{device_and_timer.second.deadline,
                                    device_and_timer.second.generation,
                                    device_and_timer.first});
    }
    heap_ = decltype(heap_){std::greater<>{}, std::move(current)};
}

}  // namespace core
}  // namespace btmux
