//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "dedup_filter.hpp"

#include "btmux/core/types.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdlib>

namespace btmux
{
namespace core
{

bool DedupFilter::shouldNotify(const DeviceRecord&             chosen,
                               const cetl::optional<Notified>& last_notified,
                               const TimePoint                 now,
                               const Trigger                   trigger) const noexcept
{
    if (!last_notified)
    {
        return true;
    }
    if (chosen.observer != last_notified->observer)
    {
        return true;
    }
    if (chosen.fingerprint != last_notified->fingerprint)
    {
        return true;
    }
    if (std::abs(static_cast<int>(chosen.strength) - last_notified->strength) > strength_delta_)
    {
        return true;
    }
    return (trigger == Trigger::Sighting) && ((now - last_notified->notified_at) >= time_floor_);
}

DedupFilter::Notified DedupFilter::makeNotified(const DeviceRecord& chosen, const TimePoint now)
{
    return Notified{chosen.observer, chosen.strength, chosen.fingerprint, now};
}

}  // namespace core
}  // namespace btmux
