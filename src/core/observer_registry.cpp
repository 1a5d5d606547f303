//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "observer_registry.hpp"

#include "btmux/core/types.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <vector>

namespace btmux
{
namespace core
{

ObserverRegistry::RegisterOutcome ObserverRegistry::registerObserver(const ObserverId&           id,
                                                                     const ObserverCapabilities& capabilities,
                                                                     const TimePoint             now)
{
    const auto it = entries_.find(id);
    if (it != entries_.end())
    {
        // An adapter coming back online keeps its entry, possibly with a different capacity.
        auto& entry        = *it->second;
        entry.capabilities = capabilities;
        entry.last_detection_us.store(toTicks(now));
        entry.scanning.store(true);
        return RegisterOutcome::Updated;
    }

    entries_.emplace(id, std::make_unique<Entry>(capabilities, now));
    return RegisterOutcome::Added;
}

bool ObserverRegistry::deregister(const ObserverId& id)
{
    return entries_.erase(id) > 0;
}

bool ObserverRegistry::updateCapability(const ObserverId& id, const CapabilityUpdate& update)
{
    const auto it = entries_.find(id);
    if (it == entries_.end())
    {
        return false;
    }

    auto& caps = it->second->capabilities;
    if (update.connectable)
    {
        caps.connectable = *update.connectable;
    }
    if (update.max_connections)
    {
        caps.max_connections = *update.max_connections;
    }
    if (update.rank)
    {
        caps.rank = *update.rank;
    }
    if (update.expiry)
    {
        caps.expiry = *update.expiry;
    }
    if (update.name)
    {
        caps.name = *update.name;
    }
    return true;
}

std::vector<ObserverInfo> ObserverRegistry::listOnline() const
{
    std::vector<ObserverInfo> result;
    result.reserve(entries_.size());
    for (const auto& id_and_entry : entries_)
    {
        result.push_back(makeInfo(id_and_entry.first, *id_and_entry.second));
    }
    std::sort(result.begin(), result.end(), [](const auto& lhs, const auto& rhs) {
        //
        return lhs.id < rhs.id;
    });
    return result;
}

cetl::optional<ObserverInfo> ObserverRegistry::find(const ObserverId& id) const
{
    const auto it = entries_.find(id);
    if (it == entries_.end())
    {
        return cetl::nullopt;
    }
    return makeInfo(it->first, *it->second);
}

bool ObserverRegistry::contains(const ObserverId& id) const
{
    return entries_.find(id) != entries_.end();
}

const ObserverCapabilities* ObserverRegistry::capabilitiesOf(const ObserverId& id) const
{
    const auto it = entries_.find(id);
    return (it != entries_.end()) ? &it->second->capabilities : nullptr;
}

std::int64_t ObserverRegistry::priorityOf(const ObserverId& id) const
{
    const auto* const caps = capabilitiesOf(id);
    return (caps != nullptr) ? priorityWeight(*caps) : 0;
}

std::size_t ObserverRegistry::size() const noexcept
{
    return entries_.size();
}

bool ObserverRegistry::markDetection(const ObserverId& id, const TimePoint now)
{
    const auto it = entries_.find(id);
    if (it == entries_.end())
    {
        return false;
    }

    auto&      entry = *it->second;
    const auto ticks = toTicks(now);

    // Relayed sightings may arrive out of order, so only move the detection time forward.
    auto prev = entry.last_detection_us.load();
    while ((prev < ticks) && !entry.last_detection_us.compare_exchange_weak(prev, ticks))
    {
    }

    return !entry.scanning.exchange(true);
}

std::vector<ObserverId> ObserverRegistry::checkWatchdog(const TimePoint now, const Duration timeout)
{
    std::vector<ObserverId> went_quiet;
    for (auto& id_and_entry : entries_)
    {
        auto&           entry = *id_and_entry.second;
        const TimePoint last_detection{Duration{entry.last_detection_us.load()}};
        if ((now - last_detection) > timeout)
        {
            if (entry.scanning.exchange(false))
            {
                went_quiet.push_back(id_and_entry.first);
            }
        }
    }
    return went_quiet;
}

std::int64_t ObserverRegistry::priorityWeight(const ObserverCapabilities& capabilities) noexcept
{
    constexpr std::int64_t local_bias = std::int64_t{1} << 32;  // NOLINT(*-magic-numbers)

    const std::int64_t kind_weight = (capabilities.kind == ObserverKind::LocalAdapter) ? local_bias : 0;
    return kind_weight + capabilities.rank;
}

ObserverInfo ObserverRegistry::makeInfo(const ObserverId& id, const Entry& entry)
{
    ObserverInfo info;
    info.id             = id;
    info.capabilities   = entry.capabilities;
    info.priority       = priorityWeight(entry.capabilities);
    info.registered_at  = entry.registered_at;
    info.last_detection = TimePoint{Duration{entry.last_detection_us.load()}};
    info.scanning       = entry.scanning.load();
    return info;
}

}  // namespace core
}  // namespace btmux
