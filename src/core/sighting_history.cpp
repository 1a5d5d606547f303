//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "sighting_history.hpp"

#include "btmux/core/types.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <utility>
#include <vector>

namespace btmux
{
namespace core
{
namespace
{

void sortByObserver(std::vector<DeviceRecord>& records)
{
    std::sort(records.begin(), records.end(), [](const auto& lhs, const auto& rhs) {
        //
        return lhs.observer < rhs.observer;
    });
}

}  // namespace

SightingHistory::IngestResult SightingHistory::ingest(const Sighting& sighting, const Duration ttl)
{
    auto& records = devices_[sighting.device];

    const auto it = records.find(sighting.observer);
    if ((it != records.end()) && (sighting.timestamp < it->second.timestamp))
    {
        return IngestResult::OutOfOrder;
    }

    DeviceRecord record;
    record.observer    = sighting.observer;
    record.timestamp   = sighting.timestamp;
    record.strength    = sighting.strength;
    record.connectable = sighting.connectable;
    record.fingerprint = sighting.fingerprint;
    record.payload     = sighting.payload;
    record.ttl         = ttl;

    if (it != records.end())
    {
        it->second = std::move(record);
    }
    else
    {
        records.emplace(sighting.observer, std::move(record));
        observer_devices_[sighting.observer].insert(sighting.device);
    }
    return IngestResult::Accepted;
}

std::vector<DeviceRecord> SightingHistory::recordsFor(const DeviceId& device, const TimePoint now) const
{
    std::vector<DeviceRecord> result;

    const auto it = devices_.find(device);
    if (it != devices_.end())
    {
        for (const auto& observer_and_record : it->second)
        {
            if (!observer_and_record.second.isStale(now))
            {
                result.push_back(observer_and_record.second);
            }
        }
    }
    sortByObserver(result);
    return result;
}

std::vector<DeviceRecord> SightingHistory::allRecordsFor(const DeviceId& device) const
{
    std::vector<DeviceRecord> result;

    const auto it = devices_.find(device);
    if (it != devices_.end())
    {
        for (const auto& observer_and_record : it->second)
        {
            result.push_back(observer_and_record.second);
        }
    }
    sortByObserver(result);
    return result;
}

const DeviceRecord* SightingHistory::find(const DeviceId& device, const ObserverId& observer) const
{
    const auto dev_it = devices_.find(device);
    if (dev_it == devices_.end())
    {
        return nullptr;
    }
    const auto rec_it = dev_it->second.find(observer);
    return (rec_it != dev_it->second.end()) ? &rec_it->second : nullptr;
}

cetl::optional<TimePoint> SightingHistory::latestExpiry(const DeviceId& device) const
{
    const auto it = devices_.find(device);
    if ((it == devices_.end()) || it->second.empty())
    {
        return cetl::nullopt;
    }

    cetl::optional<TimePoint> latest;
    for (const auto& observer_and_record : it->second)
    {
        const auto expires_at = observer_and_record.second.expiresAt();
        if (!latest || (expires_at > *latest))
        {
            latest = expires_at;
        }
    }
    return latest;
}

bool SightingHistory::hasDevice(const DeviceId& device) const
{
    return devices_.find(device) != devices_.end();
}

std::vector<DeviceId> SightingHistory::removeObserver(const ObserverId& observer)
{
    std::vector<DeviceId> affected;

    const auto index_it = observer_devices_.find(observer);
    if (index_it == observer_devices_.end())
    {
        return affected;
    }

    affected.assign(index_it->second.begin(), index_it->second.end());
    observer_devices_.erase(index_it);

    for (const auto& device : affected)
    {
        const auto dev_it = devices_.find(device);
        if (dev_it != devices_.end())
        {
            dev_it->second.erase(observer);
            if (dev_it->second.empty())
            {
                devices_.erase(dev_it);
            }
        }
    }
    std::sort(affected.begin(), affected.end());
    return affected;
}

std::vector<DeviceId> SightingHistory::devicesSeenBy(const ObserverId& observer) const
{
    std::vector<DeviceId> result;

    const auto index_it = observer_devices_.find(observer);
    if (index_it != observer_devices_.end())
    {
        result.assign(index_it->second.begin(), index_it->second.end());
        std::sort(result.begin(), result.end());
    }
    return result;
}

SightingHistory::PruneResult SightingHistory::pruneStale(const TimePoint now)
{
    PruneResult result;

    for (auto dev_it = devices_.begin(); dev_it != devices_.end();)
    {
        auto& records       = dev_it->second;
        bool  removed_some  = false;
        for (auto rec_it = records.begin(); rec_it != records.end();)
        {
            if (rec_it->second.isStale(now))
            {
                unindex(rec_it->first, dev_it->first);
                rec_it       = records.erase(rec_it);
                removed_some = true;
                ++result.removed_records;
            }
            else
            {
                ++rec_it;
            }
        }

        if (records.empty())
        {
            result.emptied.push_back(dev_it->first);
            dev_it = devices_.erase(dev_it);
            continue;
        }
        if (removed_some)
        {
            result.touched.push_back(dev_it->first);
        }
        ++dev_it;
    }
    return result;
}

void SightingHistory::dropDevice(const DeviceId& device)
{
    const auto dev_it = devices_.find(device);
    if (dev_it == devices_.end())
    {
        return;
    }
    for (const auto& observer_and_record : dev_it->second)
    {
        unindex(observer_and_record.first, device);
    }
    devices_.erase(dev_it);
}

void SightingHistory::unindex(const ObserverId& observer, const DeviceId& device)
{
    const auto index_it = observer_devices_.find(observer);
    if (index_it != observer_devices_.end())
    {
        index_it->second.erase(device);
        if (index_it->second.empty())
        {
            observer_devices_.erase(index_it);
        }
    }
}

}  // namespace core
}  // namespace btmux
