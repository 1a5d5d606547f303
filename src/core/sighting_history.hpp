//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BTMUX_CORE_SIGHTING_HISTORY_HPP_INCLUDED
#define BTMUX_CORE_SIGHTING_HISTORY_HPP_INCLUDED

#include "btmux/core/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace btmux
{
namespace core
{

/// Keeps the latest record contributed by each observer for each device.
///
/// Records are stored in tables keyed by device and observer ids; the reverse index
/// (observer -> devices) lets an observer removal cascade by key lookup.
/// Not synchronized; the owner serializes access.
///
class SightingHistory final
{
public:
    enum class IngestResult : std::uint8_t
    {
        Accepted,
        OutOfOrder,
    };

    struct PruneResult final
    {
        std::size_t           removed_records{0};
        std::vector<DeviceId> touched;  ///< Devices which lost some (but not all) records.
        std::vector<DeviceId> emptied;  ///< Devices which lost all their records.
    };

    SightingHistory() = default;

    /// Upserts the (device, observer) record unless the sighting is older than the last accepted one.
    ///
    IngestResult ingest(const Sighting& sighting, Duration ttl);

    /// @return Non-stale records of the device, ordered by observer id.
    ///
    CETL_NODISCARD std::vector<DeviceRecord> recordsFor(const DeviceId& device, TimePoint now) const;

    /// @return All records of the device including stale ones.
    ///
    CETL_NODISCARD std::vector<DeviceRecord> allRecordsFor(const DeviceId& device) const;

    CETL_NODISCARD const DeviceRecord* find(const DeviceId& device, const ObserverId& observer) const;

    /// @return The latest expiry among all records of the device, if any.
    ///
    CETL_NODISCARD cetl::optional<TimePoint> latestExpiry(const DeviceId& device) const;

    CETL_NODISCARD bool hasDevice(const DeviceId& device) const;

    /// @return Devices which had a record from the observer.
    ///
    std::vector<DeviceId> removeObserver(const ObserverId& observer);

    CETL_NODISCARD std::vector<DeviceId> devicesSeenBy(const ObserverId& observer) const;

    PruneResult pruneStale(TimePoint now);

    void dropDevice(const DeviceId& device);

    CETL_NODISCARD std::size_t deviceCount() const noexcept
    {
        return devices_.size();
    }

private:
    using ObserverRecords = std::unordered_map<ObserverId, DeviceRecord>;

    void unindex(const ObserverId& observer, const DeviceId& device);

    std::unordered_map<DeviceId, ObserverRecords>                   devices_;
    std::unordered_map<ObserverId, std::unordered_set<DeviceId>>    observer_devices_;

};  // SightingHistory

}  // namespace core
}  // namespace btmux

#endif  // BTMUX_CORE_SIGHTING_HISTORY_HPP_INCLUDED
