//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BTMUX_CORE_CENTRAL_HPP_INCLUDED
#define BTMUX_CORE_CENTRAL_HPP_INCLUDED

#include "subscriber.hpp"
#include "types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace btmux
{
namespace core
{

struct Diagnostics final
{
    struct Observer final
    {
        ObserverInfo    info;
        std::size_t     device_count{0};
        SlotAllocations allocations;
    };

    std::vector<Observer> observers;
    std::size_t           tracked_devices{0};
    std::size_t           armed_timers{0};
    std::size_t           pending_notifications{0};
    std::uint64_t         dropped_notifications{0};

};  // Diagnostics

/// Single consistent view of nearby devices assembled from multiple unreliable observers.
///
/// All methods are thread-safe. Work for different devices proceeds in parallel;
/// ingestion never blocks on subscribers (see `dispatchPending`).
///
class Central
{
public:
    using Ptr   = std::unique_ptr<Central>;
    using Clock = std::function<TimePoint()>;

    CETL_NODISCARD static Ptr make(const Params& params, Clock clock);

    Central(Central&&)                 = delete;
    Central(const Central&)            = delete;
    Central& operator=(Central&&)      = delete;
    Central& operator=(const Central&) = delete;

    virtual ~Central() = default;

    // MARK: Sighting source interface

    virtual void handle(const Event::Var& event) = 0;

    /// Registers a new observer, or replaces capabilities of an already registered one in place.
    ///
    virtual void registerObserver(const ObserverId& id, const ObserverCapabilities& capabilities) = 0;

    /// Removes the observer, its records and its slots. Unknown ids are ignored.
    ///
    virtual void deregisterObserver(const ObserverId& id) = 0;

    /// @return `false` if the observer is not registered.
    ///
    virtual bool updateCapability(const ObserverId& id, const CapabilityUpdate& update) = 0;

    CETL_NODISCARD virtual std::vector<ObserverInfo> listOnline() const = 0;

    virtual IngestOutcome ingest(const Sighting& sighting) = 0;

    // MARK: Maintenance

    /// Removes stale records. Devices left without records become unavailable.
    ///
    /// @return Number of removed records.
    ///
    virtual std::size_t pruneStale() = 0;

    /// Fires availability timers whose deadline has passed.
    ///
    /// @return Number of devices declared unavailable.
    ///
    virtual std::size_t expireTimers() = 0;

    CETL_NODISCARD virtual cetl::optional<TimePoint> nextDeadline() = 0;

    /// Marks observers which went silent for longer than the watchdog timeout as not scanning.
    ///
    /// @return Ids of observers which went quiet during this check.
    ///
    virtual std::vector<ObserverId> checkWatchdog() = 0;

    virtual void updateParams(const Params& params) = 0;

    // MARK: Queries

    CETL_NODISCARD virtual cetl::optional<DeviceRecord> bestRecord(const DeviceId&      device,
                                                                   const ArbitrationMode mode) const = 0;
    CETL_NODISCARD virtual std::vector<DeviceRecord>    recordsFor(const DeviceId& device) const     = 0;
    CETL_NODISCARD virtual bool                         isAvailable(const DeviceId& device) const    = 0;
    CETL_NODISCARD virtual Diagnostics                  diagnostics() const                          = 0;

    // MARK: Connection slots

    virtual SlotResult::Var                            requestSlot(const SlotRequest& request) = 0;
    virtual bool                                       releaseSlot(const SlotToken& token)     = 0;
    CETL_NODISCARD virtual std::vector<SlotAllocations> slotAllocations() const                 = 0;

    // MARK: Subscribers

    virtual SubscriptionId subscribe(Subscriber::Ptr subscriber, const SubscriptionFilter& filter) = 0;
    virtual bool           unsubscribe(const SubscriptionId id)                                    = 0;

    /// Delivers queued notifications to subscribers on the calling thread.
    ///
    /// @return Number of delivered notifications.
    ///
    virtual std::size_t dispatchPending() = 0;

protected:
    Central() = default;

};  // Central

}  // namespace core
}  // namespace btmux

#endif  // BTMUX_CORE_CENTRAL_HPP_INCLUDED
