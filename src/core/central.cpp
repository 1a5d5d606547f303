//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "btmux/core/central.hpp"

#include "availability_engine.hpp"
#include "btmux/core/subscriber.hpp"
#include "btmux/core/types.hpp"
#include "dedup_filter.hpp"
#include "logging.hpp"
#include "notification_dispatcher.hpp"
#include "observer_registry.hpp"
#include "scanner_arbiter.hpp"
#include "sighting_history.hpp"
#include "slot_manager.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace btmux
{
namespace core
{
namespace
{

constexpr std::array<ArbitrationMode, ArbitrationModeCount> AllModes{ArbitrationMode::Any,
                                                                     ArbitrationMode::ConnectableRequired};

class CentralImpl final : public Central
{
public:
    CentralImpl(const Params& params, Clock clock)
        : params_{params}
        , clock_{std::move(clock)}
        , arbiter_{params.hysteresis_margin}
        , dedup_{params.dedup_strength_delta, params.dedup_time_floor}
        , dispatcher_{params.notification_queue_capacity}
        , logger_{common::getLogger("core")}
    {
        CETL_DEBUG_ASSERT(clock_, "");

        const auto shard_count = std::max<std::size_t>(params.shard_count, 1);
        shards_.reserve(shard_count);
        for (std::size_t i = 0; i < shard_count; ++i)
        {
            shards_.push_back(std::make_unique<Shard>());
        }
        logger_->debug("Central is created (shards={}, margin={}dB).", shard_count, params.hysteresis_margin);
    }

    // MARK: Central

    void handle(const Event::Var& event) override
    {
        cetl::visit(  //
            cetl::make_overloaded(
                [this](const Sighting& sighting) {
                    //
                    (void) ingest(sighting);
                },
                [this](const Event::ObserverOnline& online) {
                    //
                    registerObserver(online.id, online.capabilities);
                },
                [this](const Event::ObserverOffline& offline) {
                    //
                    deregisterObserver(offline.id);
                }),
            event);
    }

    void registerObserver(const ObserverId& id, const ObserverCapabilities& capabilities) override
    {
        const std::unique_lock<std::shared_mutex> lock{registry_mutex_};

        const auto now      = clock_();
        const auto outcome  = registry_.registerObserver(id, capabilities, now);
        const auto capacity = capacityFor(id, capabilities);
        postRevoked(slots_.setCapacity(id, capacity));

        if (outcome == ObserverRegistry::RegisterOutcome::Updated)
        {
            logger_->info("Observer '{}' is re-registered (capacity={}).", id, capacity);
            rearbitrateSeenBy(id, now);
            dispatcher_.post(Notification::ObserverChanged{id, ObserverEvent::Updated});
            return;
        }

        logger_->info("Observer '{}' is registered (kind={}, connectable={}, capacity={}).",
                      id,
                      (capabilities.kind == ObserverKind::LocalAdapter) ? "local" : "relay",
                      capabilities.connectable,
                      capacity);
        dispatcher_.post(Notification::ObserverChanged{id, ObserverEvent::Added});
    }

    void deregisterObserver(const ObserverId& id) override
    {
        // Exclusive registry ownership makes the whole cascade atomic for ingestion and slot paths.
        const std::unique_lock<std::shared_mutex> lock{registry_mutex_};

        if (!registry_.deregister(id))
        {
            logger_->trace("Ignoring deregistration of unknown observer '{}'.", id);
            return;
        }

        const auto  now              = clock_();
        std::size_t affected_devices = 0;
        for (auto& shard : shards_)
        {
            const std::lock_guard<std::mutex> shard_lock{shard->mutex};

            const auto devices = shard->history.removeObserver(id);
            affected_devices += devices.size();
            for (const auto& device : devices)
            {
                settleDevice(*shard, device, now);
            }
        }

        postRevoked(slots_.removeLedger(id));
        dispatcher_.post(Notification::ObserverChanged{id, ObserverEvent::Removed});
        logger_->info("Observer '{}' is deregistered (devices={}).", id, affected_devices);
    }

    bool updateCapability(const ObserverId& id, const CapabilityUpdate& update) override
    {
        const std::unique_lock<std::shared_mutex> lock{registry_mutex_};

        if (!registry_.updateCapability(id, update))
        {
            return false;
        }

        const auto* const caps = registry_.capabilitiesOf(id);
        CETL_DEBUG_ASSERT(caps != nullptr, "");
        postRevoked(slots_.setCapacity(id, capacityFor(id, *caps)));
        rearbitrateSeenBy(id, clock_());
        dispatcher_.post(Notification::ObserverChanged{id, ObserverEvent::Updated});
        return true;
    }

    std::vector<ObserverInfo> listOnline() const override
    {
        const std::shared_lock<std::shared_mutex> lock{registry_mutex_};

        auto observers = registry_.listOnline();
        for (auto& info : observers)
        {
            withSlotUsage(info);
        }
        return observers;
    }

    IngestOutcome ingest(const Sighting& sighting) override
    {
        const std::shared_lock<std::shared_mutex> lock{registry_mutex_};

        const auto* const caps = registry_.capabilitiesOf(sighting.observer);
        if (caps == nullptr)
        {
            logger_->trace("Dropping sighting of '{}' from unknown observer '{}'.", sighting.device, sighting.observer);
            return IngestOutcome::UnknownObserver;
        }

        const auto now = clock_();
        const auto ttl = recordTtl(sighting, *caps);
        if (registry_.markDetection(sighting.observer, now))
        {
            logger_->info("Observer '{}' resumed scanning.", sighting.observer);
            dispatcher_.post(Notification::ObserverChanged{sighting.observer, ObserverEvent::Resumed});
        }

        if (now > (sighting.timestamp + ttl))
        {
            logger_->trace("Dropping stale sighting of '{}' from '{}' (age={}ms).",
                           sighting.device,
                           sighting.observer,
                           std::chrono::duration_cast<std::chrono::milliseconds>(now - sighting.timestamp).count());
            return IngestOutcome::Stale;
        }

        auto&                             shard = shardOf(sighting.device);
        const std::lock_guard<std::mutex> shard_lock{shard.mutex};

        if (shard.history.ingest(sighting, ttl) == SightingHistory::IngestResult::OutOfOrder)
        {
            logger_->trace("Dropping out of order sighting of '{}' from '{}'.", sighting.device, sighting.observer);
            return IngestOutcome::OutOfOrder;
        }

        if (shard.states.find(sighting.device) == shard.states.end())
        {
            logger_->debug("Tracking device '{}' (first seen by '{}').", sighting.device, sighting.observer);
            shard.states.emplace(sighting.device, DeviceState{});
        }
        shard.availability.onSighting(sighting.device, sighting.timestamp, ttl);
        rearbitrate(shard, sighting.device, now, &sighting.observer);
        return IngestOutcome::Accepted;
    }

    std::size_t pruneStale() override
    {
        const std::shared_lock<std::shared_mutex> lock{registry_mutex_};

        const auto  now     = clock_();
        std::size_t removed = 0;
        for (auto& shard : shards_)
        {
            const std::lock_guard<std::mutex> shard_lock{shard->mutex};

            const auto result = shard->history.pruneStale(now);
            removed += result.removed_records;
            for (const auto& device : result.touched)
            {
                rearbitrate(*shard, device, now, nullptr);
            }
            for (const auto& device : result.emptied)
            {
                fireUnavailable(*shard, device);
            }
        }
        if (removed > 0)
        {
            logger_->debug("Pruned {} stale record(s).", removed);
        }
        return removed;
    }

    std::size_t expireTimers() override
    {
        const std::shared_lock<std::shared_mutex> lock{registry_mutex_};

        const auto  now   = clock_();
        std::size_t fired = 0;
        for (auto& shard : shards_)
        {
            const std::lock_guard<std::mutex> shard_lock{shard->mutex};

            for (const auto& device : shard->availability.expire(now))
            {
                const auto latest = shard->history.latestExpiry(device);
                if (latest && !(*latest < now))
                {
                    // Some record is still valid; keep the device alive until it goes stale as well.
                    shard->availability.arm(device, *latest);
                    rearbitrate(*shard, device, now, nullptr);
                    continue;
                }
                fireUnavailable(*shard, device);
                ++fired;
            }
        }
        return fired;
    }

    cetl::optional<TimePoint> nextDeadline() override
    {
        cetl::optional<TimePoint> earliest;
        for (auto& shard : shards_)
        {
            const std::lock_guard<std::mutex> shard_lock{shard->mutex};

            const auto deadline = shard->availability.nextDeadline();
            if (deadline && (!earliest || (*deadline < *earliest)))
            {
                earliest = deadline;
            }
        }
        return earliest;
    }

    std::vector<ObserverId> checkWatchdog() override
    {
        const std::shared_lock<std::shared_mutex> lock{registry_mutex_};

        auto went_quiet = registry_.checkWatchdog(clock_(), params_.watchdog_timeout);
        for (const auto& id : went_quiet)
        {
            logger_->warn("Observer '{}' has gone quiet (no sightings for more than {}s).",
                          id,
                          std::chrono::duration_cast<std::chrono::seconds>(params_.watchdog_timeout).count());
            dispatcher_.post(Notification::ObserverChanged{id, ObserverEvent::Quiet});
        }
        return went_quiet;
    }

    void updateParams(const Params& params) override
    {
        const std::unique_lock<std::shared_mutex> lock{registry_mutex_};

        const auto shard_count = params_.shard_count;
        params_                = params;
        params_.shard_count    = shard_count;  // Sharding is fixed at construction.

        arbiter_ = ScannerArbiter{params_.hysteresis_margin};
        dedup_   = DedupFilter{params_.dedup_strength_delta, params_.dedup_time_floor};
        dispatcher_.setQueueCapacity(params_.notification_queue_capacity);

        // Capacity overrides may have changed.
        for (const auto& info : registry_.listOnline())
        {
            postRevoked(slots_.setCapacity(info.id, capacityFor(info.id, info.capabilities)));
        }
        logger_->debug("Parameters are updated (margin={}dB, delta={}dB).",
                       params_.hysteresis_margin,
                       params_.dedup_strength_delta);
    }

    // MARK: Queries

    cetl::optional<DeviceRecord> bestRecord(const DeviceId& device, const ArbitrationMode mode) const override
    {
        const std::shared_lock<std::shared_mutex> lock{registry_mutex_};

        const auto                        now   = clock_();
        auto&                             shard = shardOf(device);
        const std::lock_guard<std::mutex> shard_lock{shard.mutex};

        const auto state_it = shard.states.find(device);
        if (state_it == shard.states.end())
        {
            return cetl::nullopt;
        }

        // The stored state is authoritative while its record is live; otherwise answer with
        // what re-arbitration is going to settle on.
        const auto  records = shard.history.recordsFor(device, now);
        const auto& current = state_it->second.modes[modeIndex(mode)].arbitration;
        const auto  next    = arbiter_.choose(current, makeCandidates(records), mode, now);
        if (!next)
        {
            return cetl::nullopt;
        }
        return findRecord(records, next->active);
    }

    std::vector<DeviceRecord> recordsFor(const DeviceId& device) const override
    {
        const std::shared_lock<std::shared_mutex> lock{registry_mutex_};

        const auto                        now   = clock_();
        auto&                             shard = shardOf(device);
        const std::lock_guard<std::mutex> shard_lock{shard.mutex};
        return shard.history.recordsFor(device, now);
    }

    bool isAvailable(const DeviceId& device) const override
    {
        auto&                             shard = shardOf(device);
        const std::lock_guard<std::mutex> shard_lock{shard.mutex};
        return shard.availability.isArmed(device);
    }

    Diagnostics diagnostics() const override
    {
        const std::shared_lock<std::shared_mutex> lock{registry_mutex_};

        Diagnostics diag;
        for (const auto& info : registry_.listOnline())
        {
            Diagnostics::Observer observer;
            observer.info = info;
            withSlotUsage(observer.info);
            observer.allocations = slots_.allocationsOf(info.id).value_or(SlotAllocations{info.id, 0, 0, {}});
            diag.observers.push_back(std::move(observer));
        }
        for (const auto& shard : shards_)
        {
            const std::lock_guard<std::mutex> shard_lock{shard->mutex};

            diag.tracked_devices += shard->history.deviceCount();
            diag.armed_timers += shard->availability.armedCount();
            for (auto& observer : diag.observers)
            {
                observer.device_count += shard->history.devicesSeenBy(observer.info.id).size();
            }
        }
        diag.pending_notifications = dispatcher_.pending();
        diag.dropped_notifications = dispatcher_.dropped();
        return diag;
    }

    // MARK: Connection slots

    SlotResult::Var requestSlot(const SlotRequest& request) override
    {
        // Shared registry ownership keeps candidate observers registered until the grant is decided.
        const std::shared_lock<std::shared_mutex> lock{registry_mutex_};

        const auto candidates = rankSlotCandidates(request);

        auto result = slots_.request(request.device, candidates, request.requester, request.on_forced_release);
        if (const auto* const grant = cetl::get_if<SlotResult::Success>(&result))
        {
            logger_->debug("Granted slot on '{}' for '{}' (requester='{}', serial={}).",
                           grant->observer,
                           request.device,
                           request.requester,
                           grant->token.serial);
        }
        else
        {
            const auto failure = cetl::get<SlotResult::Failure>(result);
            logger_->debug("No slot for '{}' (requester='{}', candidates={}, reason={}).",
                           request.device,
                           request.requester,
                           candidates.size(),
                           (failure == SlotFailure::CapacityExhausted) ? "capacity exhausted"
                                                                       : "no connectable candidate");
        }
        return result;
    }

    bool releaseSlot(const SlotToken& token) override
    {
        if (!slots_.release(token))
        {
            logger_->trace("Ignoring release of unknown slot token (obs='{}', serial={}).",
                           token.observer,
                           token.serial);
            return false;
        }
        return true;
    }

    std::vector<SlotAllocations> slotAllocations() const override
    {
        return slots_.allocations();
    }

    // MARK: Subscribers

    SubscriptionId subscribe(Subscriber::Ptr subscriber, const SubscriptionFilter& filter) override
    {
        return dispatcher_.subscribe(std::move(subscriber), filter);
    }

    bool unsubscribe(const SubscriptionId id) override
    {
        return dispatcher_.unsubscribe(id);
    }

    std::size_t dispatchPending() override
    {
        return dispatcher_.dispatch();
    }

private:
    struct DeviceState final
    {
        struct PerMode final
        {
            cetl::optional<ArbitrationState>      arbitration;
            cetl::optional<DedupFilter::Notified> notified;
        };
        std::array<PerMode, ArbitrationModeCount> modes;
    };

    struct Shard final
    {
        std::mutex                                mutex;
        SightingHistory                           history;
        AvailabilityEngine                        availability;
        std::unordered_map<DeviceId, DeviceState> states;
    };

    Shard& shardOf(const DeviceId& device) const
    {
        return *shards_[std::hash<DeviceId>{}(device) % shards_.size()];
    }

    std::size_t capacityFor(const ObserverId& id, const ObserverCapabilities& capabilities) const
    {
        if (!capabilities.connectable)
        {
            return 0;
        }
        const auto it = params_.capacity_overrides.find(id);
        return (it != params_.capacity_overrides.end()) ? it->second : capabilities.max_connections;
    }

    Duration recordTtl(const Sighting& sighting, const ObserverCapabilities& capabilities) const
    {
        if (sighting.ttl_hint)
        {
            return *sighting.ttl_hint;
        }
        return capabilities.expiry.value_or(params_.default_availability_timeout);
    }

    std::vector<ScannerArbiter::Candidate> makeCandidates(const std::vector<DeviceRecord>& records) const
    {
        std::vector<ScannerArbiter::Candidate> candidates;
        candidates.reserve(records.size());
        for (const auto& record : records)
        {
            const auto* const caps = registry_.capabilitiesOf(record.observer);
            CETL_DEBUG_ASSERT(caps != nullptr, "Records of deregistered observers must be gone.");
            if (caps != nullptr)
            {
                candidates.push_back({record, ObserverRegistry::priorityWeight(*caps), caps->connectable});
            }
        }
        return candidates;
    }

    /// An observer holding connection slots is busy connecting and not scanning.
    ///
    void withSlotUsage(ObserverInfo& info) const
    {
        info.connecting = slots_.usedOf(info.id);
        info.scanning   = info.scanning && (info.connecting == 0);
    }

    static cetl::optional<DeviceRecord> findRecord(const std::vector<DeviceRecord>& records,
                                                   const ObserverId&                observer)
    {
        const auto it = std::find_if(records.begin(), records.end(), [&observer](const auto& record) {
            //
            return record.observer == observer;
        });
        if (it == records.end())
        {
            return cetl::nullopt;
        }
        return *it;
    }

    /// Recomputes the active record of every mode and forwards it if the dedup filter lets it through.
    ///
    /// `sighted_by` is the observer whose sighting has just been ingested, if any.
    ///
    void rearbitrate(Shard& shard, const DeviceId& device, const TimePoint now, const ObserverId* const sighted_by)
    {
        const auto state_it = shard.states.find(device);
        if (state_it == shard.states.end())
        {
            return;
        }
        auto& state = state_it->second;

        const auto records    = shard.history.recordsFor(device, now);
        const auto candidates = makeCandidates(records);
        for (const auto mode : AllModes)
        {
            auto&      per_mode = state.modes[modeIndex(mode)];
            const auto next     = arbiter_.choose(per_mode.arbitration, candidates, mode, now);
            if (!next)
            {
                per_mode.arbitration.reset();
                per_mode.notified.reset();
                continue;
            }

            if (!per_mode.arbitration || (per_mode.arbitration->active != next->active))
            {
                logger_->debug("Device '{}' is now reported by '{}' (mode={}, strength={}dBm).",
                               device,
                               next->active,
                               (mode == ArbitrationMode::Any) ? "any" : "connectable",
                               next->strength_at_choice);
            }
            per_mode.arbitration = next;

            const auto chosen = findRecord(records, next->active);
            CETL_DEBUG_ASSERT(chosen, "Active observer must have a live record.");
            const auto trigger = ((sighted_by != nullptr) && (next->active == *sighted_by))
                                     ? DedupFilter::Trigger::Sighting
                                     : DedupFilter::Trigger::Reevaluation;
            if (chosen && dedup_.shouldNotify(*chosen, per_mode.notified, now, trigger))
            {
                per_mode.notified = DedupFilter::makeNotified(*chosen, now);
                dispatcher_.post(Notification::SightingUpdated{device, mode, *chosen});
            }
        }
    }

    /// Brings the timer and arbitration of a device in line with its remaining records.
    ///
    void settleDevice(Shard& shard, const DeviceId& device, const TimePoint now)
    {
        const auto latest = shard.history.latestExpiry(device);
        if (!latest || (*latest < now))
        {
            fireUnavailable(shard, device);
            return;
        }
        shard.availability.arm(device, *latest);
        rearbitrate(shard, device, now, nullptr);
    }

    void fireUnavailable(Shard& shard, const DeviceId& device)
    {
        shard.availability.disarm(device);
        shard.history.dropDevice(device);
        if (shard.states.erase(device) > 0)
        {
            logger_->debug("Device '{}' is unavailable.", device);
            dispatcher_.post(Notification::Unavailable{device});
        }
    }

    void rearbitrateSeenBy(const ObserverId& id, const TimePoint now)
    {
        for (auto& shard : shards_)
        {
            const std::lock_guard<std::mutex> shard_lock{shard->mutex};
            for (const auto& device : shard->history.devicesSeenBy(id))
            {
                rearbitrate(*shard, device, now, nullptr);
            }
        }
    }

    /// Candidate observers for a connection, in the order they should be tried:
    /// the preferred one, the current connectable-mode winner, then the rest by rank.
    ///
    std::vector<ObserverId> rankSlotCandidates(const SlotRequest& request) const
    {
        const auto                        now   = clock_();
        auto&                             shard = shardOf(request.device);
        const std::lock_guard<std::mutex> shard_lock{shard.mutex};

        std::vector<ObserverId> ranked;
        for (const auto& candidate : arbiter_.rank(makeCandidates(shard.history.recordsFor(request.device, now)),
                                                   request.mode))
        {
            if (candidate.observer_connectable)
            {
                ranked.push_back(candidate.record.observer);
            }
        }

        const auto moveToFront = [&ranked](const ObserverId& id) {
            //
            const auto it = std::find(ranked.begin(), ranked.end(), id);
            if (it != ranked.end())
            {
                std::rotate(ranked.begin(), it, std::next(it));
            }
        };

        const auto state_it = shard.states.find(request.device);
        if (state_it != shard.states.end())
        {
            const auto& hint = state_it->second.modes[modeIndex(ArbitrationMode::ConnectableRequired)].arbitration;
            if (hint)
            {
                moveToFront(hint->active);
            }
        }
        if (request.preferred)
        {
            moveToFront(*request.preferred);
        }
        return ranked;
    }

    void postRevoked(std::vector<SlotManager::Allocation>&& revoked)
    {
        for (auto& allocation : revoked)
        {
            logger_->warn("Slot on '{}' for '{}' is force released (requester='{}').",
                          allocation.token.observer,
                          allocation.device,
                          allocation.requester);
            dispatcher_.post(Notification::SlotRevoked{std::move(allocation.token),
                                                       std::move(allocation.device),
                                                       std::move(allocation.on_forced_release)});
        }
    }

    mutable std::shared_mutex           registry_mutex_;
    Params                              params_;
    Clock                               clock_;
    ScannerArbiter                      arbiter_;
    DedupFilter                         dedup_;
    ObserverRegistry                    registry_;
    SlotManager                         slots_;
    NotificationDispatcher              dispatcher_;
    std::vector<std::unique_ptr<Shard>> shards_;
    common::LoggerPtr                   logger_;

};  // CentralImpl

}  // namespace

Central::Ptr Central::make(const Params& params, Clock clock)
{
    return std::make_unique<CentralImpl>(params, std::move(clock));
}

}  // namespace core
}  // namespace btmux
