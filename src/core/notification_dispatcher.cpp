//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "notification_dispatcher.hpp"

#include "btmux/core/subscriber.hpp"
#include "btmux/core/types.hpp"
#include "common_helpers.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <algorithm>
#include <deque>
#include <mutex>
#include <utility>

namespace btmux
{
namespace core
{

NotificationDispatcher::NotificationDispatcher(const std::size_t queue_capacity)
    : queue_capacity_{std::max<std::size_t>(queue_capacity, 1)}
{
}

SubscriptionId NotificationDispatcher::subscribe(Subscriber::Ptr subscriber, const SubscriptionFilter& filter)
{
    CETL_DEBUG_ASSERT(subscriber, "");

    const std::lock_guard<std::mutex> lock{subscriptions_mutex_};

    const auto id = next_subscription_id_++;
    subscriptions_.emplace(id, Subscription{std::move(subscriber), filter});
    return id;
}

bool NotificationDispatcher::unsubscribe(const SubscriptionId id)
{
    const std::lock_guard<std::mutex> lock{subscriptions_mutex_};
    return subscriptions_.erase(id) > 0;
}

bool NotificationDispatcher::post(Notification::Var notification)
{
    const std::lock_guard<std::mutex> lock{queue_mutex_};

    const auto* const update = cetl::get_if<Notification::SightingUpdated>(&notification);
    if (update == nullptr)
    {
        queue_.push_back(std::move(notification));
        return true;
    }

    bool no_drops = true;
    if (queued_updates_ >= queue_capacity_)
    {
        evictUpdate(update);
        no_drops = false;
    }
    queue_.push_back(std::move(notification));
    ++queued_updates_;
    return no_drops;
}

std::size_t NotificationDispatcher::dispatch()
{
    // One drain at a time keeps delivery in posting order.
    const std::lock_guard<std::mutex> dispatch_lock{dispatch_mutex_};

    std::deque<Notification::Var> batch;
    {
        const std::lock_guard<std::mutex> lock{queue_mutex_};
        batch.swap(queue_);
        queued_updates_    = 0;
        overflow_reported_ = false;
    }
    if (batch.empty())
    {
        return 0;
    }

    Subscriptions subscriptions;
    {
        const std::lock_guard<std::mutex> lock{subscriptions_mutex_};
        subscriptions = subscriptions_;
    }

    for (const auto& notification : batch)
    {
        deliver(subscriptions, notification);
    }
    return batch.size();
}

void NotificationDispatcher::setQueueCapacity(const std::size_t queue_capacity)
{
    const std::lock_guard<std::mutex> lock{queue_mutex_};
    queue_capacity_ = std::max<std::size_t>(queue_capacity, 1);
    while (queued_updates_ > queue_capacity_)
    {
        evictUpdate(nullptr);
    }
}

std::size_t NotificationDispatcher::pending() const
{
    const std::lock_guard<std::mutex> lock{queue_mutex_};
    return queue_.size();
}

std::uint64_t NotificationDispatcher::dropped() const
{
    const std::lock_guard<std::mutex> lock{queue_mutex_};
    return dropped_;
}

std::size_t NotificationDispatcher::subscriberCount() const
{
    const std::lock_guard<std::mutex> lock{subscriptions_mutex_};
    return subscriptions_.size();
}

void NotificationDispatcher::deliver(const Subscriptions& subscriptions, const Notification::Var& notification) const
{
    const auto matchesDevice = [](const SubscriptionFilter& filter, const DeviceId& device) {
        //
        return !filter.device || (*filter.device == device);
    };

    cetl::visit(  //
        cetl::make_overloaded(
            [&](const Notification::SightingUpdated& updated) {
                //
                for (const auto& id_and_sub : subscriptions)
                {
                    const auto& sub = id_and_sub.second;
                    if ((sub.filter.mode == updated.mode) && matchesDevice(sub.filter, updated.device))
                    {
                        common::performWithoutThrowing([&sub, &updated] {
                            //
                            sub.subscriber->onSightingUpdated(updated.device, updated.record);
                        });
                    }
                }
            },
            [&](const Notification::Unavailable& unavailable) {
                //
                for (const auto& id_and_sub : subscriptions)
                {
                    const auto& sub = id_and_sub.second;
                    if (matchesDevice(sub.filter, unavailable.device))
                    {
                        common::performWithoutThrowing([&sub, &unavailable] {
                            //
                            sub.subscriber->onUnavailable(unavailable.device);
                        });
                    }
                }
            },
            [&](const Notification::ObserverChanged& changed) {
                //
                for (const auto& id_and_sub : subscriptions)
                {
                    const auto& sub = id_and_sub.second;
                    if (!sub.filter.device)
                    {
                        common::performWithoutThrowing([&sub, &changed] {
                            //
                            sub.subscriber->onObserverChanged(changed.observer, changed.event);
                        });
                    }
                }
            },
            [this](const Notification::SlotRevoked& revoked) {
                //
                logger_->debug("Signalling forced release (dev='{}', obs='{}', serial={}).",
                               revoked.device,
                               revoked.token.observer,
                               revoked.token.serial);
                if (revoked.handler)
                {
                    common::performWithoutThrowing([&revoked] {
                        //
                        revoked.handler(revoked.token, revoked.device);
                    });
                }
            }),
        notification);
}

/// Drops one queued sighting update: the one `superseded_by` replaces if there is any, otherwise the oldest.
///
/// Must be called with `queue_mutex_` held.
///
void NotificationDispatcher::evictUpdate(const Notification::SightingUpdated* const superseded_by)
{
    auto victim = queue_.end();
    if (superseded_by != nullptr)
    {
        victim = std::find_if(queue_.begin(), queue_.end(), [superseded_by](const Notification::Var& queued) {
            //
            const auto* const update = cetl::get_if<Notification::SightingUpdated>(&queued);
            return (update != nullptr) && (update->mode == superseded_by->mode) &&
                   (update->device == superseded_by->device);
        });
    }
    if (victim == queue_.end())
    {
        victim = std::find_if(queue_.begin(), queue_.end(), [](const Notification::Var& queued) {
            //
            return cetl::get_if<Notification::SightingUpdated>(&queued) != nullptr;
        });
    }
    CETL_DEBUG_ASSERT(victim != queue_.end(), "Update counter is out of sync with the queue.");
    if (victim == queue_.end())
    {
        queued_updates_ = 0;
        return;
    }

    queue_.erase(victim);
    --queued_updates_;
    ++dropped_;
    if (!overflow_reported_)
    {
        overflow_reported_ = true;
        logger_->warn("Notification queue is full (capacity={}), dropping sighting updates (total_dropped={}).",
                      queue_capacity_,
                      dropped_);
    }
}

}  // namespace core
}  // namespace btmux
