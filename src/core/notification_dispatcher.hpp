//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BTMUX_CORE_NOTIFICATION_DISPATCHER_HPP_INCLUDED
#define BTMUX_CORE_NOTIFICATION_DISPATCHER_HPP_INCLUDED

#include "btmux/core/subscriber.hpp"
#include "btmux/core/types.hpp"
#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>

namespace btmux
{
namespace core
{

struct Notification final
{
    struct SightingUpdated final
    {
        DeviceId        device;
        ArbitrationMode mode;
        DeviceRecord    record;
    };
    struct Unavailable final
    {
        DeviceId device;
    };
    struct ObserverChanged final
    {
        ObserverId    observer;
        ObserverEvent event;
    };
    struct SlotRevoked final
    {
        SlotToken                    token;
        DeviceId                     device;
        SlotRequest::OnForcedRelease handler;
    };

    using Var = cetl::variant<SightingUpdated, Unavailable, ObserverChanged, SlotRevoked>;

};  // Notification

/// Fans decisions out to subscribers.
///
/// Posting only appends to a FIFO queue and never blocks on subscribers. Delivery happens in `dispatch`,
/// on the caller's thread.
///
/// The capacity bounds queued `SightingUpdated` notifications only. On overflow a pending update of the same
/// device and mode is superseded, otherwise the oldest pending update is dropped. Device loss, observer
/// changes and forced releases are never dropped, so `pending` may exceed the capacity.
///
class NotificationDispatcher final
{
public:
    explicit NotificationDispatcher(const std::size_t queue_capacity);

    NotificationDispatcher(const NotificationDispatcher&)                = delete;
    NotificationDispatcher(NotificationDispatcher&&) noexcept            = delete;
    NotificationDispatcher& operator=(const NotificationDispatcher&)     = delete;
    NotificationDispatcher& operator=(NotificationDispatcher&&) noexcept = delete;

    ~NotificationDispatcher() = default;

    SubscriptionId subscribe(Subscriber::Ptr subscriber, const SubscriptionFilter& filter);
    bool           unsubscribe(const SubscriptionId id);

    /// @return `false` if an older sighting update had to be dropped to make room.
    ///
    bool post(Notification::Var notification);

    /// Delivers all queued notifications.
    ///
    /// @return Number of delivered notifications.
    ///
    std::size_t dispatch();

    void setQueueCapacity(const std::size_t queue_capacity);

    CETL_NODISCARD std::size_t   pending() const;
    CETL_NODISCARD std::uint64_t dropped() const;
    CETL_NODISCARD std::size_t   subscriberCount() const;

private:
    struct Subscription final
    {
        Subscriber::Ptr    subscriber;
        SubscriptionFilter filter;
    };
    using Subscriptions = std::map<SubscriptionId, Subscription>;

    void deliver(const Subscriptions& subscriptions, const Notification::Var& notification) const;
    void evictUpdate(const Notification::SightingUpdated* const superseded_by);

    mutable std::mutex                queue_mutex_;
    std::deque<Notification::Var>     queue_;
    std::size_t                       queue_capacity_;
    std::size_t                       queued_updates_{0};
    std::uint64_t                     dropped_{0};
    bool                              overflow_reported_{false};

    mutable std::mutex subscriptions_mutex_;
    Subscriptions      subscriptions_;
    SubscriptionId     next_subscription_id_{1};

    std::mutex         dispatch_mutex_;
    common::LoggerPtr  logger_{common::getLogger("core")};

};  // NotificationDispatcher

}  // namespace core
}  // namespace btmux

#endif  // BTMUX_CORE_NOTIFICATION_DISPATCHER_HPP_INCLUDED
