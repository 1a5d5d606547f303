//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BTMUX_CORE_SUBSCRIBER_HPP_INCLUDED
#define BTMUX_CORE_SUBSCRIBER_HPP_INCLUDED

#include "types.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <memory>

namespace btmux
{
namespace core
{

enum class ObserverEvent : std::uint8_t
{
    Added,
    Updated,
    Removed,
    Quiet,
    Resumed,

};  // ObserverEvent

/// Abstract interface of a consumer of the core decisions.
///
/// Callbacks are invoked from `Central::dispatchPending`, never from the ingestion path.
/// Implementations must not perform long blocking work inline.
///
class Subscriber
{
public:
    using Ptr = std::shared_ptr<Subscriber>;

    Subscriber(Subscriber&&)                 = delete;
    Subscriber(const Subscriber&)            = delete;
    Subscriber& operator=(Subscriber&&)      = delete;
    Subscriber& operator=(const Subscriber&) = delete;

    virtual ~Subscriber() = default;

    /// The record chosen by arbitration for the subscribed mode has materially changed.
    ///
    virtual void onSightingUpdated(const DeviceId& device, const DeviceRecord& chosen_record) = 0;

    /// No observer has seen the device within its validity window.
    ///
    virtual void onUnavailable(const DeviceId& device) = 0;

    /// Registration changes of observers. Only delivered to subscribers without a device filter.
    ///
    virtual void onObserverChanged(const ObserverId& observer, const ObserverEvent event)
    {
        (void) observer;
        (void) event;
    }

protected:
    Subscriber() = default;

};  // Subscriber

struct SubscriptionFilter final
{
    /// If empty, matches every device.
    cetl::optional<DeviceId> device;

    ArbitrationMode mode{ArbitrationMode::Any};

};  // SubscriptionFilter

using SubscriptionId = std::uint64_t;

}  // namespace core
}  // namespace btmux

#endif  // BTMUX_CORE_SUBSCRIBER_HPP_INCLUDED
