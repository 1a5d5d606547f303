//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BTMUX_CORE_OBSERVER_REGISTRY_HPP_INCLUDED
#define BTMUX_CORE_OBSERVER_REGISTRY_HPP_INCLUDED

#include "btmux/core/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

namespace btmux
{
namespace core
{

/// Set of registered observers (local adapters and remote relays) and their capabilities.
///
/// Structural changes (register, deregister, capability update) must be externally serialized
/// against readers. Detection bookkeeping (`markDetection`, `checkWatchdog`) is safe
/// to call concurrently with other readers.
///
class ObserverRegistry final
{
public:
    enum class RegisterOutcome : std::uint8_t
    {
        Added,
        Updated,
    };

    ObserverRegistry() = default;

    ObserverRegistry(const ObserverRegistry&)                = delete;
    ObserverRegistry(ObserverRegistry&&) noexcept            = delete;
    ObserverRegistry& operator=(const ObserverRegistry&)     = delete;
    ObserverRegistry& operator=(ObserverRegistry&&) noexcept = delete;

    ~ObserverRegistry() = default;

    RegisterOutcome registerObserver(const ObserverId& id, const ObserverCapabilities& capabilities, TimePoint now);

    /// @return `false` if the observer wasn't registered.
    ///
    bool deregister(const ObserverId& id);

    /// @return `false` if the observer isn't registered.
    ///
    bool updateCapability(const ObserverId& id, const CapabilityUpdate& update);

    CETL_NODISCARD std::vector<ObserverInfo>     listOnline() const;
    CETL_NODISCARD cetl::optional<ObserverInfo>  find(const ObserverId& id) const;
    CETL_NODISCARD bool                          contains(const ObserverId& id) const;
    CETL_NODISCARD const ObserverCapabilities*   capabilitiesOf(const ObserverId& id) const;
    CETL_NODISCARD std::int64_t                  priorityOf(const ObserverId& id) const;
    CETL_NODISCARD std::size_t                   size() const noexcept;

    /// Records that the observer has just delivered a sighting.
    ///
    /// @return `true` if the observer was quiet and has now resumed scanning.
    ///
    bool markDetection(const ObserverId& id, TimePoint now);

    /// @return Observers which have just been marked as not scanning.
    ///
    std::vector<ObserverId> checkWatchdog(TimePoint now, Duration timeout);

    /// Local adapters always outrank relays; within a kind the configured rank decides.
    ///
    static std::int64_t priorityWeight(const ObserverCapabilities& capabilities) noexcept;

private:
    struct Entry final
    {
        Entry(const ObserverCapabilities& caps, const TimePoint now)
            : capabilities{caps}
            , registered_at{now}
            , last_detection_us{toTicks(now)}
            , scanning{true}
        {
        }

        ObserverCapabilities      capabilities;
        TimePoint                 registered_at;
        std::atomic<std::int64_t> last_detection_us;
        std::atomic<bool>         scanning;
    };

    static std::int64_t toTicks(const TimePoint time_point) noexcept
    {
        return static_cast<std::int64_t>(time_point.time_since_epoch().count());
    }

    static ObserverInfo makeInfo(const ObserverId& id, const Entry& entry);

    std::unordered_map<ObserverId, std::unique_ptr<Entry>> entries_;

};  // ObserverRegistry

}  // namespace core
}  // namespace btmux

#endif  // BTMUX_CORE_OBSERVER_REGISTRY_HPP_INCLUDED
