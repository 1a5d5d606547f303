//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BTMUX_CORE_TYPES_HPP_INCLUDED
#define BTMUX_CORE_TYPES_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/types.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace btmux
{
namespace core
{

using DeviceId           = std::string;
using ObserverId         = std::string;
using TimePoint          = libcyphal::TimePoint;
using Duration           = libcyphal::Duration;
using Strength           = std::int16_t;  // dBm
using PayloadFingerprint = std::uint64_t;
using Payload            = std::vector<std::uint8_t>;
using PayloadPtr         = std::shared_ptr<const Payload>;

enum class ObserverKind : std::uint8_t
{
    LocalAdapter,
    RemoteRelay,

};  // ObserverKind

enum class ArbitrationMode : std::uint8_t
{
    Any,
    ConnectableRequired,

};  // ArbitrationMode

constexpr std::size_t ArbitrationModeCount = 2;

inline std::size_t modeIndex(const ArbitrationMode mode) noexcept
{
    return static_cast<std::size_t>(mode);
}

struct ObserverCapabilities final
{
    ObserverKind kind{ObserverKind::LocalAdapter};
    bool         connectable{false};
    std::size_t  max_connections{0};

    /// Configured rank, breaks ties between observers of the same kind (higher wins).
    std::int32_t rank{0};

    /// How long a sighting from this observer stays valid.
    /// If empty, the core wide default availability timeout is used.
    cetl::optional<Duration> expiry;

    std::string name;
    std::string adapter;

};  // ObserverCapabilities

/// Partial capability change. Only present fields are applied.
///
struct CapabilityUpdate final
{
    cetl::optional<bool>                     connectable;
    cetl::optional<std::size_t>              max_connections;
    cetl::optional<std::int32_t>             rank;
    cetl::optional<cetl::optional<Duration>> expiry;
    cetl::optional<std::string>              name;

};  // CapabilityUpdate

struct ObserverInfo final
{
    ObserverId           id;
    ObserverCapabilities capabilities;
    std::int64_t         priority{0};
    TimePoint            registered_at;
    TimePoint            last_detection;

    /// Number of connection slots currently held on this observer.
    std::size_t connecting{0};

    /// `false` while the observer is quiet (see `Central::checkWatchdog`) or busy connecting.
    bool scanning{true};

};  // ObserverInfo

struct Sighting final
{
    DeviceId                 device;
    ObserverId               observer;
    Strength                 strength{0};
    bool                     connectable{false};
    PayloadFingerprint       fingerprint{0};
    PayloadPtr               payload;
    TimePoint                timestamp;
    cetl::optional<Duration> ttl_hint;

};  // Sighting

struct DeviceRecord final
{
    ObserverId         observer;
    TimePoint          timestamp;
    Strength           strength{0};
    bool               connectable{false};
    PayloadFingerprint fingerprint{0};
    PayloadPtr         payload;
    Duration           ttl{0};

    TimePoint expiresAt() const noexcept
    {
        return timestamp + ttl;
    }

    bool isStale(const TimePoint now) const noexcept
    {
        return now > expiresAt();
    }

};  // DeviceRecord

struct ArbitrationState final
{
    ObserverId active;
    TimePoint  chosen_at;
    Strength   strength_at_choice{0};

};  // ArbitrationState

enum class IngestOutcome : std::uint8_t
{
    Accepted,
    OutOfOrder,
    UnknownObserver,

    /// The sighting was already past its validity window when it arrived (e.g. a lagging relay).
    Stale,

};  // IngestOutcome

struct SlotToken final
{
    ObserverId    observer;
    std::uint64_t serial{0};

    friend bool operator==(const SlotToken& lhs, const SlotToken& rhs) noexcept
    {
        return (lhs.serial == rhs.serial) && (lhs.observer == rhs.observer);
    }
    friend bool operator!=(const SlotToken& lhs, const SlotToken& rhs) noexcept
    {
        return !(lhs == rhs);
    }

};  // SlotToken

struct SlotGrant final
{
    SlotToken  token;
    ObserverId observer;

};  // SlotGrant

enum class SlotFailure : std::uint8_t
{
    /// Every connectable candidate is saturated.
    CapacityExhausted,

    /// No observer currently seeing the device is able to originate a connection.
    NoConnectableCandidate,

};  // SlotFailure

struct SlotResult
{
    using Success = SlotGrant;
    using Failure = SlotFailure;
    using Var     = cetl::variant<Success, Failure>;
};

struct SlotRequest final
{
    using OnForcedRelease = std::function<void(const SlotToken& token, const DeviceId& device)>;

    DeviceId                   device;
    cetl::optional<ObserverId> preferred;
    ArbitrationMode            mode{ArbitrationMode::ConnectableRequired};
    std::string                requester;
    OnForcedRelease            on_forced_release;

};  // SlotRequest

struct SlotAllocations final
{
    ObserverId            observer;
    std::size_t           slots{0};
    std::size_t           free{0};
    std::vector<DeviceId> allocated;

};  // SlotAllocations

/// Uniform ingestion events pushed by sighting sources (local radio and relay transports).
///
struct Event final
{
    struct ObserverOnline final
    {
        ObserverId           id;
        ObserverCapabilities capabilities;
    };
    struct ObserverOffline final
    {
        ObserverId id;
    };

    using Var = cetl::variant<Sighting, ObserverOnline, ObserverOffline>;

};  // Event

/// Tuning parameters of the core. Owned by the embedding application and passed in explicitly.
///
struct Params final
{
    using CapacityOverrides = std::map<ObserverId, std::size_t>;

    Strength          hysteresis_margin{16};       // NOLINT(*-magic-numbers)
    Strength          dedup_strength_delta{8};     // NOLINT(*-magic-numbers)
    Duration          dedup_time_floor{std::chrono::seconds{10}};                // NOLINT(*-magic-numbers)
    Duration          default_availability_timeout{std::chrono::seconds{195}};  // NOLINT(*-magic-numbers)
    Duration          watchdog_timeout{std::chrono::seconds{90}};               // NOLINT(*-magic-numbers)
    CapacityOverrides capacity_overrides;
    std::size_t       notification_queue_capacity{1024};  // NOLINT(*-magic-numbers)
    std::size_t       shard_count{16};                    // NOLINT(*-magic-numbers)

};  // Params

}  // namespace core
}  // namespace btmux

#endif  // BTMUX_CORE_TYPES_HPP_INCLUDED
