//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BTMUX_CORE_DEDUP_FILTER_HPP_INCLUDED
#define BTMUX_CORE_DEDUP_FILTER_HPP_INCLUDED

#include "btmux/core/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>

namespace btmux
{
namespace core
{

/// Suppresses notifications which carry nothing new compared to the last notified record.
///
class DedupFilter final
{
public:
    /// What has been forwarded to subscribers last time.
    ///
    struct Notified final
    {
        ObserverId         observer;
        Strength           strength{0};
        PayloadFingerprint fingerprint{0};
        TimePoint          notified_at;
    };

    DedupFilter(const Strength strength_delta, const Duration time_floor) noexcept
        : strength_delta_{strength_delta}
        , time_floor_{time_floor}
    {
    }

    /// Why the chosen record is being evaluated.
    ///
    enum class Trigger : std::uint8_t
    {
        /// The chosen record has just been refreshed by a sighting.
        Sighting,

        /// Re-arbitration without a new sighting of the chosen record (pruning, observer changes).
        /// The time floor doesn't apply, since there is nothing new to signal liveness of.
        Reevaluation,
    };

    /// Decides whether the record chosen by arbitration is worth forwarding.
    ///
    /// A change of the active observer is always notified.
    ///
    CETL_NODISCARD bool shouldNotify(const DeviceRecord&             chosen,
                                     const cetl::optional<Notified>& last_notified,
                                     const TimePoint                 now,
                                     const Trigger                   trigger = Trigger::Sighting) const noexcept;

    CETL_NODISCARD static Notified makeNotified(const DeviceRecord& chosen, const TimePoint now);

private:
    Strength strength_delta_;
    Duration time_floor_;

};  // DedupFilter

}  // namespace core
}  // namespace btmux

#endif  // BTMUX_CORE_DEDUP_FILTER_HPP_INCLUDED
