//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BTMUX_CORE_SCANNER_ARBITER_HPP_INCLUDED
#define BTMUX_CORE_SCANNER_ARBITER_HPP_INCLUDED

#include "btmux/core/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <vector>

namespace btmux
{
namespace core
{

/// Chooses the authoritative record of a device among the records of all observers seeing it.
///
/// Stateless: the current arbitration state is passed in and the new one is returned.
///
class ScannerArbiter final
{
public:
    struct Candidate final
    {
        DeviceRecord record;
        std::int64_t priority{0};
        bool         observer_connectable{false};
    };

    explicit ScannerArbiter(const Strength hysteresis_margin) noexcept
        : hysteresis_margin_{hysteresis_margin}
    {
    }

    /// Selects the new active record.
    ///
    /// The current active observer is kept while it has a candidate record, unless a challenger
    /// is stronger by at least the hysteresis margin. Otherwise the strongest candidate wins;
    /// ties are broken by observer priority and then by observer id.
    ///
    /// @param current Current state in the given mode (if any).
    /// @param candidates Non-stale records of the device.
    /// @return Empty if no candidate is eligible in the given mode.
    ///
    CETL_NODISCARD cetl::optional<ArbitrationState> choose(const cetl::optional<ArbitrationState>& current,
                                                           const std::vector<Candidate>&           candidates,
                                                           const ArbitrationMode                   mode,
                                                           const TimePoint                         now) const;

    /// @return Eligible candidates in preference order (best first), without hysteresis.
    ///
    CETL_NODISCARD std::vector<Candidate> rank(const std::vector<Candidate>& candidates,
                                               const ArbitrationMode         mode) const;

    CETL_NODISCARD static bool isEligible(const Candidate& candidate, const ArbitrationMode mode) noexcept;

    /// Strict weak "better than" order used for ranking.
    ///
    CETL_NODISCARD static bool isBetter(const Candidate& lhs, const Candidate& rhs) noexcept;

    Strength hysteresisMargin() const noexcept
    {
        return hysteresis_margin_;
    }

private:
    Strength hysteresis_margin_;

};  // ScannerArbiter

}  // namespace core
}  // namespace btmux

#endif  // BTMUX_CORE_SCANNER_ARBITER_HPP_INCLUDED
