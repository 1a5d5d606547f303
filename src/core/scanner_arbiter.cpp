//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "scanner_arbiter.hpp"

#include "btmux/core/types.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <iterator>
#include <vector>

namespace btmux
{
namespace core
{

cetl::optional<ArbitrationState> ScannerArbiter::choose(const cetl::optional<ArbitrationState>& current,
                                                        const std::vector<Candidate>&           candidates,
                                                        const ArbitrationMode                   mode,
                                                        const TimePoint                         now) const
{
    const Candidate* incumbent = nullptr;
    const Candidate* best      = nullptr;
    for (const auto& candidate : candidates)
    {
        if (!isEligible(candidate, mode))
        {
            continue;
        }
        if (current && (candidate.record.observer == current->active))
        {
            incumbent = &candidate;
        }
        if ((best == nullptr) || isBetter(candidate, *best))
        {
            best = &candidate;
        }
    }

    if (best == nullptr)
    {
        return cetl::nullopt;
    }

    if (incumbent != nullptr)
    {
        const int advantage = static_cast<int>(best->record.strength) - incumbent->record.strength;
        if ((best == incumbent) || (advantage < hysteresis_margin_))
        {
            return current;
        }
    }

    return ArbitrationState{best->record.observer, now, best->record.strength};
}

std::vector<ScannerArbiter::Candidate> ScannerArbiter::rank(const std::vector<Candidate>& candidates,
                                                            const ArbitrationMode         mode) const
{
    std::vector<Candidate> ranked;
    ranked.reserve(candidates.size());
    std::copy_if(candidates.begin(), candidates.end(), std::back_inserter(ranked), [mode](const auto& candidate) {
        //
        return isEligible(candidate, mode);
    });
    std::sort(ranked.begin(), ranked.end(), &ScannerArbiter::isBetter);
    return ranked;
}

bool ScannerArbiter::isEligible(const Candidate& candidate, const ArbitrationMode mode) noexcept
{
    if (mode == ArbitrationMode::Any)
    {
        return true;
    }
    return candidate.observer_connectable && candidate.record.connectable;
}

bool ScannerArbiter::isBetter(const Candidate& lhs, const Candidate& rhs) noexcept
{
    if (lhs.record.strength != rhs.record.strength)
    {
        return lhs.record.strength > rhs.record.strength;
    }
    if (lhs.priority != rhs.priority)
    {
        return lhs.priority > rhs.priority;
    }
    return lhs.record.observer < rhs.record.observer;
}

}  // namespace core
}  // namespace btmux
