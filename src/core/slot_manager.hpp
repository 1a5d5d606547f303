//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BTMUX_CORE_SLOT_MANAGER_HPP_INCLUDED
#define BTMUX_CORE_SLOT_MANAGER_HPP_INCLUDED

#include "btmux/core/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace btmux
{
namespace core
{

/// Tracks connection capacity of every observer and hands out allocation tokens.
///
/// Thread-safe: the ledger table is guarded by a reader/writer lock, and each ledger
/// by its own mutex, so grants against different observers don't contend.
/// Grants are decided synchronously; nothing is queued.
///
class SlotManager final
{
public:
    struct Allocation final
    {
        SlotToken                    token;
        DeviceId                     device;
        std::string                  requester;
        SlotRequest::OnForcedRelease on_forced_release;
    };

    SlotManager() = default;

    SlotManager(const SlotManager&)                = delete;
    SlotManager(SlotManager&&) noexcept            = delete;
    SlotManager& operator=(const SlotManager&)     = delete;
    SlotManager& operator=(SlotManager&&) noexcept = delete;

    ~SlotManager() = default;

    /// Creates the observer ledger, or changes its capacity.
    ///
    /// @return Allocations revoked because the new capacity is below the number of held tokens
    ///         (most recent ones first).
    ///
    std::vector<Allocation> setCapacity(const ObserverId& observer, std::size_t capacity);

    /// Destroys the observer ledger, invalidating every token issued against it.
    ///
    /// @return The revoked allocations, so that their holders can be signalled.
    ///
    std::vector<Allocation> removeLedger(const ObserverId& observer);

    /// Tries the candidates in the given order and grants a slot on the first one with spare capacity.
    ///
    /// Candidates without a ledger (deregistered meanwhile) are skipped.
    ///
    SlotResult::Var request(const DeviceId&                device,
                            const std::vector<ObserverId>& ranked_candidates,
                            const std::string&             requester,
                            SlotRequest::OnForcedRelease   on_forced_release);

    /// @return `false` for unknown or already released tokens.
    ///
    bool release(const SlotToken& token);

    CETL_NODISCARD cetl::optional<SlotAllocations> allocationsOf(const ObserverId& observer) const;
    CETL_NODISCARD std::vector<SlotAllocations>    allocations() const;
    CETL_NODISCARD std::size_t                     usedOf(const ObserverId& observer) const;
    CETL_NODISCARD bool                            hasLedger(const ObserverId& observer) const;

private:
    struct Ledger final
    {
        explicit Ledger(const std::size_t cap)
            : capacity{cap}
        {
        }

        CETL_NODISCARD std::size_t used() const noexcept
        {
            return held.size();
        }

        mutable std::mutex                       mutex;
        std::size_t                              capacity;
        std::map<std::uint64_t, Allocation>      held;  ///< Keyed by token serial (issue order).
    };

    static SlotAllocations snapshotOf(const ObserverId& observer, const Ledger& ledger);

    mutable std::shared_mutex                                 ledgers_mutex_;
    std::unordered_map<ObserverId, std::unique_ptr<Ledger>>   ledgers_;
    std::atomic<std::uint64_t>                                next_serial_{1};

};  // SlotManager

}  // namespace core
}  // namespace btmux

#endif  // BTMUX_CORE_SLOT_MANAGER_HPP_INCLUDED
