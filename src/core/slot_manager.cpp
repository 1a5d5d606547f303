//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "slot_manager.hpp"

#include "btmux/core/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <iterator>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace btmux
{
namespace core
{

std::vector<SlotManager::Allocation> SlotManager::setCapacity(const ObserverId& observer, const std::size_t capacity)
{
    std::vector<Allocation> revoked;

    const std::unique_lock<std::shared_mutex> ledgers_lock{ledgers_mutex_};

    auto it = ledgers_.find(observer);
    if (it == ledgers_.end())
    {
        ledgers_.emplace(observer, std::make_unique<Ledger>(capacity));
        return revoked;
    }

    auto&                             ledger = *it->second;
    const std::lock_guard<std::mutex> lock{ledger.mutex};
    ledger.capacity = capacity;
    while (ledger.used() > ledger.capacity)
    {
        auto newest = std::prev(ledger.held.end());
        revoked.push_back(std::move(newest->second));
        ledger.held.erase(newest);
    }
    CETL_DEBUG_ASSERT(ledger.used() <= ledger.capacity, "");
    return revoked;
}

std::vector<SlotManager::Allocation> SlotManager::removeLedger(const ObserverId& observer)
{
    std::vector<Allocation> revoked;

    std::unique_ptr<Ledger> ledger;
    {
        const std::unique_lock<std::shared_mutex> ledgers_lock{ledgers_mutex_};

        auto it = ledgers_.find(observer);
        if (it == ledgers_.end())
        {
            return revoked;
        }
        ledger = std::move(it->second);
        ledgers_.erase(it);
    }

    revoked.reserve(ledger->held.size());
    for (auto& serial_and_allocation : ledger->held)
    {
        revoked.push_back(std::move(serial_and_allocation.second));
    }
    ledger->held.clear();
    return revoked;
}

SlotResult::Var SlotManager::request(const DeviceId&                device,
                                     const std::vector<ObserverId>& ranked_candidates,
                                     const std::string&             requester,
                                     SlotRequest::OnForcedRelease   on_forced_release)
{
    const std::shared_lock<std::shared_mutex> ledgers_lock{ledgers_mutex_};

    bool any_candidate = false;
    for (const auto& observer : ranked_candidates)
    {
        const auto it = ledgers_.find(observer);
        if (it == ledgers_.end())
        {
            continue;
        }
        auto& ledger = *it->second;
        if (ledger.capacity == 0)
        {
            continue;
        }
        any_candidate = true;

        const std::lock_guard<std::mutex> lock{ledger.mutex};
        if (ledger.used() < ledger.capacity)
        {
            const SlotToken token{observer, next_serial_.fetch_add(1)};
            ledger.held.emplace(token.serial, Allocation{token, device, requester, std::move(on_forced_release)});
            CETL_DEBUG_ASSERT(ledger.used() <= ledger.capacity, "");

            return SlotGrant{token, observer};
        }
    }

    return any_candidate ? SlotFailure::CapacityExhausted : SlotFailure::NoConnectableCandidate;
}

bool SlotManager::release(const SlotToken& token)
{
    const std::shared_lock<std::shared_mutex> ledgers_lock{ledgers_mutex_};

    const auto it = ledgers_.find(token.observer);
    if (it == ledgers_.end())
    {
        return false;
    }

    auto&                             ledger = *it->second;
    const std::lock_guard<std::mutex> lock{ledger.mutex};
    return ledger.held.erase(token.serial) > 0;
}

cetl::optional<SlotAllocations> SlotManager::allocationsOf(const ObserverId& observer) const
{
    const std::shared_lock<std::shared_mutex> ledgers_lock{ledgers_mutex_};

    const auto it = ledgers_.find(observer);
    if (it == ledgers_.end())
    {
        return cetl::nullopt;
    }
    return snapshotOf(it->first, *it->second);
}

std::vector<SlotAllocations> SlotManager::allocations() const
{
    std::vector<SlotAllocations> result;
    {
        const std::shared_lock<std::shared_mutex> ledgers_lock{ledgers_mutex_};

        result.reserve(ledgers_.size());
        for (const auto& observer_and_ledger : ledgers_)
        {
            result.push_back(snapshotOf(observer_and_ledger.first, *observer_and_ledger.second));
        }
    }
    std::sort(result.begin(), result.end(), [](const auto& lhs, const auto& rhs) {
        //
        return lhs.observer < rhs.observer;
    });
    return result;
}

std::size_t SlotManager::usedOf(const ObserverId& observer) const
{
    const std::shared_lock<std::shared_mutex> ledgers_lock{ledgers_mutex_};

    const auto it = ledgers_.find(observer);
    if (it == ledgers_.end())
    {
        return 0;
    }
    const std::lock_guard<std::mutex> lock{it->second->mutex};
    return it->second->used();
}

bool SlotManager::hasLedger(const ObserverId& observer) const
{
    const std::shared_lock<std::shared_mutex> ledgers_lock{ledgers_mutex_};
    return ledgers_.find(observer) != ledgers_.end();
}

SlotAllocations SlotManager::snapshotOf(const ObserverId& observer, const Ledger& ledger)
{
    const std::lock_guard<std::mutex> lock{ledger.mutex};

    SlotAllocations snapshot;
    snapshot.observer = observer;
    snapshot.slots    = ledger.capacity;
    snapshot.free     = ledger.capacity - ledger.used();
    snapshot.allocated.reserve(ledger.held.size());
    for (const auto& serial_and_allocation : ledger.held)
    {
        snapshot.allocated.push_back(serial_and_allocation.second.device);
    }
    return snapshot;
}

}  // namespace core
}  // namespace btmux
