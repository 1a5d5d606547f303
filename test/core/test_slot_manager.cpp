//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "slot_manager.hpp"

#include "btmux/core/types.hpp"
#include "core_gtest_helpers.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <cstddef>
#include <string>
#include <thread>
#include <vector>

namespace
{

using namespace btmux::core;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::ElementsAre;
using testing::Field;
using testing::IsEmpty;
using testing::IsFalse;
using testing::IsTrue;
using testing::MockFunction;
using testing::SizeIs;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestSlotManager : public testing::Test
{
protected:
    SlotResult::Var request(const DeviceId& device, const std::vector<ObserverId>& candidates)
    {
        return slots_.request(device, candidates, "test", nullptr);
    }

    static SlotToken tokenOf(const SlotResult::Var& result)
    {
        return cetl::get<SlotGrant>(result).token;
    }

    SlotManager slots_;
};

// MARK: - Tests:

TEST_F(TestSlotManager, grants_in_candidate_order)
{
    (void) slots_.setCapacity("A", 1);
    (void) slots_.setCapacity("B", 2);

    EXPECT_THAT(request("D1", {"A", "B"}), GrantOn("A"));
    EXPECT_THAT(request("D2", {"A", "B"}), GrantOn("B"));
    EXPECT_THAT(request("D3", {"A", "B"}), GrantOn("B"));
    EXPECT_THAT(request("D4", {"A", "B"}), FailedWith(SlotFailure::CapacityExhausted));

    EXPECT_THAT(slots_.usedOf("A"), 1);
    EXPECT_THAT(slots_.usedOf("B"), 2);
}

TEST_F(TestSlotManager, no_connectable_candidate)
{
    (void) slots_.setCapacity("A", 0);

    EXPECT_THAT(request("D", {}), FailedWith(SlotFailure::NoConnectableCandidate));
    EXPECT_THAT(request("D", {"A"}), FailedWith(SlotFailure::NoConnectableCandidate));
    EXPECT_THAT(request("D", {"unknown"}), FailedWith(SlotFailure::NoConnectableCandidate));
}

TEST_F(TestSlotManager, release_is_idempotent)
{
    (void) slots_.setCapacity("A", 1);

    const auto token = tokenOf(request("D1", {"A"}));
    EXPECT_THAT(request("D2", {"A"}), FailedWith(SlotFailure::CapacityExhausted));

    EXPECT_THAT(slots_.release(token), IsTrue());
    EXPECT_THAT(slots_.release(token), IsFalse());
    EXPECT_THAT(slots_.release(SlotToken{"unknown", 42}), IsFalse());
    EXPECT_THAT(slots_.usedOf("A"), 0);

    EXPECT_THAT(request("D2", {"A"}), GrantOn("A"));
}

TEST_F(TestSlotManager, tokens_are_unique)
{
    (void) slots_.setCapacity("A", 2);
    (void) slots_.setCapacity("B", 2);

    const auto token1 = tokenOf(request("D", {"A"}));
    const auto token2 = tokenOf(request("D", {"A"}));
    const auto token3 = tokenOf(request("D", {"B"}));
    EXPECT_NE(token1, token2);
    EXPECT_NE(token1.serial, token3.serial);
    EXPECT_NE(token2.serial, token3.serial);

    // A token is honoured only by the ledger that issued it.
    EXPECT_THAT(slots_.release(SlotToken{"B", token1.serial}), IsFalse());
}

TEST_F(TestSlotManager, capacity_shrink_revokes_newest)
{
    (void) slots_.setCapacity("A", 3);
    const auto oldest = tokenOf(request("D1", {"A"}));
    const auto middle = tokenOf(request("D2", {"A"}));
    const auto newest = tokenOf(request("D3", {"A"}));

    const auto revoked = slots_.setCapacity("A", 1);
    EXPECT_THAT(revoked,
                ElementsAre(Field(&SlotManager::Allocation::token, newest),
                            Field(&SlotManager::Allocation::token, middle)));
    EXPECT_THAT(slots_.usedOf("A"), 1);
    EXPECT_THAT(slots_.release(newest), IsFalse());
    EXPECT_THAT(slots_.release(oldest), IsTrue());

    EXPECT_THAT(slots_.setCapacity("A", 5), IsEmpty());
}

TEST_F(TestSlotManager, remove_ledger_revokes_everything)
{
    MockFunction<void(const SlotToken&, const DeviceId&)> on_forced_release;

    (void) slots_.setCapacity("A", 2);
    const auto token = cetl::get<SlotGrant>(slots_.request("D1", {"A"}, "conn", on_forced_release.AsStdFunction())).token;
    (void) request("D2", {"A"});

    auto revoked = slots_.removeLedger("A");
    ASSERT_THAT(revoked, SizeIs(2));
    EXPECT_THAT(slots_.hasLedger("A"), IsFalse());
    EXPECT_THAT(slots_.release(token), IsFalse());
    EXPECT_THAT(request("D3", {"A"}), FailedWith(SlotFailure::NoConnectableCandidate));

    // The handler travels with the allocation; the owner decides when to call it.
    EXPECT_CALL(on_forced_release, Call(token, "D1")).Times(1);
    for (const auto& allocation : revoked)
    {
        if (allocation.on_forced_release)
        {
            allocation.on_forced_release(allocation.token, allocation.device);
        }
    }

    EXPECT_THAT(slots_.removeLedger("A"), IsEmpty());
}

TEST_F(TestSlotManager, allocations_snapshot)
{
    (void) slots_.setCapacity("B", 1);
    (void) slots_.setCapacity("A", 3);
    (void) request("D1", {"A"});
    (void) request("D2", {"A"});

    const auto allocations = slots_.allocations();
    ASSERT_THAT(allocations, SizeIs(2));
    EXPECT_THAT(allocations[0].observer, "A");
    EXPECT_THAT(allocations[0].slots, 3);
    EXPECT_THAT(allocations[0].free, 1);
    EXPECT_THAT(allocations[0].allocated, ElementsAre("D1", "D2"));
    EXPECT_THAT(allocations[1].observer, "B");
    EXPECT_THAT(allocations[1].free, 1);
    EXPECT_THAT(allocations[1].allocated, IsEmpty());

    EXPECT_THAT(slots_.allocationsOf("unknown").has_value(), IsFalse());
}

TEST_F(TestSlotManager, concurrent_requests_never_exceed_capacity)
{
    constexpr std::size_t capacity_a   = 3;
    constexpr std::size_t capacity_b   = 2;
    constexpr std::size_t thread_count = 8;
    constexpr int         rounds       = 500;

    (void) slots_.setCapacity("A", capacity_a);
    (void) slots_.setCapacity("B", capacity_b);

    std::atomic<bool>        violated{false};
    std::atomic<std::size_t> granted{0};
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < thread_count; ++i)
    {
        threads.emplace_back([&, i] {
            for (int round = 0; round < rounds; ++round)
            {
                const auto result = slots_.request("D" + std::to_string(i), {"A", "B"}, "worker", nullptr);
                if ((slots_.usedOf("A") > capacity_a) || (slots_.usedOf("B") > capacity_b))
                {
                    violated = true;
                }
                if (const auto* const grant = cetl::get_if<SlotGrant>(&result))
                {
                    ++granted;
                    std::this_thread::yield();
                    if (!slots_.release(grant->token))
                    {
                        violated = true;
                    }
                }
            }
        });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }

    EXPECT_THAT(violated.load(), IsFalse());
    EXPECT_GT(granted.load(), 0);
    EXPECT_THAT(slots_.usedOf("A"), 0);
    EXPECT_THAT(slots_.usedOf("B"), 0);
}

TEST_F(TestSlotManager, concurrent_grants_and_capacity_changes)
{
    (void) slots_.setCapacity("A", 4);

    std::atomic<bool> stop{false};
    std::atomic<bool> violated{false};
    std::thread       resizer{[&] {
        for (std::size_t capacity = 0; !stop; capacity = (capacity + 1) % 5)
        {
            (void) slots_.setCapacity("A", capacity);
            const auto snapshot = slots_.allocationsOf("A");
            if (snapshot && (snapshot->allocated.size() > snapshot->slots))
            {
                violated = true;
            }
        }
    }};

    std::vector<std::thread> requesters;
    for (int i = 0; i < 4; ++i)
    {
        requesters.emplace_back([&] {
            for (int round = 0; round < 500; ++round)
            {
                const auto result = slots_.request("D", {"A"}, "worker", nullptr);
                if (const auto* const grant = cetl::get_if<SlotGrant>(&result))
                {
                    // May already be revoked by the resizer.
                    (void) slots_.release(grant->token);
                }
            }
        });
    }
    for (auto& requester : requesters)
    {
        requester.join();
    }
    stop = true;
    resizer.join();

    EXPECT_THAT(violated.load(), IsFalse());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
