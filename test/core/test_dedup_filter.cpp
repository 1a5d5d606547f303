//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "dedup_filter.hpp"

#include "btmux/core/types.hpp"
#include "core_gtest_helpers.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>

namespace
{

using namespace btmux::core;  // NOLINT This our main concern here in the unit tests.

using testing::IsFalse;
using testing::IsTrue;
using std::chrono_literals::operator""s;
using std::chrono_literals::operator""ms;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestDedupFilter : public testing::Test
{
protected:
    static DeviceRecord recordOf(const ObserverId& observer, const Strength strength, const PayloadFingerprint fp)
    {
        auto record        = makeRecord(observer, strength, at(0s));
        record.fingerprint = fp;
        return record;
    }

    DedupFilter filter_{8, std::chrono::duration_cast<Duration>(10s)};
};

// MARK: - Tests:

TEST_F(TestDedupFilter, first_record_is_notified)
{
    EXPECT_THAT(filter_.shouldNotify(recordOf("A", -60, 1), cetl::nullopt, at(0s)), IsTrue());
}

TEST_F(TestDedupFilter, unchanged_record_is_suppressed_until_floor)
{
    const auto record = recordOf("A", -60, 1);
    const auto last   = DedupFilter::makeNotified(record, at(0s));

    EXPECT_THAT(filter_.shouldNotify(record, last, at(1s)), IsFalse());
    EXPECT_THAT(filter_.shouldNotify(record, last, at(9999ms)), IsFalse());
    EXPECT_THAT(filter_.shouldNotify(record, last, at(10s)), IsTrue());
}

TEST_F(TestDedupFilter, time_floor_applies_to_fresh_sightings_only)
{
    const auto record = recordOf("A", -60, 1);
    const auto last   = DedupFilter::makeNotified(record, at(0s));

    EXPECT_THAT(filter_.shouldNotify(record, last, at(20s), DedupFilter::Trigger::Reevaluation), IsFalse());
    EXPECT_THAT(filter_.shouldNotify(record, last, at(20s), DedupFilter::Trigger::Sighting), IsTrue());

    // Material changes are notified regardless.
    EXPECT_THAT(filter_.shouldNotify(recordOf("B", -60, 1), last, at(1s), DedupFilter::Trigger::Reevaluation),
                IsTrue());
}

TEST_F(TestDedupFilter, material_changes_are_notified)
{
    const auto last = DedupFilter::makeNotified(recordOf("A", -60, 1), at(0s));

    EXPECT_THAT(filter_.shouldNotify(recordOf("A", -60, 2), last, at(1s)), IsTrue());
    EXPECT_THAT(filter_.shouldNotify(recordOf("B", -60, 1), last, at(1s)), IsTrue());

    // Strength must move by more than the delta.
    EXPECT_THAT(filter_.shouldNotify(recordOf("A", -68, 1), last, at(1s)), IsFalse());
    EXPECT_THAT(filter_.shouldNotify(recordOf("A", -52, 1), last, at(1s)), IsFalse());
    EXPECT_THAT(filter_.shouldNotify(recordOf("A", -69, 1), last, at(1s)), IsTrue());
    EXPECT_THAT(filter_.shouldNotify(recordOf("A", -51, 1), last, at(1s)), IsTrue());
}

TEST_F(TestDedupFilter, make_notified)
{
    const auto notified = DedupFilter::makeNotified(recordOf("A", -42, 7), at(3s));
    EXPECT_THAT(notified.observer, "A");
    EXPECT_THAT(notified.strength, -42);
    EXPECT_THAT(notified.fingerprint, 7U);
    EXPECT_THAT(notified.notified_at, at(3s));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
