//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "sighting_history.hpp"

#include "btmux/core/types.hpp"
#include "core_gtest_helpers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>

namespace
{

using namespace btmux::core;  // NOLINT This our main concern here in the unit tests.

using testing::ElementsAre;
using testing::UnorderedElementsAre;
using testing::IsEmpty;
using testing::IsFalse;
using testing::IsTrue;
using testing::NotNull;
using std::chrono_literals::operator""s;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestSightingHistory : public testing::Test
{
protected:
    const Duration   ttl_{std::chrono::duration_cast<Duration>(10s)};
    SightingHistory  history_;
};

// MARK: - Tests:

TEST_F(TestSightingHistory, ingest_keeps_latest_record_per_observer)
{
    EXPECT_THAT(history_.ingest(makeSighting("D", "A", -60, at(1s)), ttl_), SightingHistory::IngestResult::Accepted);
    EXPECT_THAT(history_.ingest(makeSighting("D", "B", -70, at(1s)), ttl_), SightingHistory::IngestResult::Accepted);
    EXPECT_THAT(history_.ingest(makeSighting("D", "A", -55, at(2s)), ttl_), SightingHistory::IngestResult::Accepted);

    EXPECT_THAT(history_.recordsFor("D", at(3s)),
                ElementsAre(RecordFromWithStrength("A", -55), RecordFromWithStrength("B", -70)));
    EXPECT_THAT(history_.deviceCount(), 1);

    const auto* const record = history_.find("D", "A");
    ASSERT_THAT(record, NotNull());
    EXPECT_THAT(record->ttl, ttl_);
    EXPECT_THAT(record->timestamp, at(2s));
}

TEST_F(TestSightingHistory, out_of_order_is_rejected)
{
    EXPECT_THAT(history_.ingest(makeSighting("D", "A", -60, at(5s)), ttl_), SightingHistory::IngestResult::Accepted);
    EXPECT_THAT(history_.ingest(makeSighting("D", "A", -40, at(4s)), ttl_), SightingHistory::IngestResult::OutOfOrder);

    // Same timestamp is not older.
    EXPECT_THAT(history_.ingest(makeSighting("D", "A", -50, at(5s)), ttl_), SightingHistory::IngestResult::Accepted);
    EXPECT_THAT(history_.find("D", "A")->strength, -50);

    // Ordering is per observer.
    EXPECT_THAT(history_.ingest(makeSighting("D", "B", -70, at(1s)), ttl_), SightingHistory::IngestResult::Accepted);
}

TEST_F(TestSightingHistory, stale_records_are_hidden)
{
    history_.ingest(makeSighting("D", "A", -60, at(0s)), ttl_);
    history_.ingest(makeSighting("D", "B", -60, at(5s)), ttl_);

    EXPECT_THAT(history_.recordsFor("D", at(10s)), ElementsAre(RecordFrom("A"), RecordFrom("B")));
    EXPECT_THAT(history_.recordsFor("D", at(11s)), ElementsAre(RecordFrom("B")));
    EXPECT_THAT(history_.allRecordsFor("D"), ElementsAre(RecordFrom("A"), RecordFrom("B")));
    EXPECT_THAT(history_.recordsFor("unknown", at(0s)), IsEmpty());
}

TEST_F(TestSightingHistory, latest_expiry)
{
    EXPECT_THAT(history_.latestExpiry("D").has_value(), IsFalse());

    history_.ingest(makeSighting("D", "A", -60, at(0s)), std::chrono::duration_cast<Duration>(30s));
    history_.ingest(makeSighting("D", "B", -60, at(5s)), ttl_);
    EXPECT_THAT(history_.latestExpiry("D"), cetl::optional<TimePoint>{at(30s)});
}

TEST_F(TestSightingHistory, remove_observer_cascades)
{
    history_.ingest(makeSighting("D1", "A", -60, at(0s)), ttl_);
    history_.ingest(makeSighting("D2", "A", -60, at(0s)), ttl_);
    history_.ingest(makeSighting("D2", "B", -60, at(0s)), ttl_);
    history_.ingest(makeSighting("D3", "B", -60, at(0s)), ttl_);

    EXPECT_THAT(history_.removeObserver("A"), ElementsAre("D1", "D2"));

    EXPECT_THAT(history_.hasDevice("D1"), IsFalse());
    EXPECT_THAT(history_.allRecordsFor("D2"), ElementsAre(RecordFrom("B")));
    EXPECT_THAT(history_.devicesSeenBy("A"), IsEmpty());
    EXPECT_THAT(history_.devicesSeenBy("B"), ElementsAre("D2", "D3"));

    EXPECT_THAT(history_.removeObserver("A"), IsEmpty());
}

TEST_F(TestSightingHistory, prune_stale)
{
    history_.ingest(makeSighting("D1", "A", -60, at(0s)), ttl_);
    history_.ingest(makeSighting("D2", "A", -60, at(0s)), ttl_);
    history_.ingest(makeSighting("D2", "B", -60, at(8s)), ttl_);
    history_.ingest(makeSighting("D3", "B", -60, at(8s)), ttl_);

    EXPECT_THAT(history_.pruneStale(at(10s)).removed_records, 0);

    const auto result = history_.pruneStale(at(11s));
    EXPECT_THAT(result.removed_records, 2);
    EXPECT_THAT(result.touched, ElementsAre("D2"));
    EXPECT_THAT(result.emptied, ElementsAre("D1"));

    EXPECT_THAT(history_.devicesSeenBy("A"), IsEmpty());
    EXPECT_THAT(history_.deviceCount(), 2);

    EXPECT_THAT(history_.pruneStale(at(20s)).emptied, UnorderedElementsAre("D2", "D3"));
    EXPECT_THAT(history_.deviceCount(), 0);
}

TEST_F(TestSightingHistory, drop_device)
{
    history_.ingest(makeSighting("D1", "A", -60, at(0s)), ttl_);
    history_.ingest(makeSighting("D2", "A", -60, at(0s)), ttl_);

    history_.dropDevice("D1");
    history_.dropDevice("unknown");

    EXPECT_THAT(history_.hasDevice("D1"), IsFalse());
    EXPECT_THAT(history_.devicesSeenBy("A"), ElementsAre("D2"));
    EXPECT_THAT(history_.hasDevice("D2"), IsTrue());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
