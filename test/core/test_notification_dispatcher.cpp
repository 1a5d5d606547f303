//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "notification_dispatcher.hpp"

#include "btmux/core/subscriber.hpp"
#include "btmux/core/types.hpp"
#include "core_gtest_helpers.hpp"
#include "subscriber_mock.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace
{

using namespace btmux::core;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::Field;
using testing::InSequence;
using testing::IsFalse;
using testing::IsTrue;
using testing::MockFunction;
using testing::StrictMock;
using testing::Throw;
using std::chrono_literals::operator""s;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestNotificationDispatcher : public testing::Test
{
protected:
    static Notification::SightingUpdated updated(const DeviceId&       device,
                                                 const ObserverId&     observer,
                                                 const ArbitrationMode mode = ArbitrationMode::Any)
    {
        return {device, mode, makeRecord(observer, -60, at(0s))};
    }

    std::shared_ptr<StrictMock<SubscriberMock>> subscriber_{std::make_shared<StrictMock<SubscriberMock>>()};
    NotificationDispatcher                      dispatcher_{4};
};

// MARK: - Tests:

TEST_F(TestNotificationDispatcher, post_does_not_deliver)
{
    (void) dispatcher_.subscribe(subscriber_, {});

    EXPECT_THAT(dispatcher_.post(Notification::Unavailable{"D"}), IsTrue());
    EXPECT_THAT(dispatcher_.pending(), 1);

    EXPECT_CALL(*subscriber_, onUnavailable("D")).Times(1);
    EXPECT_THAT(dispatcher_.dispatch(), 1);
    EXPECT_THAT(dispatcher_.pending(), 0);
    EXPECT_THAT(dispatcher_.dispatch(), 0);
}

TEST_F(TestNotificationDispatcher, delivery_in_posting_order)
{
    (void) dispatcher_.subscribe(subscriber_, {});

    (void) dispatcher_.post(Notification::ObserverChanged{"A", ObserverEvent::Added});
    (void) dispatcher_.post(updated("D", "A"));
    (void) dispatcher_.post(Notification::Unavailable{"D"});

    InSequence seq;
    EXPECT_CALL(*subscriber_, onObserverChanged("A", ObserverEvent::Added));
    EXPECT_CALL(*subscriber_, onSightingUpdated("D", RecordFrom("A")));
    EXPECT_CALL(*subscriber_, onUnavailable("D"));
    EXPECT_THAT(dispatcher_.dispatch(), 3);
}

TEST_F(TestNotificationDispatcher, filters)
{
    const auto device_sub      = std::make_shared<StrictMock<SubscriberMock>>();
    const auto connectable_sub = std::make_shared<StrictMock<SubscriberMock>>();

    (void) dispatcher_.subscribe(subscriber_, {});
    (void) dispatcher_.subscribe(device_sub, {DeviceId{"D1"}, ArbitrationMode::Any});
    (void) dispatcher_.subscribe(connectable_sub, {cetl::nullopt, ArbitrationMode::ConnectableRequired});

    (void) dispatcher_.post(updated("D1", "A"));
    (void) dispatcher_.post(updated("D2", "A", ArbitrationMode::ConnectableRequired));
    (void) dispatcher_.post(Notification::Unavailable{"D1"});
    (void) dispatcher_.post(Notification::ObserverChanged{"A", ObserverEvent::Removed});

    EXPECT_CALL(*subscriber_, onSightingUpdated("D1", _));
    EXPECT_CALL(*subscriber_, onUnavailable("D1"));
    EXPECT_CALL(*subscriber_, onObserverChanged("A", ObserverEvent::Removed));

    EXPECT_CALL(*device_sub, onSightingUpdated("D1", _));
    EXPECT_CALL(*device_sub, onUnavailable("D1"));

    EXPECT_CALL(*connectable_sub, onSightingUpdated("D2", _));
    EXPECT_CALL(*connectable_sub, onUnavailable("D1"));
    EXPECT_CALL(*connectable_sub, onObserverChanged("A", ObserverEvent::Removed));

    EXPECT_THAT(dispatcher_.dispatch(), 4);
}

TEST_F(TestNotificationDispatcher, unsubscribe)
{
    const auto id = dispatcher_.subscribe(subscriber_, {});
    EXPECT_THAT(dispatcher_.subscriberCount(), 1);

    EXPECT_THAT(dispatcher_.unsubscribe(id), IsTrue());
    EXPECT_THAT(dispatcher_.unsubscribe(id), IsFalse());
    EXPECT_THAT(dispatcher_.subscriberCount(), 0);

    (void) dispatcher_.post(Notification::Unavailable{"D"});
    EXPECT_THAT(dispatcher_.dispatch(), 1);
}

TEST_F(TestNotificationDispatcher, overflow_drops_oldest_update)
{
    (void) dispatcher_.subscribe(subscriber_, {});

    for (int i = 0; i < 4; ++i)
    {
        EXPECT_THAT(dispatcher_.post(updated("D" + std::to_string(i), "A")), IsTrue());
    }
    EXPECT_THAT(dispatcher_.post(updated("D4", "A")), IsFalse());
    EXPECT_THAT(dispatcher_.post(updated("D5", "A")), IsFalse());
    EXPECT_THAT(dispatcher_.dropped(), 2);
    EXPECT_THAT(dispatcher_.pending(), 4);

    InSequence seq;
    EXPECT_CALL(*subscriber_, onSightingUpdated("D2", _));
    EXPECT_CALL(*subscriber_, onSightingUpdated("D3", _));
    EXPECT_CALL(*subscriber_, onSightingUpdated("D4", _));
    EXPECT_CALL(*subscriber_, onSightingUpdated("D5", _));
    EXPECT_THAT(dispatcher_.dispatch(), 4);
}

TEST_F(TestNotificationDispatcher, overflow_supersedes_update_of_same_device)
{
    (void) dispatcher_.subscribe(subscriber_, {});

    for (int i = 0; i < 4; ++i)
    {
        (void) dispatcher_.post(updated("D" + std::to_string(i), "A"));
    }
    EXPECT_THAT(dispatcher_.post(updated("D2", "B")), IsFalse());

    InSequence seq;
    EXPECT_CALL(*subscriber_, onSightingUpdated("D0", _));
    EXPECT_CALL(*subscriber_, onSightingUpdated("D1", _));
    EXPECT_CALL(*subscriber_, onSightingUpdated("D3", _));
    EXPECT_CALL(*subscriber_, onSightingUpdated("D2", RecordFrom("B")));
    EXPECT_THAT(dispatcher_.dispatch(), 4);
}

TEST_F(TestNotificationDispatcher, overflow_keeps_losses_and_revocations)
{
    MockFunction<void(const SlotToken&, const DeviceId&)> handler;
    (void) dispatcher_.subscribe(subscriber_, {});

    for (int i = 0; i < 6; ++i)
    {
        EXPECT_THAT(dispatcher_.post(Notification::Unavailable{"D" + std::to_string(i)}), IsTrue());
    }
    for (std::uint64_t serial = 1; serial <= 3; ++serial)
    {
        EXPECT_THAT(dispatcher_.post(Notification::SlotRevoked{SlotToken{"A", serial}, "D", handler.AsStdFunction()}),
                    IsTrue());
    }
    EXPECT_THAT(dispatcher_.post(Notification::ObserverChanged{"A", ObserverEvent::Removed}), IsTrue());
    EXPECT_THAT(dispatcher_.post(updated("D9", "B")), IsTrue());
    EXPECT_THAT(dispatcher_.dropped(), 0);
    EXPECT_THAT(dispatcher_.pending(), 11);

    EXPECT_CALL(*subscriber_, onUnavailable(_)).Times(6);
    EXPECT_CALL(handler, Call(Field(&SlotToken::observer, "A"), "D")).Times(3);
    EXPECT_CALL(*subscriber_, onObserverChanged("A", ObserverEvent::Removed));
    EXPECT_CALL(*subscriber_, onSightingUpdated("D9", _));
    EXPECT_THAT(dispatcher_.dispatch(), 11);
}

TEST_F(TestNotificationDispatcher, shrinking_capacity)
{
    for (int i = 0; i < 4; ++i)
    {
        (void) dispatcher_.post(updated("D" + std::to_string(i), "A"));
    }
    (void) dispatcher_.post(Notification::Unavailable{"D0"});
    dispatcher_.setQueueCapacity(2);
    EXPECT_THAT(dispatcher_.pending(), 3);
    EXPECT_THAT(dispatcher_.dropped(), 2);

    EXPECT_THAT(dispatcher_.post(updated("D4", "A")), IsFalse());
    EXPECT_THAT(dispatcher_.pending(), 3);
    EXPECT_THAT(dispatcher_.dropped(), 3);
}

TEST_F(TestNotificationDispatcher, throwing_subscriber_does_not_break_dispatch)
{
    const auto other = std::make_shared<StrictMock<SubscriberMock>>();
    (void) dispatcher_.subscribe(subscriber_, {});
    (void) dispatcher_.subscribe(other, {});

    (void) dispatcher_.post(Notification::Unavailable{"D1"});
    (void) dispatcher_.post(Notification::Unavailable{"D2"});

    EXPECT_CALL(*subscriber_, onUnavailable("D1")).WillOnce(Throw(std::runtime_error("boom")));
    EXPECT_CALL(*subscriber_, onUnavailable("D2"));
    EXPECT_CALL(*other, onUnavailable("D1"));
    EXPECT_CALL(*other, onUnavailable("D2"));
    EXPECT_THAT(dispatcher_.dispatch(), 2);
}

TEST_F(TestNotificationDispatcher, slot_revoked_calls_handler)
{
    MockFunction<void(const SlotToken&, const DeviceId&)> handler;

    const SlotToken token{"A", 7};
    (void) dispatcher_.post(Notification::SlotRevoked{token, "D", handler.AsStdFunction()});
    (void) dispatcher_.post(Notification::SlotRevoked{token, "D", nullptr});

    EXPECT_CALL(handler, Call(token, "D")).Times(1);
    EXPECT_THAT(dispatcher_.dispatch(), 2);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
