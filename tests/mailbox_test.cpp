#include <gtest/gtest.h>
#include "protocol.hpp"
#include "test_support.hpp"

TEST(MailboxTest, AppendsInArrivalOrder) {
    Mailbox mailbox("1");
    mailbox.add_claim("a");
    mailbox.add_message(make_message("a", "pake"));
    mailbox.add_message(make_message("a", "version"));

    auto log = mailbox.messages();
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0].phase, "pake");
    EXPECT_EQ(log[1].phase, "version");
}

TEST(MailboxTest, SubscribeReplaysThenForwards) {
    Mailbox mailbox("1");
    mailbox.add_claim("a");
    mailbox.add_message(make_message("a", "m1"));
    mailbox.add_message(make_message("a", "m2"));

    auto subscriber = std::make_shared<RecordingSubscriber>();
    mailbox.subscribe(subscriber);
    EXPECT_EQ(subscriber->phases(), (std::vector<std::string>{"m1", "m2"}));

    mailbox.add_message(make_message("b", "m3"));
    EXPECT_EQ(subscriber->phases(), (std::vector<std::string>{"m1", "m2", "m3"}));
}

TEST(MailboxTest, FanOutReachesEverySubscriber) {
    Mailbox mailbox("1");
    mailbox.add_claim("a");
    auto first = std::make_shared<RecordingSubscriber>();
    auto second = std::make_shared<RecordingSubscriber>();
    mailbox.subscribe(first);
    mailbox.subscribe(second);

    mailbox.add_message(make_message("a", "pake"));
    EXPECT_EQ(first->phases().size(), 1u);
    EXPECT_EQ(second->phases().size(), 1u);
}

TEST(MailboxTest, UnsubscribeStopsDelivery) {
    Mailbox mailbox("1");
    mailbox.add_claim("a");
    auto subscriber = std::make_shared<RecordingSubscriber>();
    mailbox.subscribe(subscriber);
    mailbox.unsubscribe(subscriber.get());

    mailbox.add_message(make_message("a", "pake"));
    EXPECT_TRUE(subscriber->phases().empty());
    EXPECT_EQ(mailbox.subscriber_count(), 0u);
}

TEST(MailboxTest, ExpiredSubscribersAreDropped) {
    Mailbox mailbox("1");
    mailbox.add_claim("a");
    {
        auto subscriber = std::make_shared<RecordingSubscriber>();
        mailbox.subscribe(subscriber);
    }
    EXPECT_EQ(mailbox.subscriber_count(), 1u);
    mailbox.add_message(make_message("a", "pake"));
    EXPECT_EQ(mailbox.subscriber_count(), 0u);
}

TEST(MailboxTest, ResubscribeReplaysAgainWithoutDoubleDelivery) {
    Mailbox mailbox("1");
    mailbox.add_claim("a");
    mailbox.add_message(make_message("a", "m1"));
    auto subscriber = std::make_shared<RecordingSubscriber>();
    mailbox.subscribe(subscriber);
    mailbox.subscribe(subscriber);
    EXPECT_EQ(mailbox.subscriber_count(), 1u);

    mailbox.add_message(make_message("a", "m2"));
    EXPECT_EQ(subscriber->phases(), (std::vector<std::string>{"m1", "m1", "m2"}));
}

TEST(MailboxTest, CountsClaimsAndDistinctSides) {
    Mailbox mailbox("1");
    mailbox.add_claim("a");
    mailbox.add_claim("a");
    EXPECT_EQ(mailbox.claim_count(), 2u);
    EXPECT_EQ(mailbox.distinct_sides(), 1u);

    mailbox.add_claim("b");
    EXPECT_EQ(mailbox.distinct_sides(), 2u);
    EXPECT_TRUE(mailbox.has_claim("b"));
    EXPECT_FALSE(mailbox.has_claim("c"));
}

TEST(MailboxTest, DeletedOnlyWhenLastClaimReleased) {
    Mailbox mailbox("1");
    mailbox.add_claim("a");
    mailbox.add_claim("b");
    mailbox.add_message(make_message("a", "pake"));
    auto subscriber = std::make_shared<RecordingSubscriber>();
    mailbox.subscribe(subscriber);

    EXPECT_EQ(mailbox.release("a"), ReleaseStatus::Waiting);
    EXPECT_FALSE(mailbox.closed());
    EXPECT_TRUE(subscriber->closed().empty());

    EXPECT_EQ(mailbox.release("b"), ReleaseStatus::Deleted);
    EXPECT_TRUE(mailbox.closed());
    EXPECT_EQ(subscriber->closed(), (std::vector<std::string>{"1"}));
    EXPECT_EQ(mailbox.message_count(), 0u);
    EXPECT_EQ(mailbox.subscriber_count(), 0u);
}

TEST(MailboxTest, ReleaseWithoutClaimFails) {
    Mailbox mailbox("1");
    mailbox.add_claim("a");
    try {
        mailbox.release("b");
        FAIL() << "release by an unclaimed side succeeded";
    } catch (const ProtocolError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::NotClaimed);
    }
    EXPECT_EQ(mailbox.claim_count(), 1u);
}

TEST(MailboxTest, MessageJson) {
    MailboxMessage message = make_message("a1", "pake", "ab12");
    message.msg_id = "m7";
    nlohmann::json j = message;
    EXPECT_EQ(j["side"], "a1");
    EXPECT_EQ(j["phase"], "pake");
    EXPECT_EQ(j["body"], "ab12");
    EXPECT_EQ(j["serverRx"], 1000.0);
    EXPECT_EQ(j["id"], "m7");
}
