#include <gtest/gtest.h>
#include "../../src/event/sequencing_policy.h"
#include "absl/container/flat_hash_set.h"

using namespace Cadence;

namespace {
class PlainEvent : public Event {};

class AccountOpened : public DomainEvent {
public:
    using DomainEvent::DomainEvent;
};
}

TEST(SequenceKeyTest, EqualityIsByValue) {
    EXPECT_EQ(SequenceKey("order-1"), SequenceKey(std::string("order-") + "1"));
    EXPECT_NE(SequenceKey("order-1"), SequenceKey("order-2"));
    EXPECT_EQ(SequenceKey(int64_t{42}), SequenceKey(int64_t{42}));
    // Numeric and string keys never collide
    EXPECT_NE(SequenceKey(int64_t{42}), SequenceKey("42"));
}

TEST(SequenceKeyTest, HashesConsistentlyWithEquality) {
    absl::flat_hash_set<SequenceKey> keys;
    keys.insert(SequenceKey("a"));
    keys.insert(SequenceKey(std::string("a")));
    keys.insert(SequenceKey(int64_t{7}));
    keys.insert(SequenceKey("7"));

    EXPECT_EQ(keys.size(), 3);
    EXPECT_TRUE(keys.contains(SequenceKey(int64_t{7})));
}

TEST(SequenceKeyTest, PrintsItsValue) {
    EXPECT_EQ(SequenceKey("agg-9").ToString(), "agg-9");
    EXPECT_EQ(SequenceKey(int64_t{-3}).ToString(), "-3");
    EXPECT_TRUE(SequenceKey(int64_t{1}).IsNumeric());
    EXPECT_FALSE(SequenceKey("1").IsNumeric());
}

TEST(SequencingPolicyTest, FullConcurrencyNeverSequences) {
    FullConcurrencyPolicy policy;
    EXPECT_FALSE(policy.GetSequenceKeyFor(PlainEvent()).has_value());
    EXPECT_FALSE(policy.GetSequenceKeyFor(AccountOpened("acc-1", 0)).has_value());
}

TEST(SequencingPolicyTest, SequentialUsesOneKeyForEverything) {
    SequentialPolicy policy;
    auto first = policy.GetSequenceKeyFor(PlainEvent());
    auto second = policy.GetSequenceKeyFor(AccountOpened("acc-1", 0));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
}

TEST(SequencingPolicyTest, PerAggregateKeysOnAggregateIdentifier) {
    SequentialPerAggregatePolicy policy;

    auto a1 = policy.GetSequenceKeyFor(AccountOpened("acc-1", 0));
    auto a1_again = policy.GetSequenceKeyFor(AccountOpened("acc-1", 1));
    auto a2 = policy.GetSequenceKeyFor(AccountOpened("acc-2", 0));
    ASSERT_TRUE(a1.has_value());
    ASSERT_TRUE(a2.has_value());
    EXPECT_EQ(*a1, *a1_again);
    EXPECT_NE(*a1, *a2);

    EXPECT_FALSE(policy.GetSequenceKeyFor(PlainEvent()).has_value());
}

TEST(EventTest, ExposesRuntimeType) {
    std::shared_ptr<const Event> event = std::make_shared<AccountOpened>("acc-1", 3);
    EXPECT_EQ(event->Type(), std::type_index(typeid(AccountOpened)));
    EXPECT_NE(event->Type(), std::type_index(typeid(DomainEvent)));
}
