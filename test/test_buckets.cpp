// PeerLend - Matching Queue Tests

#include <catch2/catch.hpp>

#include "test_support.hpp"

using namespace peerlend;
using peerlend::test::addr;

TEST_CASE("Bucket of a value", "[buckets]") {
    REQUIRE(MatchingQueue::bucket_of(1) == 0);
    REQUIRE(MatchingQueue::bucket_of(2) == 1);
    REQUIRE(MatchingQueue::bucket_of(3) == 1);
    REQUIRE(MatchingQueue::bucket_of(1024) == 10);
    REQUIRE(MatchingQueue::bucket_of(U128_MAX) == 127);
}

TEST_CASE("Queue membership and totals", "[buckets]") {
    MatchingQueue q;
    REQUIRE(q.empty());
    REQUIRE_FALSE(q.get_match(100).has_value());

    q.update(addr(1), 100, false);
    q.update(addr(2), 1000, false);
    REQUIRE(q.size() == 2);
    REQUIRE(q.total() == U128(1100));
    REQUIRE(q.value_of(addr(1)) == U128(100));
    REQUIRE(q.value_of(addr(3)) == U128(0));

    SECTION("Zero removes") {
        q.update(addr(1), 0, false);
        REQUIRE_FALSE(q.contains(addr(1)));
        REQUIRE(q.total() == U128(1000));
    }

    SECTION("Zero for an absent user is a no-op") {
        q.update(addr(3), 0, false);
        REQUIRE(q.size() == 2);
    }

    SECTION("Value change moves the total") {
        q.update(addr(2), 400, false);
        REQUIRE(q.total() == U128(500));
        REQUIRE(q.value_of(addr(2)) == U128(400));
    }
}

TEST_CASE("Best-fit counterpart selection", "[buckets]") {
    MatchingQueue q;
    q.update(addr(1), 100, false);   // bucket 6
    q.update(addr(2), 1000, false);  // bucket 9
    q.update(addr(3), 5, false);     // bucket 2

    SECTION("Smallest bucket at or above the amount") {
        REQUIRE(q.get_match(200) == addr(2));
        REQUIRE(q.get_match(3) == addr(3));
        REQUIRE(q.get_match(64) == addr(1));
    }

    SECTION("Largest bucket below when none covers it") {
        REQUIRE(q.get_match(5000) == addr(2));
    }

    SECTION("Users listed largest bucket first") {
        auto users = q.users();
        REQUIRE(users.size() == 3);
        REQUIRE(users[0] == addr(2));
        REQUIRE(users[1] == addr(1));
        REQUIRE(users[2] == addr(3));
    }
}

TEST_CASE("Order within a bucket", "[buckets]") {
    MatchingQueue q;
    q.update(addr(1), 100, false);
    q.update(addr(2), 110, false);

    SECTION("Tail insertion is first come first matched") {
        REQUIRE(q.get_match(100) == addr(1));
    }

    SECTION("Head insertion jumps the queue") {
        q.update(addr(3), 120, true);
        REQUIRE(q.get_match(100) == addr(3));
    }

    SECTION("Same-bucket change keeps the place") {
        q.update(addr(1), 101, false);
        REQUIRE(q.get_match(100) == addr(1));
    }

    SECTION("Bucket change requeues") {
        q.update(addr(1), 200, false);
        REQUIRE(q.get_match(100) == addr(2));
        q.update(addr(1), 90, false);
        REQUIRE(q.get_match(100) == addr(2));
    }
}
