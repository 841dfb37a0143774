#include <string>
#include <utility>
#include <catch2/catch_test_macros.hpp>

#include "util/bounded_queue.hpp"

using namespace wgpeer;

TEST_CASE("bounded queue refuses when full") {
    BoundedQueue<int, 3> q;
    REQUIRE(q.try_push(1));
    REQUIRE(q.try_emplace(2));
    REQUIRE(q.try_emplace(3));
    REQUIRE(q.full());
    REQUIRE_FALSE(q.try_emplace(4));
    REQUIRE(q.size() == 3);
    REQUIRE(q.front() == 1);
    REQUIRE(q.try_pop() == 1);
    REQUIRE(q.try_emplace(4));
}

TEST_CASE("bounded queue evicts the oldest item") {
    BoundedQueue<std::pair<int, std::string>, 2> q;
    REQUIRE(q.emplace_evict(1, "a"));
    REQUIRE(q.emplace_evict(2, "b"));
    REQUIRE_FALSE(q.emplace_evict(3, "c"));
    REQUIRE(q.size() == 2);

    auto first = q.try_pop();
    REQUIRE(first);
    REQUIRE(first->first == 2);
    REQUIRE(q.front().second == "c");
    REQUIRE(q.emplace_evict(4, "d"));
    REQUIRE(q.size() == 2);
    q.clear();
    REQUIRE(q.empty());
    REQUIRE_FALSE(q.try_pop());
}
