#include <catch2/catch.hpp>

#include "work_queue.hpp"

#include <numeric>
#include <thread>
#include <vector>

using namespace FontGrep;

TEST_CASE("WorkQueue is FIFO", "[WorkQueue]") {
    WorkQueue<int> queue(4);
    REQUIRE(queue.push(1));
    REQUIRE(queue.push(2));
    REQUIRE(queue.push(3));
    REQUIRE(queue.size() == 3);

    REQUIRE(queue.pop() == 1);
    REQUIRE(queue.pop() == 2);
    REQUIRE(queue.pop() == 3);
}

TEST_CASE("Closing drains remaining items", "[WorkQueue]") {
    WorkQueue<std::string> queue(2);
    REQUIRE(queue.push("a"));
    queue.close();

    REQUIRE(queue.isClosed());
    REQUIRE_FALSE(queue.push("b"));
    REQUIRE(queue.pop() == std::optional<std::string>("a"));
    REQUIRE_FALSE(queue.pop().has_value());
}

TEST_CASE("Close wakes blocked consumers", "[WorkQueue]") {
    WorkQueue<int> queue(1);
    std::optional<int> result = 7;

    std::thread consumer([&] { result = queue.pop(); });
    queue.close();
    consumer.join();

    REQUIRE_FALSE(result.has_value());
}

TEST_CASE("Producers and consumers exchange every item", "[WorkQueue]") {
    constexpr int kItems = 1000;
    constexpr int kConsumers = 4;

    WorkQueue<int> queue(8);
    std::vector<long> sums(kConsumers, 0);

    std::vector<std::thread> consumers;
    for (int i = 0; i < kConsumers; ++i) {
        consumers.emplace_back([&, i] {
            while (auto item = queue.pop()) {
                sums[i] += *item;
            }
        });
    }

    for (int i = 1; i <= kItems; ++i) {
        REQUIRE(queue.push(i));
    }
    queue.close();
    for (auto& consumer : consumers) {
        consumer.join();
    }

    REQUIRE(std::accumulate(sums.begin(), sums.end(), 0L) == static_cast<long>(kItems) * (kItems + 1) / 2);
}
