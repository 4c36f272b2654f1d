/**
 * netsdr-client
 */

#include <doctest/doctest.h>

#include <stdint.h>

#include <chrono>
#include <thread>
#include <vector>

#include "message_queue.hpp"

TEST_CASE("Items come out in the order they went in") {
    MessageQueue<int> queue;
    CHECK(queue.push(1) == QUEUE_PUSHED);
    CHECK(queue.push(2) == QUEUE_PUSHED);
    queue.close();

    int item = 0;
    REQUIRE(queue.pop(&item));
    CHECK(item == 1);
    REQUIRE(queue.pop(&item));
    CHECK(item == 2);
    CHECK_FALSE(queue.pop(&item));
}

TEST_CASE("Closing drains remaining items and releases a blocked consumer") {
    MessageQueue<std::vector<uint8_t> > queue;
    REQUIRE(queue.push({0x01}) == QUEUE_PUSHED);

    std::vector<std::vector<uint8_t> > popped;
    std::thread consumer([&queue, &popped]() {
        std::vector<uint8_t> item;
        while (queue.pop(&item)) {
            popped.push_back(item);
        }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.close();
    consumer.join();

    REQUIRE(popped.size() == 1);
    CHECK(popped[0] == std::vector<uint8_t>{0x01});
    CHECK(queue.push({0x02}) == QUEUE_CLOSED);
    std::vector<uint8_t> item;
    CHECK_FALSE(queue.pop(&item));
}

TEST_CASE("A bounded queue rejects items beyond its capacity") {
    MessageQueue<int> queue(2);
    CHECK(queue.push(1) == QUEUE_PUSHED);
    CHECK(queue.push(2) == QUEUE_PUSHED);
    CHECK(queue.push(3) == QUEUE_FULL);

    int item = 0;
    REQUIRE(queue.pop(&item));
    CHECK(item == 1);
    // popping frees a place
    CHECK(queue.push(4) == QUEUE_PUSHED);
    CHECK(queue.push(5) == QUEUE_FULL);

    queue.set_capacity(0);
    CHECK(queue.push(6) == QUEUE_PUSHED);

    queue.close();
    CHECK(queue.push(7) == QUEUE_CLOSED);
    std::vector<int> rest;
    while (queue.pop(&item)) {
        rest.push_back(item);
    }
    CHECK(rest == std::vector<int>{2, 4, 6});
}
