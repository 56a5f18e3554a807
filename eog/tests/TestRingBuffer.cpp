/**
 * @file TestRingBuffer.cpp
 * @brief Unit tests for dsp::RingBuffer.
 */

#include <catch2/catch_test_macros.hpp>

#include "spk/eog/dsp/RingBuffer.hpp"

#include <thread>
#include <vector>

namespace spk::eog {

using namespace eog::dsp;

TEST_CASE("RingBuffer basic push and pop", "[dsp][ringbuffer]")
{
    RingBuffer<int, 64> buffer;

    REQUIRE(buffer.empty());
    REQUIRE(buffer.capacity() == 64);

    REQUIRE(buffer.push(42));
    REQUIRE(buffer.size() == 1);

    int val = 0;
    REQUIRE(buffer.pop(val));
    REQUIRE(val == 42);
    REQUIRE(buffer.empty());
    REQUIRE_FALSE(buffer.pop(val));
}

TEST_CASE("RingBuffer bulk transfer keeps order and stops when full", "[dsp][ringbuffer]")
{
    RingBuffer<float, 8> buffer;

    const std::vector<float> in = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    REQUIRE(buffer.pushBulk(in) == 8);

    std::vector<float> out(5);
    REQUIRE(buffer.popBulk(out) == 5);
    REQUIRE(out == std::vector<float>{1, 2, 3, 4, 5});

    std::vector<float> rest(10);
    REQUIRE(buffer.popBulk(rest) == 3);
    REQUIRE(rest[2] == 8.0f);
}

TEST_CASE("RingBuffer drain retrieves all elements", "[dsp][ringbuffer]")
{
    RingBuffer<int, 128> buffer;
    for (int i = 0; i < 10; ++i)
        REQUIRE(buffer.push(i));

    std::vector<int> drained;
    const auto count = buffer.drain([&](int v) { drained.push_back(v); });

    REQUIRE(count == 10);
    for (int i = 0; i < 10; ++i)
        REQUIRE(drained[static_cast<std::size_t>(i)] == i);
}

TEST_CASE("RingBuffer transfers between two threads", "[dsp][ringbuffer]")
{
    constexpr int kCount = 100000;
    RingBuffer<int, 1024> buffer;

    std::jthread producer([&buffer] {
        for (int i = 0; i < kCount; ++i)
            while (!buffer.push(i))
                std::this_thread::yield();
    });

    int expected = 0;
    while (expected < kCount) {
        int v = 0;
        if (buffer.pop(v)) {
            REQUIRE(v == expected);
            ++expected;
        }
    }
    REQUIRE(buffer.empty());
}

} // namespace spk::eog
