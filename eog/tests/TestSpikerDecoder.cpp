/**
 * @file TestSpikerDecoder.cpp
 * @brief Unit tests for the SpikerBox frame decoder.
 */

#include <catch2/catch_test_macros.hpp>

#include "spk/eog/source/SpikerDecoder.hpp"

#include <vector>

namespace spk::eog {

using namespace eog::source;

namespace {

void appendFrame(std::vector<std::uint8_t> &bytes, std::uint16_t value)
{
    bytes.push_back(static_cast<std::uint8_t>(kSpikerFrameMarker | ((value >> 7) & 0x7F)));
    bytes.push_back(static_cast<std::uint8_t>(value & 0x7F));
}

} // namespace

TEST_CASE("SpikerDecoder::frameValue", "[source][spiker]")
{
    REQUIRE(SpikerDecoder::frameValue(0x80, 0x00) == 0);
    REQUIRE(SpikerDecoder::frameValue(0x84, 0x00) == 512);
    REQUIRE(SpikerDecoder::frameValue(0x87, 0x7F) == 1023);
    REQUIRE(SpikerDecoder::frameValue(0x81, 0x05) == 133);
}

TEST_CASE("SpikerDecoder decodes and centres frames", "[source][spiker]")
{
    std::vector<std::uint8_t> bytes;
    for (std::uint16_t v : {512, 0, 1023, 700})
        appendFrame(bytes, v);

    SpikerDecoder decoder;
    std::vector<float> out;
    REQUIRE(decoder.decode(bytes, out) == 4);
    REQUIRE(out == std::vector<float>{0.0f, -512.0f, 511.0f, 188.0f});
    REQUIRE(decoder.skippedBytes() == 0);

    SpikerDecoder raw(0.0f);
    std::vector<float> rawOut;
    REQUIRE(raw.decode(bytes, rawOut) == 4);
    REQUIRE(rawOut.front() == 512.0f);
}

TEST_CASE("SpikerDecoder resynchronises on stray bytes", "[source][spiker]")
{
    SpikerDecoder decoder(0.0f);
    std::vector<float> out;

    // Leading low byte, then a high byte replaced by another one.
    const std::vector<std::uint8_t> bytes = {0x15, 0x83, 0x81, 0x05, 0x22};
    REQUIRE(decoder.decode(bytes, out) == 1);
    REQUIRE(out == std::vector<float>{133.0f});
    REQUIRE(decoder.skippedBytes() == 3);
}

TEST_CASE("SpikerDecoder keeps a frame split across reads", "[source][spiker]")
{
    SpikerDecoder decoder(0.0f);
    std::vector<float> out;

    const std::vector<std::uint8_t> first = {0x81, 0x05, 0x82};
    const std::vector<std::uint8_t> second = {0x01};
    REQUIRE(decoder.decode(first, out) == 1);
    REQUIRE(decoder.decode(second, out) == 1);
    REQUIRE(out == std::vector<float>{133.0f, 257.0f});

    SECTION("reset drops the pending half")
    {
        const std::vector<std::uint8_t> half = {0x82};
        REQUIRE(decoder.decode(half, out) == 0);
        decoder.reset();
        REQUIRE(decoder.decode(second, out) == 0);
        REQUIRE(decoder.skippedBytes() == 1);
    }
}

} // namespace spk::eog
