/**
 * @file TestByteStream.cpp
 * @brief Unit tests for io::ByteWriter / io::ByteReader.
 */

#include <catch2/catch_test_macros.hpp>

#include "spk/eog/io/ByteStream.hpp"

namespace spk::eog {

using namespace eog::io;

TEST_CASE("ByteWriter emits little-endian values", "[io][bytes]")
{
    ByteWriter writer;
    writer.writeU32(0x04030201u);
    writer.writeI32(-2);

    const auto data = writer.data();
    REQUIRE(data.size() == 8);
    REQUIRE(static_cast<int>(data[0]) == 1);
    REQUIRE(static_cast<int>(data[3]) == 4);
    REQUIRE(static_cast<int>(data[4]) == 0xFE);
    REQUIRE(static_cast<int>(data[7]) == 0xFF);
}

TEST_CASE("ByteReader reads back what ByteWriter wrote", "[io][bytes]")
{
    ByteWriter writer;
    writer.writeU8(7);
    writer.writeU64(1ull << 40);
    writer.writeF64(-0.125);
    writer.writeString("left");
    const std::vector<double> values = {1.5, 2.5};
    writer.writeF64Array(values);
    const auto bytes = writer.take();
    REQUIRE(writer.size() == 0);

    ByteReader reader(bytes);
    REQUIRE(reader.readU8().value() == 7);
    REQUIRE(reader.readU64().value() == (1ull << 40));
    REQUIRE(reader.readF64().value() == -0.125);
    REQUIRE(reader.readString().value() == "left");
    REQUIRE(reader.readF64Array(2).value() == values);
    REQUIRE(reader.atEnd());
}

TEST_CASE("ByteReader reports truncated input", "[io][bytes]")
{
    ByteWriter writer;
    writer.writeU32(100);
    const auto bytes = writer.take();

    ByteReader reader(bytes);
    auto text = reader.readString();
    REQUIRE_FALSE(text.has_value());
    REQUIRE(text.error().code == ErrorCode::kFileParseError);

    ByteReader again(std::span<const std::byte>(bytes).first(2));
    REQUIRE_FALSE(again.readU32().has_value());
}

} // namespace spk::eog
