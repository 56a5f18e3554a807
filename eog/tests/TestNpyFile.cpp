/**
 * @file TestNpyFile.cpp
 * @brief Unit tests for the .npy reader/writer.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "spk/eog/io/NpyFile.hpp"

#include <cstring>
#include <filesystem>
#include <string>

namespace spk::eog {

using namespace eog::io;
using Catch::Matchers::WithinAbs;

namespace {

/// Builds a version 1.0 image around @p header and the raw @p payload.
std::vector<std::byte> makeNpy(std::string header, const void *payload, std::size_t size)
{
    while ((10 + header.size() + 1) % 64 != 0)
        header += ' ';
    header += '\n';

    std::vector<std::byte> out(10 + header.size() + size);
    const char magic[] = "\x93NUMPY";
    std::memcpy(out.data(), magic, 6);
    out[6] = std::byte{1};
    out[7] = std::byte{0};
    out[8] = static_cast<std::byte>(header.size() & 0xFF);
    out[9] = static_cast<std::byte>(header.size() >> 8);
    std::memcpy(out.data() + 10, header.data(), header.size());
    std::memcpy(out.data() + 10 + header.size(), payload, size);
    return out;
}

} // namespace

TEST_CASE("encodeNpy writes a 64-byte aligned v1.0 header", "[io][npy]")
{
    NpyArray array{{2, 3}, {1.0, 2.0, 3.0, 4.0, 5.0, 6.0}};
    auto bytes = encodeNpy(array);
    REQUIRE(bytes.has_value());

    REQUIRE(static_cast<unsigned char>((*bytes)[0]) == 0x93);
    REQUIRE(static_cast<int>((*bytes)[6]) == 1);
    const std::size_t headerLen = static_cast<std::size_t>((*bytes)[8]) | (static_cast<std::size_t>((*bytes)[9]) << 8);
    REQUIRE((10 + headerLen) % 64 == 0);
    REQUIRE(bytes->size() == 10 + headerLen + 6 * sizeof(double));

    const std::string header(reinterpret_cast<const char *>(bytes->data() + 10), headerLen);
    REQUIRE(header.find("'descr': '<f8'") != std::string::npos);
    REQUIRE(header.find("(2, 3)") != std::string::npos);

    auto decoded = decodeNpy(*bytes);
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == array);
}

TEST_CASE("decodeNpy widens other element types", "[io][npy]")
{
    SECTION("1-D float32")
    {
        const float values[] = {0.5f, -1.25f, 3.0f};
        auto bytes = makeNpy("{'descr': '<f4', 'fortran_order': False, 'shape': (3,), }", values, sizeof(values));
        auto array = decodeNpy(bytes);
        REQUIRE(array.has_value());
        REQUIRE(array->shape == std::vector<std::size_t>{3});
        REQUIRE(array->rows() == 1);
        REQUIRE_THAT(array->data[1], WithinAbs(-1.25, 1e-12));
    }

    SECTION("1-D int16")
    {
        const std::int16_t values[] = {-32768, 0, 1000};
        auto bytes = makeNpy("{'descr': '<i2', 'fortran_order': False, 'shape': (3,), }", values, sizeof(values));
        auto array = decodeNpy(bytes);
        REQUIRE(array.has_value());
        REQUIRE(array->data == std::vector<double>{-32768.0, 0.0, 1000.0});
    }

    SECTION("Fortran order is transposed to row-major")
    {
        const double values[] = {1.0, 4.0, 2.0, 5.0, 3.0, 6.0};
        auto bytes = makeNpy("{'descr': '<f8', 'fortran_order': True, 'shape': (2, 3), }", values, sizeof(values));
        auto array = decodeNpy(bytes);
        REQUIRE(array.has_value());
        REQUIRE(array->data == std::vector<double>{1.0, 2.0, 3.0, 4.0, 5.0, 6.0});
    }
}

TEST_CASE("decodeNpy rejects malformed input", "[io][npy]")
{
    SECTION("bad magic")
    {
        std::vector<std::byte> junk(64, std::byte{0});
        auto array = decodeNpy(junk);
        REQUIRE_FALSE(array.has_value());
        REQUIRE(array.error().code == ErrorCode::kFileParseError);
    }

    SECTION("unsupported dtype")
    {
        const char values[] = {1, 2};
        auto bytes = makeNpy("{'descr': '|b1', 'fortran_order': False, 'shape': (2,), }", values, sizeof(values));
        REQUIRE(decodeNpy(bytes).error().code == ErrorCode::kFileParseError);
    }

    SECTION("truncated payload")
    {
        const double values[] = {1.0, 2.0};
        auto bytes = makeNpy("{'descr': '<f8', 'fortran_order': False, 'shape': (4,), }", values, sizeof(values));
        REQUIRE(decodeNpy(bytes).error().code == ErrorCode::kFileParseError);
    }

    SECTION("shape whose element count wraps around")
    {
        const double values[] = {1.0, 2.0};
        auto bytes = makeNpy("{'descr': '<f8', 'fortran_order': False, 'shape': (2, 9223372036854775808), }",
                             values, sizeof(values));
        auto array = decodeNpy(bytes);
        REQUIRE_FALSE(array.has_value());
        REQUIRE(array.error().code == ErrorCode::kFileParseError);
    }

    SECTION("shape whose byte count wraps around")
    {
        const double values[] = {1.0, 2.0};
        auto bytes = makeNpy("{'descr': '<f8', 'fortran_order': False, 'shape': (2, 2305843009213693952), }",
                             values, sizeof(values));
        auto array = decodeNpy(bytes);
        REQUIRE_FALSE(array.has_value());
        REQUIRE(array.error().code == ErrorCode::kFileParseError);
    }

    SECTION("three dimensions")
    {
        const double values[] = {1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0};
        auto bytes = makeNpy("{'descr': '<f8', 'fortran_order': False, 'shape': (2, 2, 2), }", values, sizeof(values));
        REQUIRE(decodeNpy(bytes).error().code == ErrorCode::kFileParseError);
    }
}

TEST_CASE("writeNpy and readNpy go through the filesystem", "[io][npy]")
{
    const auto path = std::filesystem::temp_directory_path() / "spk_test_array.npy";
    NpyArray array{{2, 2}, {0.1, 0.2, 0.3, 0.4}};

    REQUIRE(writeNpy(path, array).has_value());
    auto loaded = readNpy(path);
    std::filesystem::remove(path);

    REQUIRE(loaded.has_value());
    REQUIRE(*loaded == array);

    auto missing = readNpy("/nonexistent/spk.npy");
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == ErrorCode::kFileNotFound);
}

} // namespace spk::eog
