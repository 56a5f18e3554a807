/**
 * @file ByteStream.cpp
 * @brief Implementation of the little-endian byte writer/reader.
 */

#include "spk/eog/io/ByteStream.hpp"

#include <bit>
#include <format>
#include <utility>

namespace spk::eog::io {

namespace {

void appendLittle(std::vector<std::byte> &buffer, core::u64 value, std::size_t count)
{
    for (std::size_t i = 0; i < count; ++i)
        buffer.push_back(static_cast<std::byte>((value >> (8 * i)) & 0xFF));
}

} // namespace

// ─── ByteWriter ──────────────────────────────────────────────────────────────

void ByteWriter::writeU8(core::u8 value)   { appendLittle(_buffer, value, 1); }
void ByteWriter::writeU32(core::u32 value) { appendLittle(_buffer, value, 4); }
void ByteWriter::writeU64(core::u64 value) { appendLittle(_buffer, value, 8); }

void ByteWriter::writeI32(core::i32 value)
{
    writeU32(static_cast<core::u32>(value));
}

void ByteWriter::writeF64(double value)
{
    writeU64(std::bit_cast<core::u64>(value));
}

void ByteWriter::writeString(std::string_view value)
{
    writeU32(static_cast<core::u32>(value.size()));
    writeBytes(std::as_bytes(std::span<const char>(value.data(), value.size())));
}

void ByteWriter::writeBytes(std::span<const std::byte> bytes)
{
    _buffer.insert(_buffer.end(), bytes.begin(), bytes.end());
}

void ByteWriter::writeF64Array(std::span<const double> values)
{
    _buffer.reserve(_buffer.size() + values.size() * sizeof(double));
    for (const double v : values)
        writeF64(v);
}

std::vector<std::byte> ByteWriter::take() noexcept
{
    return std::exchange(_buffer, {});
}

// ─── ByteReader ──────────────────────────────────────────────────────────────

ByteReader::ByteReader(std::span<const std::byte> data) noexcept
    : _data(data)
{
}

ExpectedVoid ByteReader::require(std::size_t count) const
{
    if (count > remaining()) {
        return std::unexpected(
            Error::make(ErrorCode::kFileParseError,
                std::format("archive truncated: need {} bytes at offset {}, {} left", count, _offset, remaining())));
    }
    return {};
}

core::u64 ByteReader::readLittle(std::size_t count) noexcept
{
    core::u64 value = 0;
    for (std::size_t i = 0; i < count; ++i)
        value |= static_cast<core::u64>(_data[_offset + i]) << (8 * i);
    _offset += count;
    return value;
}

Expected<core::u8> ByteReader::readU8()
{
    if (auto ok = require(1); !ok)
        return std::unexpected(ok.error());
    return static_cast<core::u8>(readLittle(1));
}

Expected<core::u32> ByteReader::readU32()
{
    if (auto ok = require(4); !ok)
        return std::unexpected(ok.error());
    return static_cast<core::u32>(readLittle(4));
}

Expected<core::u64> ByteReader::readU64()
{
    if (auto ok = require(8); !ok)
        return std::unexpected(ok.error());
    return readLittle(8);
}

Expected<core::i32> ByteReader::readI32()
{
    return readU32().transform([](core::u32 v) { return static_cast<core::i32>(v); });
}

Expected<double> ByteReader::readF64()
{
    return readU64().transform([](core::u64 v) { return std::bit_cast<double>(v); });
}

Expected<std::string> ByteReader::readString()
{
    auto length = readU32();
    if (!length)
        return std::unexpected(length.error());
    if (auto ok = require(*length); !ok)
        return std::unexpected(ok.error());

    std::string value(reinterpret_cast<const char *>(_data.data() + _offset), *length);
    _offset += *length;
    return value;
}

Expected<std::vector<std::byte>> ByteReader::readBytes(std::size_t count)
{
    if (auto ok = require(count); !ok)
        return std::unexpected(ok.error());

    std::vector<std::byte> out(_data.begin() + static_cast<long>(_offset),
                               _data.begin() + static_cast<long>(_offset + count));
    _offset += count;
    return out;
}

Expected<std::vector<double>> ByteReader::readF64Array(std::size_t count)
{
    if (count > remaining() / sizeof(double)) {
        return std::unexpected(
            Error::make(ErrorCode::kFileParseError,
                std::format("archive truncated: {} doubles requested, {} bytes left", count, remaining())));
    }

    std::vector<double> out(count);
    for (auto &v : out)
        v = std::bit_cast<double>(readLittle(8));
    return out;
}

} // namespace spk::eog::io
