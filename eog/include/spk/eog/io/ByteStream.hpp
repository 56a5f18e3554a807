/**
 * @file ByteStream.hpp
 * @brief Byte-aligned little-endian writer/reader for binary archives.
 *
 * Used by the model archive. Every multi-byte value is stored
 * little-endian regardless of the host so that archives move between
 * machines. Reads are bounds-checked and fail with kFileParseError.
 */

#pragma once

#include "spk/core/NonCopyable.hpp"
#include "spk/core/Types.hpp"
#include "spk/eog/core/Error.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace spk::eog::io {

class ByteWriter final : public core::NonCopyable<ByteWriter> {
public:
    ByteWriter() = default;

    void writeU8(core::u8 value);
    void writeU32(core::u32 value);
    void writeU64(core::u64 value);
    void writeI32(core::i32 value);
    void writeF64(double value);

    /// Length-prefixed (u32) UTF-8 string.
    void writeString(std::string_view value);

    /// Raw bytes, no length prefix.
    void writeBytes(std::span<const std::byte> bytes);

    /// Values only, no length prefix.
    void writeF64Array(std::span<const double> values);

    [[nodiscard]] std::span<const std::byte> data() const noexcept { return _buffer; }
    [[nodiscard]] std::size_t size() const noexcept { return _buffer.size(); }

    /// Moves the buffer out, leaving the writer empty.
    [[nodiscard]] std::vector<std::byte> take() noexcept;

private:
    std::vector<std::byte> _buffer;
};

class ByteReader final {
public:
    explicit ByteReader(std::span<const std::byte> data) noexcept;

    [[nodiscard]] Expected<core::u8> readU8();
    [[nodiscard]] Expected<core::u32> readU32();
    [[nodiscard]] Expected<core::u64> readU64();
    [[nodiscard]] Expected<core::i32> readI32();
    [[nodiscard]] Expected<double> readF64();
    [[nodiscard]] Expected<std::string> readString();
    [[nodiscard]] Expected<std::vector<std::byte>> readBytes(std::size_t count);
    [[nodiscard]] Expected<std::vector<double>> readF64Array(std::size_t count);

    [[nodiscard]] std::size_t remaining() const noexcept { return _data.size() - _offset; }
    [[nodiscard]] bool atEnd() const noexcept { return _offset == _data.size(); }

private:
    [[nodiscard]] ExpectedVoid require(std::size_t count) const;
    [[nodiscard]] core::u64 readLittle(std::size_t count) noexcept;

    std::span<const std::byte> _data;
    std::size_t _offset = 0;
};

} // namespace spk::eog::io
