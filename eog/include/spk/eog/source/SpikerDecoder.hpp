/**
 * @file SpikerDecoder.hpp
 * @brief Incremental decoder for the SpikerBox 2-byte serial framing.
 *
 * Each sample travels as two bytes. The first has its MSB set and carries
 * the high 7 bits, the second (MSB clear) the low 7 bits:
 * @code
 *   sample = (b0 & 0x7F) << 7 | b1
 * @endcode
 * Bytes that do not belong to a frame are skipped. A frame split across
 * two reads is completed on the next call.
 */

#pragma once

#include "spk/eog/core/Constants.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace spk::eog::source {

class SpikerDecoder {
public:
    /**
     * @param offset Value subtracted from every decoded sample
     */
    explicit SpikerDecoder(float offset = kSpikerAdcMidpoint) noexcept;

    /**
     * @brief Decodes @p bytes, appending the samples to @p out.
     *
     * @return Number of samples appended
     */
    std::size_t decode(std::span<const std::uint8_t> bytes, std::vector<float> &out);

    /// Raw 14-bit value of one frame.
    [[nodiscard]] static constexpr std::uint16_t frameValue(std::uint8_t high, std::uint8_t low) noexcept
    {
        return static_cast<std::uint16_t>(((high & 0x7F) << 7) | (low & 0x7F));
    }

    /// Drops a pending half frame.
    void reset() noexcept;

    /// Bytes discarded so far because they were outside a frame.
    [[nodiscard]] std::size_t skippedBytes() const noexcept { return _skipped; }

private:
    float _offset;
    std::optional<std::uint8_t> _pendingHigh;
    std::size_t _skipped = 0;
};

} // namespace spk::eog::source
