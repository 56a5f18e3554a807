/**
 * @file SpikerDecoder.cpp
 * @brief Implementation of the SpikerBox frame decoder.
 */

#include "spk/eog/source/SpikerDecoder.hpp"

namespace spk::eog::source {

SpikerDecoder::SpikerDecoder(float offset) noexcept
    : _offset(offset)
{
}

std::size_t SpikerDecoder::decode(std::span<const std::uint8_t> bytes, std::vector<float> &out)
{
    std::size_t produced = 0;
    for (const std::uint8_t byte : bytes) {
        if (byte & kSpikerFrameMarker) {
            if (_pendingHigh)
                ++_skipped;
            _pendingHigh = byte;
            continue;
        }
        if (!_pendingHigh) {
            ++_skipped;
            continue;
        }
        out.push_back(static_cast<float>(frameValue(*_pendingHigh, byte)) - _offset);
        _pendingHigh.reset();
        ++produced;
    }
    return produced;
}

void SpikerDecoder::reset() noexcept
{
    _pendingHigh.reset();
}

} // namespace spk::eog::source
