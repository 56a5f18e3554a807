/**
 * @file Constants.hpp
 * @brief Compile-time constants for the EOG event pipeline.
 *
 * Centralizes the physical and algorithmic defaults shared by the scanner,
 * the feature extractor, the classifiers and the SpikerBox decoder.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace spk::eog {

/// Reference rate used by the zero-crossing threshold default (Hz).
inline constexpr float       kReferenceSampleRate    = 500.0f;
/// Zero-crossings tolerated in a reference-length (1 s) window before it is noise.
inline constexpr std::size_t kDefaultThresholdCrossings = 200;
/// Stride when no event was found, as a divisor of the window size.
inline constexpr std::size_t kDefaultIncrementDivisor = 10;

/// Shortest window the catch22 features are defined on (largest lag is 40).
inline constexpr std::size_t kMinFeatureSamples = 50;
inline constexpr std::size_t kFeatureCount      = 22;

inline constexpr std::size_t   kDefaultKnnNeighbours = 5;
inline constexpr std::size_t   kDefaultForestTrees   = 100;
inline constexpr double        kDefaultSvmC          = 1.0;
inline constexpr double        kDefaultTestFraction  = 0.9;
inline constexpr std::uint64_t kDefaultSeed          = 42;

/// Snipper defaults: one-second snippets, 90 % of it after the timestamp.
inline constexpr double kDefaultSnippetSeconds  = 1.0;
inline constexpr double kDefaultRightProportion = 0.9;

/// SpikerBox serial link: 2-byte frames, MSB of the first byte set.
inline constexpr std::uint32_t kSpikerBaudRate    = 230400;
inline constexpr float         kSpikerSampleRate  = 10000.0f;
inline constexpr std::uint8_t  kSpikerFrameMarker = 0x80;
/// Mid-scale of the 10-bit ADC, subtracted so the stream is centred on 0.
inline constexpr float         kSpikerAdcMidpoint = 512.0f;
/// Bytes requested per serial read (about 50 ms of frames).
inline constexpr std::size_t   kSpikerReadChunk   = 1024;
inline constexpr std::size_t   kSpikerRingSlots   = 1 << 16;

} // namespace spk::eog
