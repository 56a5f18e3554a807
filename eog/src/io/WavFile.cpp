/**
 * @file WavFile.cpp
 * @brief RIFF/WAVE chunk walker and PCM decoder.
 */

#include "spk/eog/io/WavFile.hpp"

#include <cstring>
#include <format>
#include <fstream>
#include <iterator>
#include <vector>

namespace spk::eog::io {

namespace {

constexpr std::uint16_t kFormatPcm = 1;
constexpr std::uint16_t kFormatFloat = 3;
constexpr std::uint16_t kFormatExtensible = 0xFFFE;

std::uint16_t readU16(const std::byte *p) noexcept
{
    return static_cast<std::uint16_t>(
        static_cast<std::uint16_t>(p[0]) | (static_cast<std::uint16_t>(p[1]) << 8));
}

std::uint32_t readU32(const std::byte *p) noexcept
{
    return static_cast<std::uint32_t>(p[0]) |
           (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) |
           (static_cast<std::uint32_t>(p[3]) << 24);
}

bool tagIs(const std::byte *p, const char (&tag)[5]) noexcept
{
    return std::memcmp(p, tag, 4) == 0;
}

float decodeSample(const std::byte *p, const WavFormat &fmt) noexcept
{
    switch (fmt.bitsPerSample) {
        case 8:
            return (static_cast<float>(static_cast<std::uint8_t>(p[0])) - 128.0f) / 128.0f;
        case 16:
            return static_cast<float>(static_cast<std::int16_t>(readU16(p))) / 32768.0f;
        case 24: {
            std::int32_t v = static_cast<std::int32_t>(
                static_cast<std::uint32_t>(p[0]) |
                (static_cast<std::uint32_t>(p[1]) << 8) |
                (static_cast<std::uint32_t>(p[2]) << 16));
            if (v & 0x00800000)
                v |= static_cast<std::int32_t>(0xFF000000);
            return static_cast<float>(v) / 8388608.0f;
        }
        default: {
            const std::uint32_t raw = readU32(p);
            if (fmt.audioFormat == kFormatFloat) {
                float f;
                std::memcpy(&f, &raw, sizeof(f));
                return f;
            }
            return static_cast<float>(static_cast<double>(static_cast<std::int32_t>(raw)) / 2147483648.0);
        }
    }
}

} // namespace

Expected<signal::SignalBuffer> decodeWav(std::span<const std::byte> bytes, std::size_t channel, const std::string &origin)
{
    const auto fail = [&origin](const std::string &what) {
        return std::unexpected(Error::make(ErrorCode::kFileParseError, origin + ": " + what));
    };

    if (bytes.size() < 12 || !tagIs(bytes.data(), "RIFF") || !tagIs(bytes.data() + 8, "WAVE"))
        return fail("not a RIFF/WAVE file");

    WavFormat fmt;
    bool haveFormat = false;
    std::span<const std::byte> payload;

    std::size_t offset = 12;
    while (offset + 8 <= bytes.size()) {
        const std::byte *chunk = bytes.data() + offset;
        const std::size_t chunkSize = readU32(chunk + 4);
        const std::size_t available = bytes.size() - offset - 8;
        const std::size_t bodySize = chunkSize <= available ? chunkSize : available;

        if (tagIs(chunk, "fmt ")) {
            if (bodySize < 16)
                return fail("format chunk too short");
            fmt.audioFormat = readU16(chunk + 8);
            fmt.channelCount = readU16(chunk + 10);
            fmt.sampleRate = readU32(chunk + 12);
            fmt.bitsPerSample = readU16(chunk + 22);
            if (fmt.audioFormat == kFormatExtensible && bodySize >= 26)
                fmt.audioFormat = readU16(chunk + 32);
            haveFormat = true;
        } else if (tagIs(chunk, "data")) {
            payload = bytes.subspan(offset + 8, bodySize);
        }

        offset += 8 + chunkSize + (chunkSize & 1);
    }

    if (!haveFormat)
        return fail("missing format chunk");
    if (payload.data() == nullptr)
        return fail("missing data chunk");

    const bool intPcm = fmt.audioFormat == kFormatPcm &&
        (fmt.bitsPerSample == 8 || fmt.bitsPerSample == 16 ||
         fmt.bitsPerSample == 24 || fmt.bitsPerSample == 32);
    const bool floatPcm = fmt.audioFormat == kFormatFloat && fmt.bitsPerSample == 32;
    if (!intPcm && !floatPcm) {
        return fail(std::format("unsupported encoding (format {}, {} bits)",
            fmt.audioFormat, fmt.bitsPerSample));
    }
    if (fmt.channelCount == 0 || fmt.sampleRate == 0)
        return fail("zero channels or sample rate");
    if (channel >= fmt.channelCount) {
        return std::unexpected(Error::make(ErrorCode::kOutOfRange,
            std::format("{}: channel {} requested, file has {}", origin, channel, fmt.channelCount)));
    }

    const std::size_t bytesPerSample = fmt.bitsPerSample / 8;
    const std::size_t frameSize = bytesPerSample * fmt.channelCount;
    const std::size_t frames = payload.size() / frameSize;

    std::vector<float> samples(frames);
    for (std::size_t i = 0; i < frames; ++i)
        samples[i] = decodeSample(payload.data() + i * frameSize + channel * bytesPerSample, fmt);

    return signal::SignalBuffer::create(std::move(samples), static_cast<float>(fmt.sampleRate));
}

Expected<signal::SignalBuffer> readWav(const std::filesystem::path &path, std::size_t channel)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(
            Error::make(ErrorCode::kFileNotFound, path.string()));
    }

    std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return decodeWav(std::as_bytes(std::span<const char>(raw)), channel, path.string());
}

} // namespace spk::eog::io
