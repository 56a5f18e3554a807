/**
 * @file Recording.cpp
 * @brief Extension-based recording loader and .npy capture writer.
 */

#include "spk/eog/io/Recording.hpp"

#include "spk/eog/io/NpyFile.hpp"
#include "spk/eog/io/WavFile.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <string>

namespace spk::eog::io {

namespace {

std::string lowerExtension(const std::filesystem::path &path)
{
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // anonymous namespace

Expected<signal::SignalBuffer> loadRecording(const std::filesystem::path &path, const RecordingOptions &options)
{
    const std::string ext = lowerExtension(path);

    if (ext == ".wav")
        return readWav(path, options.channel);

    if (ext != ".npy") {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidArgument,
                std::format("{}: unsupported recording format (expected .wav or .npy)", path.string())));
    }

    auto array = readNpy(path);
    if (!array)
        return std::unexpected(array.error());

    if (options.channel >= array->rows()) {
        return std::unexpected(
            Error::make(ErrorCode::kOutOfRange,
                std::format("{}: row {} requested, array has {}", path.string(), options.channel, array->rows())));
    }

    const auto row = array->row(options.channel);
    std::vector<float> samples(row.size());
    std::transform(row.begin(), row.end(), samples.begin(), [](double x) { return static_cast<float>(x); });
    return signal::SignalBuffer::create(std::move(samples), options.npySampleRate);
}

ExpectedVoid saveRecording(const std::filesystem::path &path, const signal::SignalBuffer &signal)
{
    if (lowerExtension(path) != ".npy") {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidArgument,
                std::format("{}: recordings are saved as .npy", path.string())));
    }
    if (signal.empty()) {
        return std::unexpected(
            Error::make(ErrorCode::kEmptyInput, std::format("{}: nothing was recorded", path.string())));
    }

    const auto samples = signal.samples();
    NpyArray array;
    array.shape = {samples.size()};
    array.data.assign(samples.begin(), samples.end());
    return writeNpy(path, array);
}

} // namespace spk::eog::io
