/**
 * @file Snipper.cpp
 * @brief Implementation of the annotation-driven snippet cutter.
 */

#include "spk/eog/snippet/Snipper.hpp"

#include "spk/core/Log.hpp"
#include "spk/eog/math/Statistics.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <fstream>

namespace spk::eog::snippet {

ExpectedVoid SnipOptions::validate() const
{
    if (!(snippetSeconds > 0.0) || !std::isfinite(snippetSeconds)) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidConfiguration,
                std::format("snippet size must be positive, got {}", snippetSeconds)));
    }
    if (!(rightProportion >= 0.0 && rightProportion <= 1.0)) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidConfiguration,
                std::format("right proportion must lie in [0, 1], got {}", rightProportion)));
    }
    return {};
}

ExpectedVoid SnipperConfig::validate() const
{
    if (auto ok = defaults.validate(); !ok)
        return ok;
    for (const auto &[tag, options] : overrides) {
        if (auto ok = options.validate(); !ok) {
            Error error = ok.error();
            error.message = "tag '" + tag + "': " + error.message;
            return std::unexpected(std::move(error));
        }
    }
    return {};
}

const SnipOptions &SnipperConfig::optionsFor(std::string_view tag) const
{
    const auto it = overrides.find(tag);
    return it != overrides.end() ? it->second : defaults;
}

Expected<TagOptions> loadTagOptions(const std::filesystem::path &path, const SnipOptions &defaults)
{
    std::ifstream file(path);
    if (!file) {
        return std::unexpected(
            Error::make(ErrorCode::kFileNotFound, "snipper config " + path.string()));
    }

    TagOptions options;
    try {
        boost::property_tree::ptree root;
        boost::property_tree::read_json(file, root);
        for (const auto &[tag, node] : root) {
            SnipOptions entry;
            entry.snippetSeconds = node.get<double>("snippet_size", defaults.snippetSeconds);
            entry.rightProportion = node.get<double>("right_proportion", defaults.rightProportion);
            options.insert_or_assign(tag, entry);
        }
    } catch (const boost::property_tree::ptree_error &e) {
        return std::unexpected(
            Error::make(ErrorCode::kFileParseError, std::format("{}: {}", path.string(), e.what())));
    }
    return options;
}

Snipper::Snipper(SnipperConfig config) : _config(std::move(config)) {}

Expected<Snipper> Snipper::create(SnipperConfig config)
{
    if (auto ok = config.validate(); !ok)
        return std::unexpected(ok.error());
    return Snipper(std::move(config));
}

Snipper::Bounds Snipper::boundsFor(const signal::SignalBuffer &signal, double timestamp, const SnipOptions &options)
{
    const double rate = signal.sampleRate();
    const auto nearest = [&](double seconds) {
        const double index = std::round(seconds * rate);
        if (index <= 0.0)
            return std::size_t{0};
        return std::min(static_cast<std::size_t>(index), signal.size());
    };

    const std::size_t a = nearest(timestamp - (1.0 - options.rightProportion) * options.snippetSeconds);
    const std::size_t b = nearest(timestamp + options.rightProportion * options.snippetSeconds);
    return {std::min(a, b), std::max(a, b)};
}

Expected<Snippet> Snipper::cut(const signal::SignalBuffer &signal, Bounds bounds, std::string id, Label label)
{
    if (bounds.end - bounds.begin < 2) {
        return std::unexpected(
            Error::make(ErrorCode::kInsufficientData,
                std::format("{}: fewer than two samples in [{}, {})", id, bounds.begin, bounds.end)));
    }

    auto slice = signal.view(bounds.begin, bounds.end - bounds.begin);
    if (!slice)
        return std::unexpected(slice.error());

    auto normalised = math::Statistics::normaliseAmplitude(*slice);
    if (!normalised) {
        Error error = normalised.error();
        error.message = id + ": " + error.message;
        return std::unexpected(std::move(error));
    }

    std::vector<double> time(normalised->size());
    for (std::size_t i = 0; i < time.size(); ++i)
        time[i] = static_cast<double>(i) / signal.sampleRate();

    return Snippet(std::move(id), std::move(label), std::move(*normalised), std::move(time));
}

Expected<SnipResult> Snipper::snip(
    const signal::SignalBuffer &signal,
    const signal::AnnotationSet &annotations,
    std::string_view recordingName) const
{
    if (!(signal.sampleRate() > 0.0f)) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidConfiguration, "recording has no sample rate"));
    }

    SnipResult result;
    std::map<std::string, std::size_t, std::less<>> counts;
    std::vector<Bounds> taken;

    for (const auto &[tag, timestamp] : annotations.chronological()) {
        if (annotations.isIgnored(timestamp)) {
            ++result.skipped;
            continue;
        }

        const Bounds bounds = boundsFor(signal, timestamp, _config.optionsFor(tag));
        const std::size_t n = counts[tag] + 1;
        auto snippet = cut(signal, bounds, std::format("{}_{}_{}", recordingName, tag, n), tag);
        if (!snippet) {
            core::Log::warn("snip", std::format("skipping {} at {:.3f} s: {}", tag, timestamp, snippet.error().message));
            ++result.skipped;
            continue;
        }

        counts[tag] = n;
        taken.push_back(bounds);
        result.events.push_back(std::move(*snippet));
    }

    if (_config.includeNoise) {
        std::size_t cursor = annotations.ignoreUntil() ? signal.indexAt(*annotations.ignoreUntil()) : 0;
        std::size_t n = 0;
        for (const auto &bounds : taken) {
            if (bounds.begin > cursor) {
                auto noise = cut(signal, {cursor, bounds.begin},
                    std::format("{}_{}_{}", recordingName, label::kNoise, n + 1), Label(label::kNoise));
                if (noise) {
                    ++n;
                    result.noise.push_back(std::move(*noise));
                } else {
                    core::Log::debug("snip", noise.error().message);
                }
            }
            cursor = std::max(cursor, bounds.end);
        }
    }

    core::Log::info("snip", std::format("{}: {} event snippets, {} noise, {} skipped",
        recordingName, result.events.size(), result.noise.size(), result.skipped));
    return result;
}

} // namespace spk::eog::snippet
