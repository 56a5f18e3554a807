/**
 * @file Snipper.hpp
 * @brief Cuts labelled snippets out of an annotated recording.
 *
 * For an event at time t with snippet size S and right proportion r the
 * snippet spans the samples nearest to t - (1 - r) * S and t + r * S
 * (end exclusive). Each snippet is normalised to max |x - mean| == 1 and
 * named {recording}_{tag}_{n}, n counting per tag from 1.
 *
 * With noise enabled, the gaps between consecutive event snippets (in
 * time order, from the end of the ignore region) become "noise" snippets.
 */

#pragma once

#include "spk/eog/core/Constants.hpp"
#include "spk/eog/core/Error.hpp"
#include "spk/eog/signal/Annotations.hpp"
#include "spk/eog/signal/SignalBuffer.hpp"
#include "spk/eog/snippet/SnippetStore.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace spk::eog::snippet {

/**
 * @brief Snippet geometry around an event timestamp.
 */
struct SnipOptions {
    double snippetSeconds = kDefaultSnippetSeconds;
    double rightProportion = kDefaultRightProportion;

    /// Rejects a non-positive size or a proportion outside [0, 1].
    [[nodiscard]] ExpectedVoid validate() const;
};

using TagOptions = std::map<std::string, SnipOptions, std::less<>>;

struct SnipperConfig {
    SnipOptions defaults;
    TagOptions overrides;
    bool includeNoise = false;

    [[nodiscard]] ExpectedVoid validate() const;

    /// Override for @p tag, or the defaults.
    [[nodiscard]] const SnipOptions &optionsFor(std::string_view tag) const;
};

/**
 * @brief Reads per-tag overrides from a JSON document.
 *
 * @code
 *   { "blink": { "snippet_size": 0.6, "right_proportion": 0.8 } }
 * @endcode
 * A key missing from a tag's entry falls back to @p defaults.
 *
 * @return The overrides, kFileNotFound or kFileParseError
 */
[[nodiscard]] Expected<TagOptions> loadTagOptions(const std::filesystem::path &path, const SnipOptions &defaults = {});

/**
 * @brief Snippets produced from one recording.
 */
struct SnipResult {
    std::vector<Snippet> events;
    std::vector<Snippet> noise;
    /// Timestamps that produced no snippet (ignored, out of range or flat).
    std::size_t skipped = 0;
};

class Snipper {
public:
    explicit Snipper(SnipperConfig config);

    /**
     * @brief Validating factory.
     */
    [[nodiscard]] static Expected<Snipper> create(SnipperConfig config);

    /**
     * @brief Cuts every annotated event of @p signal.
     *
     * @param recordingName Stem used in snippet identifiers
     */
    [[nodiscard]] Expected<SnipResult> snip(
        const signal::SignalBuffer &signal,
        const signal::AnnotationSet &annotations,
        std::string_view recordingName) const;

    [[nodiscard]] const SnipperConfig &config() const noexcept { return _config; }

private:
    struct Bounds {
        std::size_t begin;
        std::size_t end;
    };

    [[nodiscard]] static Bounds boundsFor(const signal::SignalBuffer &signal, double timestamp, const SnipOptions &options);

    [[nodiscard]] static Expected<Snippet> cut(
        const signal::SignalBuffer &signal, Bounds bounds, std::string id, Label label);

    SnipperConfig _config;
};

} // namespace spk::eog::snippet
