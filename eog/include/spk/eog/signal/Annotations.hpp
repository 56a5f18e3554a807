/**
 * @file Annotations.hpp
 * @brief Typed tag → timestamps mapping read from SpikerRecorder event files.
 *
 * File format (one annotation per line):
 * @code
 *   # comment
 *   ignore,	3.20
 *   left,	5.91
 *   right,	8.04
 * @endcode
 * Fields are separated by a comma, a tab, or both. Lines that are empty or
 * start with '#' are skipped. Timestamps of a tag keep file order.
 *
 * The reserved tag "ignore" marks the end of a leading region to exclude
 * from analysis. It is stored apart from the event tags and reached only
 * through ignoreUntil().
 */

#pragma once

#include "spk/eog/core/Error.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace spk::eog::signal {

/**
 * @brief Tags with a meaning of their own in an annotation file.
 */
enum class ReservedTag : std::uint8_t {
    kIgnore
};

[[nodiscard]] constexpr std::string_view reservedTagName(ReservedTag tag) noexcept
{
    switch (tag) {
        case ReservedTag::kIgnore: return "ignore";
    }
    return "";
}

/// Returns the reserved tag spelled @p tag, if any.
[[nodiscard]] std::optional<ReservedTag> reservedTagFromName(std::string_view tag) noexcept;

/**
 * @brief Event annotations of one recording.
 */
class AnnotationSet {
public:
    /// Appends a timestamp; reserved tags are routed to their own slot.
    void add(std::string_view tag, double timestampSeconds);

    /// Event tags in lexical order (reserved tags excluded).
    [[nodiscard]] std::vector<std::string> tags() const;

    /// Timestamps of @p tag in file order (empty when unknown).
    [[nodiscard]] const std::vector<double> &timestamps(std::string_view tag) const;

    [[nodiscard]] bool contains(std::string_view tag) const;

    /// End of the leading region to exclude (latest "ignore" timestamp).
    [[nodiscard]] std::optional<double> ignoreUntil() const noexcept;

    /// True when @p seconds lies inside the ignore region.
    [[nodiscard]] bool isIgnored(double seconds) const noexcept;

    /// Number of event timestamps over all tags.
    [[nodiscard]] std::size_t eventCount() const noexcept;

    [[nodiscard]] bool empty() const noexcept;

    /**
     * @brief All (tag, timestamp) pairs sorted by time (stable per tag).
     */
    [[nodiscard]] std::vector<std::pair<std::string, double>> chronological() const;

private:
    std::map<std::string, std::vector<double>, std::less<>> _events;
    std::optional<double> _ignoreUntil;
};

/**
 * @brief Parses annotation text.
 *
 * @param text   File contents
 * @param origin Name used in error messages
 * @return The annotations, or kFileParseError for a malformed line
 */
[[nodiscard]] Expected<AnnotationSet> parseAnnotations(std::string_view text, std::string_view origin = "<text>");

/**
 * @brief Reads and parses an annotation file.
 *
 * A missing file means "no annotations" and yields an empty set.
 */
[[nodiscard]] Expected<AnnotationSet> loadAnnotations(const std::filesystem::path &path);

} // namespace spk::eog::signal
