/**
 * @file Annotations.cpp
 * @brief Implementation of the annotation set and its text parser.
 */

#include "spk/eog/signal/Annotations.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <sstream>

namespace spk::eog::signal {

namespace {

std::string_view trim(std::string_view s) noexcept
{
    constexpr std::string_view kBlank = " \t\r\n";
    const auto first = s.find_first_not_of(kBlank);
    if (first == std::string_view::npos)
        return {};
    const auto last = s.find_last_not_of(kBlank);
    return s.substr(first, last - first + 1);
}

bool parseDouble(std::string_view text, double &out) noexcept
{
    const auto *begin = text.data();
    const auto *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, out);
    return ec == std::errc{} && ptr == end && std::isfinite(out);
}

const std::vector<double> kNoTimestamps;

} // namespace

std::optional<ReservedTag> reservedTagFromName(std::string_view tag) noexcept
{
    if (tag == reservedTagName(ReservedTag::kIgnore))
        return ReservedTag::kIgnore;
    return std::nullopt;
}

void AnnotationSet::add(std::string_view tag, double timestampSeconds)
{
    if (const auto reserved = reservedTagFromName(tag)) {
        switch (*reserved) {
            case ReservedTag::kIgnore:
                _ignoreUntil = std::max(_ignoreUntil.value_or(timestampSeconds), timestampSeconds);
                return;
        }
    }

    auto it = _events.find(tag);
    if (it == _events.end())
        it = _events.emplace(std::string(tag), std::vector<double>{}).first;
    it->second.push_back(timestampSeconds);
}

std::vector<std::string> AnnotationSet::tags() const
{
    std::vector<std::string> out;
    out.reserve(_events.size());
    for (const auto &[tag, _] : _events)
        out.push_back(tag);
    return out;
}

const std::vector<double> &AnnotationSet::timestamps(std::string_view tag) const
{
    const auto it = _events.find(tag);
    return it == _events.end() ? kNoTimestamps : it->second;
}

bool AnnotationSet::contains(std::string_view tag) const
{
    return _events.find(tag) != _events.end();
}

std::optional<double> AnnotationSet::ignoreUntil() const noexcept
{
    return _ignoreUntil;
}

bool AnnotationSet::isIgnored(double seconds) const noexcept
{
    return _ignoreUntil.has_value() && seconds <= *_ignoreUntil;
}

std::size_t AnnotationSet::eventCount() const noexcept
{
    std::size_t n = 0;
    for (const auto &[_, stamps] : _events)
        n += stamps.size();
    return n;
}

bool AnnotationSet::empty() const noexcept
{
    return _events.empty() && !_ignoreUntil.has_value();
}

std::vector<std::pair<std::string, double>> AnnotationSet::chronological() const
{
    std::vector<std::pair<std::string, double>> out;
    out.reserve(eventCount());
    for (const auto &[tag, stamps] : _events)
        for (const double t : stamps)
            out.emplace_back(tag, t);

    std::stable_sort(out.begin(), out.end(),
        [](const auto &a, const auto &b) { return a.second < b.second; });
    return out;
}

Expected<AnnotationSet> parseAnnotations(std::string_view text, std::string_view origin)
{
    AnnotationSet set;
    std::size_t lineNo = 0;

    while (!text.empty()) {
        const auto eol = text.find('\n');
        std::string_view line = text.substr(0, eol);
        text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);
        ++lineNo;

        line = trim(line);
        if (line.empty() || line.front() == '#')
            continue;

        const auto sep = line.find_first_of(",\t");
        if (sep == std::string_view::npos) {
            return std::unexpected(
                Error::make(ErrorCode::kFileParseError,
                    std::format("{}:{}: expected 'tag, timestamp', got '{}'", origin, lineNo, line)));
        }

        const std::string_view tag = trim(line.substr(0, sep));
        std::string_view rest = line.substr(sep);
        rest.remove_prefix(std::min(rest.find_first_not_of(",\t "), rest.size()));
        const std::string_view stamp = trim(rest);

        double seconds = 0.0;
        if (tag.empty() || !parseDouble(stamp, seconds)) {
            return std::unexpected(
                Error::make(ErrorCode::kFileParseError,
                    std::format("{}:{}: invalid annotation '{}'", origin, lineNo, line)));
        }

        set.add(tag, seconds);
    }

    return set;
}

Expected<AnnotationSet> loadAnnotations(const std::filesystem::path &path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return AnnotationSet{};

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(
            Error::make(ErrorCode::kIoError, "cannot open " + path.string()));
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parseAnnotations(contents.str(), path.string());
}

} // namespace spk::eog::signal
