/**
 * @file CliCommon.hpp
 * @brief Option-value helpers shared by the command-line tools.
 */

#pragma once

#include "spk/core/Log.hpp"
#include "spk/eog/core/Error.hpp"

#include <charconv>
#include <cstdio>
#include <format>
#include <set>
#include <string>
#include <string_view>

namespace spk::cli {

/// Parses the whole of @p text as a number; false on junk or overflow.
template <typename T>
bool parseNumber(std::string_view text, T &out)
{
    const char *first = text.data();
    const char *last = first + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last && first != last;
}

/// Rejects a negative or malformed count given on the command line.
inline bool parseCount(std::string_view text, std::size_t &out)
{
    if (!text.empty() && text.front() == '-')
        return false;
    return parseNumber(text, out);
}

inline bool applyLogLevel(std::string_view text)
{
    core::LogLevel level{};
    if (!core::parseLogLevel(text, level))
        return false;
    core::Log::setMinLevel(level);
    return true;
}

/// Comma separated list ("left,right") to a set.
inline std::set<std::string> splitList(std::string_view text)
{
    std::set<std::string> out;
    while (!text.empty()) {
        const auto comma = text.find(',');
        const auto item = text.substr(0, comma);
        if (!item.empty())
            out.emplace(item);
        if (comma == std::string_view::npos)
            break;
        text.remove_prefix(comma + 1);
    }
    return out;
}

inline int fail(std::string_view tool, const eog::Error &error)
{
    core::Log::error(tool, error.format());
    return 1;
}

inline int usageError(std::string_view tool, std::string_view message)
{
    std::fprintf(stderr, "%.*s: %.*s (see --help)\n",
        static_cast<int>(tool.size()), tool.data(),
        static_cast<int>(message.size()), message.data());
    return 2;
}

} // namespace spk::cli
