/**
 * @file SnippetStore.cpp
 * @brief Implementation of snippet parsing, naming and directory I/O.
 */

#include "spk/eog/snippet/SnippetStore.hpp"

#include "spk/core/Log.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <system_error>

namespace spk::eog::snippet {

Snippet::Snippet(std::string id, Label label, std::vector<double> signal, std::vector<double> time)
    : _id(std::move(id))
    , _label(std::move(label))
    , _signal(std::move(signal))
    , _time(std::move(time))
{
}

Expected<SnippetData> SnippetStore::parseSnippet(const io::NpyArray &array)
{
    if (array.shape.size() != 2 || array.shape[0] != 2 || array.shape[1] == 0) {
        std::string shape;
        for (const auto dim : array.shape)
            shape += (shape.empty() ? "" : ", ") + std::to_string(dim);
        return std::unexpected(
            Error::make(ErrorCode::kFileParseError,
                std::format("snippet must have shape (2, N), got ({})", shape)));
    }
    if (array.data.size() % 2 != 0 || array.data.size() / 2 != array.shape[1]) {
        return std::unexpected(
            Error::make(ErrorCode::kFileParseError,
                std::format("snippet shape (2, {}) does not match its {} values", array.shape[1], array.data.size())));
    }

    const auto signal = array.row(0);
    const auto time = array.row(1);
    return SnippetData{
        std::vector<double>(signal.begin(), signal.end()),
        std::vector<double>(time.begin(), time.end())
    };
}

io::NpyArray SnippetStore::toArray(const Snippet &snippet)
{
    io::NpyArray array;
    array.shape = {2, snippet.size()};
    array.data.reserve(2 * snippet.size());
    array.data.insert(array.data.end(), snippet.signal().begin(), snippet.signal().end());
    array.data.insert(array.data.end(), snippet.time().begin(), snippet.time().end());
    return array;
}

Expected<Label> SnippetStore::getSnippetEvent(std::string_view filename)
{
    const std::string stem = std::filesystem::path(filename).stem().string();

    std::vector<std::string_view> tokens;
    std::string_view rest(stem);
    while (true) {
        const auto pos = rest.find('_');
        tokens.push_back(rest.substr(0, pos));
        if (pos == std::string_view::npos)
            break;
        rest.remove_prefix(pos + 1);
    }

    const auto isNumber = [](std::string_view token) {
        return !token.empty() &&
               std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    };

    std::string_view event = tokens.back();
    if (isNumber(event))
        event = tokens.size() >= 2 ? tokens[tokens.size() - 2] : std::string_view{};

    if (event.empty() || isNumber(event)) {
        return std::unexpected(
            Error::make(ErrorCode::kFileParseError,
                std::format("cannot find an event label in '{}'", filename)));
    }
    return Label(event);
}

Expected<Snippet> SnippetStore::load(const std::filesystem::path &file)
{
    auto label = getSnippetEvent(file.filename().string());
    if (!label)
        return std::unexpected(label.error());

    auto array = io::readNpy(file);
    if (!array)
        return std::unexpected(array.error());

    auto data = parseSnippet(*array);
    if (!data) {
        Error error = data.error();
        error.message = file.string() + ": " + error.message;
        return std::unexpected(std::move(error));
    }

    return Snippet(file.stem().string(), std::move(*label), std::move(data->signal), std::move(data->time));
}

Expected<std::vector<Snippet>> SnippetStore::loadDirectory(
    const std::filesystem::path &directory, const std::set<Label> &labelFilter)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return std::unexpected(
            Error::make(ErrorCode::kFileNotFound, "snippet directory " + directory.string()));
    }

    std::vector<std::filesystem::path> files;
    for (const auto &entry : std::filesystem::directory_iterator(directory, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".npy")
            files.push_back(entry.path());
    }
    if (ec) {
        return std::unexpected(
            Error::make(ErrorCode::kIoError,
                std::format("cannot list {}: {}", directory.string(), ec.message())));
    }
    std::sort(files.begin(), files.end());

    std::vector<Snippet> snippets;
    for (const auto &file : files) {
        auto label = getSnippetEvent(file.filename().string());
        if (!label) {
            core::Log::warn("snip", std::format("skipping {}: {}", file.filename().string(), label.error().message));
            continue;
        }
        if (!labelFilter.empty() && !labelFilter.contains(*label))
            continue;

        auto snippet = load(file);
        if (!snippet)
            return std::unexpected(snippet.error());
        snippets.push_back(std::move(*snippet));
    }

    core::Log::info("snip", std::format("loaded {} snippets from {}", snippets.size(), directory.string()));
    return snippets;
}

Expected<std::filesystem::path> SnippetStore::save(const std::filesystem::path &directory, const Snippet &snippet)
{
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return std::unexpected(
            Error::make(ErrorCode::kIoError,
                std::format("cannot create {}: {}", directory.string(), ec.message())));
    }

    const auto path = directory / (snippet.id() + ".npy");
    if (auto written = io::writeNpy(path, toArray(snippet)); !written)
        return std::unexpected(written.error());
    return path;
}

} // namespace spk::eog::snippet
