/**
 * @file SnippetStore.hpp
 * @brief Labelled training windows and their .npy persistence.
 *
 * A snippet file is a (2, N) float64 array: row 0 holds the normalised
 * amplitude, row 1 the local time axis. The file is named
 * {recording}_{label}_{n}.npy, and the label is recovered from the name.
 */

#pragma once

#include "spk/eog/core/Error.hpp"
#include "spk/eog/core/Types.hpp"
#include "spk/eog/io/NpyFile.hpp"

#include <filesystem>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace spk::eog::snippet {

/**
 * @brief Amplitude and time rows of a snippet file.
 */
struct SnippetData {
    std::vector<double> signal;
    std::vector<double> time;
};

/**
 * @brief Immutable labelled window.
 */
class Snippet {
public:
    Snippet(std::string id, Label label, std::vector<double> signal, std::vector<double> time);

    /// File stem, e.g. "rec01_left_3".
    [[nodiscard]] const std::string &id() const noexcept { return _id; }
    [[nodiscard]] const Label &label() const noexcept { return _label; }
    [[nodiscard]] std::span<const double> signal() const noexcept { return _signal; }
    [[nodiscard]] std::span<const double> time() const noexcept { return _time; }
    [[nodiscard]] std::size_t size() const noexcept { return _signal.size(); }

private:
    std::string _id;
    Label _label;
    std::vector<double> _signal;
    std::vector<double> _time;
};

class SnippetStore {
public:
    SnippetStore() = delete;

    /**
     * @brief Splits a loaded array into its signal and time rows.
     *
     * @return The rows, or kFileParseError unless the array is (2, N), N > 0
     */
    [[nodiscard]] static Expected<SnippetData> parseSnippet(const io::NpyArray &array);

    /// Exact inverse of parseSnippet().
    [[nodiscard]] static io::NpyArray toArray(const Snippet &snippet);

    /**
     * @brief Event label encoded in a snippet filename.
     *
     * The last '_' token of the stem, or the one before it when the last
     * token is a running number ("rec01_left_3.npy" -> "left").
     *
     * @return The label, or kFileParseError for a name without one
     */
    [[nodiscard]] static Expected<Label> getSnippetEvent(std::string_view filename);

    /// Reads one snippet file, labelling it from its name.
    [[nodiscard]] static Expected<Snippet> load(const std::filesystem::path &file);

    /**
     * @brief Loads every .npy snippet in @p directory (not recursive),
     *        sorted by filename.
     *
     * @param labelFilter Labels to keep; empty keeps all
     * @return The snippets, kFileNotFound for a missing directory, or the
     *         first file error
     */
    [[nodiscard]] static Expected<std::vector<Snippet>> loadDirectory(
        const std::filesystem::path &directory, const std::set<Label> &labelFilter = {});

    /**
     * @brief Writes {directory}/{id}.npy, creating the directory if needed.
     *
     * @return The written path, or kIoError
     */
    [[nodiscard]] static Expected<std::filesystem::path> save(
        const std::filesystem::path &directory, const Snippet &snippet);
};

} // namespace spk::eog::snippet
