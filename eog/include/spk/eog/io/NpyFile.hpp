/**
 * @file NpyFile.hpp
 * @brief Reader/writer for NumPy .npy arrays (format versions 1.0–3.0).
 *
 * Snippets are stored as 2 x N float64 arrays (row 0 = amplitude,
 * row 1 = local time) and recordings captured by the SpikerStream tool as
 * 1-D arrays, so only what those files need is supported: 1-D and 2-D
 * shapes, little-endian f8/f4/i2/i4/i8 element types, C or Fortran order.
 * Values are always widened to double in memory; writing always emits
 * version 1.0, '<f8', C order.
 */

#pragma once

#include "spk/eog/core/Error.hpp"

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace spk::eog::io {

/**
 * @brief Dense row-major array of doubles with a 1-D or 2-D shape.
 */
struct NpyArray {
    std::vector<std::size_t> shape;
    std::vector<double> data;

    [[nodiscard]] std::size_t rows() const noexcept { return shape.size() == 2 ? shape[0] : 1; }
    [[nodiscard]] std::size_t cols() const noexcept { return shape.empty() ? 0 : shape.back(); }

    /// Row @p r of a 2-D array (or the whole 1-D array for r == 0).
    [[nodiscard]] std::span<const double> row(std::size_t r) const noexcept
    {
        return std::span<const double>(data).subspan(r * cols(), cols());
    }

    bool operator==(const NpyArray &) const = default;
};

/**
 * @brief Decodes an in-memory .npy image.
 */
[[nodiscard]] Expected<NpyArray> decodeNpy(std::span<const std::byte> bytes, const std::string &origin = "<memory>");

/**
 * @brief Encodes @p array as a version 1.0 '<f8' C-order .npy image.
 */
[[nodiscard]] Expected<std::vector<std::byte>> encodeNpy(const NpyArray &array);

/**
 * @brief Reads a .npy file from disk.
 *
 * @return The array, kFileNotFound, or kFileParseError
 */
[[nodiscard]] Expected<NpyArray> readNpy(const std::filesystem::path &path);

/**
 * @brief Writes @p array to @p path (overwrites).
 */
[[nodiscard]] ExpectedVoid writeNpy(const std::filesystem::path &path, const NpyArray &array);

} // namespace spk::eog::io
