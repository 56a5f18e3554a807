/**
 * @file ModelArchive.hpp
 * @brief Binary persistence of trained classifiers.
 *
 * Layout (all integers little-endian):
 *
 *   "SPKM"          magic
 *   u32             format version
 *   u8              ClassifierKind
 *   u32             feature dimension
 *   u32 + strings   label table (sorted)
 *   ...             kind-specific parameters
 */

#pragma once

#include "spk/eog/classify/IEventClassifier.hpp"
#include "spk/eog/io/ByteStream.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string_view>

namespace spk::eog::classify {

inline constexpr std::string_view kModelMagic = "SPKM";
inline constexpr std::uint32_t kModelFormatVersion = 1;

/**
 * @brief Fields common to every archive.
 */
struct ModelHeader {
    ClassifierKind kind = ClassifierKind::kKnn;
    std::uint32_t dimension = 0;
    std::vector<Label> classes;
};

void writeModelHeader(io::ByteWriter &writer, const ModelHeader &header);

/**
 * @brief Reads and validates magic, version, kind and label table.
 */
[[nodiscard]] Expected<ModelHeader> readModelHeader(io::ByteReader &reader);

/**
 * @brief Restores a classifier of whatever kind the archive holds.
 */
[[nodiscard]] Expected<std::unique_ptr<IEventClassifier>> decodeModel(std::span<const std::byte> archive);

/**
 * @brief Serialises @p classifier to @p path (overwrites).
 */
[[nodiscard]] ExpectedVoid saveModel(const IEventClassifier &classifier, const std::filesystem::path &path);

/**
 * @brief Loads a classifier saved by saveModel().
 *
 * @return The classifier, kFileNotFound or kFileParseError
 */
[[nodiscard]] Expected<std::unique_ptr<IEventClassifier>> loadModel(const std::filesystem::path &path);

} // namespace spk::eog::classify
