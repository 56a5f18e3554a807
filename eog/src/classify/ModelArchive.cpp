/**
 * @file ModelArchive.cpp
 * @brief Archive header codec and file-level save/load.
 */

#include "spk/eog/classify/ModelArchive.hpp"

#include "spk/eog/classify/ClassifierFactory.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>

namespace spk::eog::classify {

void writeModelHeader(io::ByteWriter &writer, const ModelHeader &header)
{
    writer.writeBytes(std::as_bytes(std::span<const char>(kModelMagic.data(), kModelMagic.size())));
    writer.writeU32(kModelFormatVersion);
    writer.writeU8(static_cast<std::uint8_t>(header.kind));
    writer.writeU32(header.dimension);
    writer.writeU32(static_cast<std::uint32_t>(header.classes.size()));
    for (const auto &label : header.classes)
        writer.writeString(label);
}

Expected<ModelHeader> readModelHeader(io::ByteReader &reader)
{
    auto magic = reader.readBytes(kModelMagic.size());
    if (!magic)
        return std::unexpected(magic.error());
    if (!std::equal(magic->begin(), magic->end(), kModelMagic.begin(),
            [](std::byte b, char c) { return static_cast<char>(b) == c; })) {
        return std::unexpected(
            Error::make(ErrorCode::kFileParseError, "not a model archive (bad magic)"));
    }

    auto version = reader.readU32();
    if (!version)
        return std::unexpected(version.error());
    if (*version != kModelFormatVersion) {
        return std::unexpected(
            Error::make(ErrorCode::kFileParseError,
                std::format("unsupported model format version {}", *version)));
    }

    auto kind = reader.readU8();
    if (!kind)
        return std::unexpected(kind.error());
    if (*kind > static_cast<std::uint8_t>(ClassifierKind::kSvm)) {
        return std::unexpected(
            Error::make(ErrorCode::kFileParseError, std::format("unknown classifier kind {}", *kind)));
    }

    auto dimension = reader.readU32();
    if (!dimension)
        return std::unexpected(dimension.error());
    auto classCount = reader.readU32();
    if (!classCount)
        return std::unexpected(classCount.error());
    if (*dimension == 0 || *classCount == 0) {
        return std::unexpected(
            Error::make(ErrorCode::kFileParseError, "model archive has no features or no classes"));
    }

    ModelHeader header;
    header.kind = static_cast<ClassifierKind>(*kind);
    header.dimension = *dimension;
    for (std::uint32_t i = 0; i < *classCount; ++i) {
        auto label = reader.readString();
        if (!label)
            return std::unexpected(label.error());
        header.classes.push_back(std::move(*label));
    }
    if (!std::is_sorted(header.classes.begin(), header.classes.end()) ||
        std::adjacent_find(header.classes.begin(), header.classes.end()) != header.classes.end()) {
        return std::unexpected(
            Error::make(ErrorCode::kFileParseError, "model label table is not sorted and unique"));
    }
    return header;
}

Expected<std::unique_ptr<IEventClassifier>> decodeModel(std::span<const std::byte> archive)
{
    io::ByteReader peek(archive);
    auto header = readModelHeader(peek);
    if (!header)
        return std::unexpected(header.error());

    auto classifier = ClassifierFactory::create(header->kind);
    if (auto restored = classifier->deserialize(archive); !restored)
        return std::unexpected(restored.error());
    return classifier;
}

ExpectedVoid saveModel(const IEventClassifier &classifier, const std::filesystem::path &path)
{
    auto bytes = classifier.serialize();
    if (!bytes)
        return std::unexpected(bytes.error());

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return std::unexpected(
            Error::make(ErrorCode::kIoError, "cannot create " + path.string()));
    }
    file.write(reinterpret_cast<const char *>(bytes->data()), static_cast<std::streamsize>(bytes->size()));
    if (!file) {
        return std::unexpected(
            Error::make(ErrorCode::kIoError, "short write to " + path.string()));
    }
    return {};
}

Expected<std::unique_ptr<IEventClassifier>> loadModel(const std::filesystem::path &path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(
            Error::make(ErrorCode::kFileNotFound, path.string()));
    }

    std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    auto model = decodeModel(std::as_bytes(std::span<const char>(raw)));
    if (!model) {
        Error error = model.error();
        error.message = path.string() + ": " + error.message;
        return std::unexpected(std::move(error));
    }
    return model;
}

} // namespace spk::eog::classify
