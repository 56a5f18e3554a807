/**
 * @file NpyFile.cpp
 * @brief Implementation of the .npy reader/writer.
 */

#include "spk/eog/io/NpyFile.hpp"

#include <bit>
#include <charconv>
#include <cstdint>
#include <cstring>
#include <format>
#include <fstream>
#include <iterator>
#include <limits>
#include <string_view>

namespace spk::eog::io {

namespace {

constexpr std::string_view kMagic = "\x93NUMPY";
constexpr std::size_t kPreambleV1 = 10;
constexpr std::size_t kPreambleV2 = 12;
constexpr std::size_t kHeaderAlignment = 64;

static_assert(std::endian::native == std::endian::little,
    "npy I/O assumes a little-endian host");

Error parseError(const std::string &origin, const std::string &what)
{
    return Error::make(ErrorCode::kFileParseError, origin + ": " + what);
}

/// Returns the text after "'key':" up to the next top-level ',' or '}'.
std::string_view dictValue(std::string_view header, std::string_view key)
{
    const std::string quoted = std::format("'{}'", key);
    auto pos = header.find(quoted);
    if (pos == std::string_view::npos)
        return {};
    pos = header.find(':', pos + quoted.size());
    if (pos == std::string_view::npos)
        return {};
    ++pos;
    while (pos < header.size() && header[pos] == ' ')
        ++pos;

    std::size_t end = pos;
    int depth = 0;
    for (; end < header.size(); ++end) {
        const char c = header[end];
        if (c == '(')
            ++depth;
        else if (c == ')')
            --depth;
        else if ((c == ',' || c == '}') && depth == 0)
            break;
    }
    return header.substr(pos, end - pos);
}

bool parseShape(std::string_view text, std::vector<std::size_t> &shape)
{
    if (text.size() < 2 || text.front() != '(' || text.back() != ')')
        return false;
    text = text.substr(1, text.size() - 2);

    while (!text.empty()) {
        while (!text.empty() && (text.front() == ' ' || text.front() == ','))
            text.remove_prefix(1);
        if (text.empty())
            break;
        std::size_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{})
            return false;
        shape.push_back(value);
        text.remove_prefix(static_cast<std::size_t>(ptr - text.data()));
    }
    return true;
}

/// Element count of @p shape; false when the product does not fit a size_t.
bool elementCount(const std::vector<std::size_t> &shape, std::size_t &count) noexcept
{
    count = 1;
    for (const auto dim : shape) {
        if (dim != 0 && count > std::numeric_limits<std::size_t>::max() / dim)
            return false;
        count *= dim;
    }
    return true;
}

template <typename T>
void widen(const std::byte *src, std::size_t count, std::vector<double> &out)
{
    out.resize(count);
    for (std::size_t i = 0; i < count; ++i) {
        T value;
        std::memcpy(&value, src + i * sizeof(T), sizeof(T));
        out[i] = static_cast<double>(value);
    }
}

} // namespace

Expected<NpyArray> decodeNpy(std::span<const std::byte> bytes, const std::string &origin)
{
    if (bytes.size() < kPreambleV1 ||
        std::memcmp(bytes.data(), kMagic.data(), kMagic.size()) != 0) {
        return std::unexpected(parseError(origin, "not a .npy file"));
    }

    const auto major = static_cast<std::uint8_t>(bytes[6]);
    std::size_t headerLen = 0;
    std::size_t preamble = 0;

    if (major == 1) {
        headerLen = static_cast<std::size_t>(bytes[8]) | (static_cast<std::size_t>(bytes[9]) << 8);
        preamble = kPreambleV1;
    } else if (major == 2 || major == 3) {
        if (bytes.size() < kPreambleV2)
            return std::unexpected(parseError(origin, "truncated header"));
        for (std::size_t i = 0; i < 4; ++i)
            headerLen |= static_cast<std::size_t>(bytes[8 + i]) << (8 * i);
        preamble = kPreambleV2;
    } else {
        return std::unexpected(parseError(origin, std::format("unsupported format version {}", major)));
    }

    if (bytes.size() < preamble + headerLen)
        return std::unexpected(parseError(origin, "truncated header"));

    const std::string_view header(reinterpret_cast<const char *>(bytes.data() + preamble), headerLen);

    const std::string_view descr = dictValue(header, "descr");
    const std::string_view fortran = dictValue(header, "fortran_order");
    const std::string_view shapeText = dictValue(header, "shape");

    NpyArray array;
    if (!parseShape(shapeText, array.shape) || array.shape.empty() || array.shape.size() > 2) {
        return std::unexpected(
            parseError(origin, std::format("unsupported shape {}", shapeText)));
    }

    std::size_t count = 0;
    if (!elementCount(array.shape, count)) {
        return std::unexpected(
            parseError(origin, std::format("shape {} overflows the address space", shapeText)));
    }

    std::size_t itemSize = 0;
    if (descr == "'<f8'")      itemSize = 8;
    else if (descr == "'<f4'") itemSize = 4;
    else if (descr == "'<i2'") itemSize = 2;
    else if (descr == "'<i4'") itemSize = 4;
    else if (descr == "'<i8'") itemSize = 8;
    else
        return std::unexpected(parseError(origin, std::format("unsupported dtype {}", descr)));

    const std::byte *payload = bytes.data() + preamble + headerLen;
    if ((bytes.size() - preamble - headerLen) / itemSize < count)
        return std::unexpected(parseError(origin, "truncated payload"));

    if (descr == "'<f8'")      widen<double>(payload, count, array.data);
    else if (descr == "'<f4'") widen<float>(payload, count, array.data);
    else if (descr == "'<i2'") widen<std::int16_t>(payload, count, array.data);
    else if (descr == "'<i4'") widen<std::int32_t>(payload, count, array.data);
    else                       widen<std::int64_t>(payload, count, array.data);

    if (fortran == "True" && array.shape.size() == 2) {
        const std::size_t rows = array.shape[0];
        const std::size_t cols = array.shape[1];
        std::vector<double> rowMajor(count);
        for (std::size_t r = 0; r < rows; ++r)
            for (std::size_t c = 0; c < cols; ++c)
                rowMajor[r * cols + c] = array.data[c * rows + r];
        array.data = std::move(rowMajor);
    }

    return array;
}

Expected<std::vector<std::byte>> encodeNpy(const NpyArray &array)
{
    if (array.shape.empty() || array.shape.size() > 2) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidArgument, "only 1-D and 2-D arrays can be written"));
    }

    std::size_t count = 0;
    if (!elementCount(array.shape, count) || count != array.data.size()) {
        return std::unexpected(
            Error::make(ErrorCode::kInvalidArgument,
                std::format("shape holds {} values but data has {}", count, array.data.size())));
    }

    const std::string shape = array.shape.size() == 1
        ? std::format("({},)", array.shape[0])
        : std::format("({}, {})", array.shape[0], array.shape[1]);
    std::string header = std::format("{{'descr': '<f8', 'fortran_order': False, 'shape': {}, }}", shape);

    const std::size_t unpadded = kPreambleV1 + header.size() + 1;
    header.append((kHeaderAlignment - unpadded % kHeaderAlignment) % kHeaderAlignment, ' ');
    header.push_back('\n');

    std::vector<std::byte> out;
    out.reserve(kPreambleV1 + header.size() + count * sizeof(double));

    const auto put = [&out](const void *src, std::size_t n) {
        const auto *p = static_cast<const std::byte *>(src);
        out.insert(out.end(), p, p + n);
    };

    put(kMagic.data(), kMagic.size());
    const std::uint8_t version[2] = {1, 0};
    put(version, 2);
    const auto len = static_cast<std::uint16_t>(header.size());
    const std::uint8_t lenBytes[2] = {static_cast<std::uint8_t>(len & 0xFF), static_cast<std::uint8_t>(len >> 8)};
    put(lenBytes, 2);
    put(header.data(), header.size());
    put(array.data.data(), count * sizeof(double));

    return out;
}

Expected<NpyArray> readNpy(const std::filesystem::path &path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(
            Error::make(ErrorCode::kFileNotFound, path.string()));
    }

    std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return decodeNpy(std::as_bytes(std::span<const char>(raw)), path.string());
}

ExpectedVoid writeNpy(const std::filesystem::path &path, const NpyArray &array)
{
    auto bytes = encodeNpy(array);
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

} // namespace spk::eog::io
