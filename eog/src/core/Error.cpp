/**
 * @file Error.cpp
 * @brief Implementation of Error::format().
 */

#include "spk/eog/core/Error.hpp"

#include <filesystem>
#include <sstream>

namespace spk::eog {

std::string Error::format() const
{
    std::ostringstream os;
    os << '[' << errorCodeName(code) << "] " << message
       << " (" << std::filesystem::path(location.file_name()).filename().string()
       << ':' << location.line() << ')';
    return os.str();
}

} // namespace spk::eog
