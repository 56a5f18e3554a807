/**
 * @file Types.hpp
 * @brief Integer aliases for the log levels and archive byte streams.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef SPK_CORE_TYPES_HPP
    #define SPK_CORE_TYPES_HPP

    #include <cstdint>

namespace spk::core {

/// Fixed-width integers used by serialised formats.
using u8  = std::uint8_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i32 = std::int32_t;

} // namespace spk::core

#endif // SPK_CORE_TYPES_HPP
