/**
 * @file NonCopyable.hpp
 * @brief CRTP base class that deletes copy operations.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef SPK_CORE_NON_COPYABLE_HPP
    #define SPK_CORE_NON_COPYABLE_HPP

namespace spk::core {

/**
 * @brief Base for buffer owners that may be moved but never duplicated,
 *        such as io::ByteWriter.
 * @tparam Derived The deriving class, so each owner gets a distinct base.
 */
template <typename Derived>
class NonCopyable {
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &)  = delete;

    NonCopyable(NonCopyable &&)                 = default;
    NonCopyable &operator=(NonCopyable &&)       = default;
};

} // namespace spk::core

#endif // SPK_CORE_NON_COPYABLE_HPP
