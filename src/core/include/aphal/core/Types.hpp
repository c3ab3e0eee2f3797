/**
 * @file Types.hpp
 * @brief Primitive type aliases shared by every aphal module.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef APHAL_CORE_TYPES_HPP
    #define APHAL_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>

namespace aphal::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i32 = std::int32_t;
using i64 = std::int64_t;

using usize = std::size_t;

} // namespace aphal::core

#endif // APHAL_CORE_TYPES_HPP
