/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * APHAL_TRY macros for early-return propagation.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef APHAL_CORE_EXPECTED_HPP
    #define APHAL_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace aphal::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace aphal::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type aphal::core::Expected<U>.
 */
#define APHAL_TRY(expr)                                                   \
    ({                                                                     \
        auto &&_aphal_result = (expr);                                     \
        if (!_aphal_result.has_value()) [[unlikely]]                       \
            return std::unexpected(std::move(_aphal_result.error()));       \
        std::move(_aphal_result.value());                                  \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type aphal::core::ExpectedVoid.
 */
#define APHAL_TRY_VOID(expr)                                              \
    do {                                                                    \
        auto &&_aphal_result = (expr);                                     \
        if (!_aphal_result.has_value()) [[unlikely]]                       \
            return std::unexpected(std::move(_aphal_result.error()));       \
    } while (false)

#endif // APHAL_CORE_EXPECTED_HPP
