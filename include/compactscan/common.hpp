#pragma once

/**
 * @file common.hpp
 * @brief Common result types and small text helpers
 */

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace compactscan {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

}  // namespace compactscan

namespace compactscan::common {

/**
 * Strip leading and trailing ASCII whitespace.
 */
[[nodiscard]] std::string trim(std::string_view input);

/**
 * Replace every run of whitespace (including newlines) with a single space
 * and trim the ends. Used to normalize types that were wrapped over lines.
 */
[[nodiscard]] std::string collapse_whitespace(std::string_view input);

/**
 * True if the text contains only ASCII whitespace.
 */
[[nodiscard]] bool is_blank(std::string_view input) noexcept;

}  // namespace compactscan::common
