//! # Common Definitions
//!
//! Types shared by the whole HBS template tokenizer:
//!
//! - **Version Information**: Library version constants
//! - **Source Locations**: Positions and spans inside a template
//! - **Result Type**: Error handling without exceptions
//!
//! Library errors are returned via `Result<T, E>` or collected as
//! diagnostics; nothing in the library throws.

#ifndef HBS_COMMON_HPP
#define HBS_COMMON_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace hbs {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string (e.g., "0.1.0").
constexpr const char* VERSION = "0.1.0";

// ============================================================================
// Source Location Types
// ============================================================================

/// A position in a template.
///
/// Locations do not name their template. Tokens outlive the scan that
/// produced them, so callers pair spans with the template they scanned.
struct SourceLocation {
    uint32_t line = 0;   ///< 1-based
    uint32_t column = 0; ///< 1-based
    uint32_t offset = 0; ///< 0-based byte offset
    uint32_t length = 0; ///< Bytes covered

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

/// Template text from `start` up to `end`.
struct SourceSpan {
    SourceLocation start;
    SourceLocation end;
};

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// ```cpp
/// auto result = DelimiterPair::parse("<% %>");
/// if (is_ok(result)) {
///     auto& pair = unwrap(result);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Throws `std::bad_variant_access` if the Result holds an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Throws `std::bad_variant_access` if the Result holds a value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace hbs

#endif // HBS_COMMON_HPP
