//! # Common Definitions
//!
//! This module provides the small set of types every other prose component
//! depends on.
//!
//! ## Overview
//!
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique and shared pointers
//! - **Options**: Process-wide library configuration
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: Data errors are returned via `Result<T, E>`
//! - **Explicit Ownership**: `Box<T>` for unique ownership, `Rc<T>` for shared

#ifndef PROSE_COMMON_HPP
#define PROSE_COMMON_HPP

#include <memory>
#include <string>
#include <variant>

namespace prose {

/// The library version string.
constexpr const char* VERSION = "0.3.0";

// ============================================================================
// Configuration
// ============================================================================

/// Output format for rendered diagnostics.
enum class DiagnosticFormat {
    Text, ///< Human-readable, compiler-style layout (default)
    JSON  ///< One JSON object per diagnostic tree
};

/// Process-wide library options.
///
/// ```cpp
/// Options::default_context_name = "request body";
/// Options::diagnostic_format = DiagnosticFormat::JSON;
/// ```
struct Options {
    /// Name printed in the ` --> ` line of a diagnostic whose span has no file
    /// path and which carries no context name of its own.
    static inline std::string default_context_name = "input";

    /// Format used by `DiagnosticEmitter` when none is given explicitly.
    static inline DiagnosticFormat diagnostic_format = DiagnosticFormat::Text;
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// ```cpp
/// ParseResult<U64> parse_port(ParseStream& stream) {
///     auto number = stream.parse<U64>();
///     if (is_err(number))
///         return unwrap_err(number);
///     ...
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Reference-counted shared pointer. Sources are always held through one.
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace prose

#endif // PROSE_COMMON_HPP
