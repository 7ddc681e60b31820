//! # Common Definitions
//!
//! This module provides common types, utilities, and constants used throughout
//! tfwheels. It establishes the foundational abstractions that every other
//! component depends on.
//!
//! ## Overview
//!
//! The common module includes:
//!
//! - **Version Information**: Tool version string
//! - **Wheels Options**: Process-wide configuration filled by the entry point
//! - **Error / Result**: Error handling without exceptions
//! - **Smart Pointers**: Unique ownership alias
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: All errors are returned via `Result<T, E>`
//! - **Explicit Ownership**: Use `Box<T>` for unique ownership

#ifndef WHEELS_COMMON_HPP
#define WHEELS_COMMON_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace wheels {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string (e.g., "0.3.0").
constexpr const char* VERSION = "0.3.0";

// ============================================================================
// Wheels Configuration
// ============================================================================

/// Process-wide options.
///
/// Filled once by `wheels_main()` before any sandbox or plugin logic runs.
/// Components read them; only the entry point and tests write them.
struct WheelsOptions {
    /// argv[0], used in help and hint messages.
    static inline std::string program_name = "tfwheels";

    /// Explicit path to the terraform binary (`WHEELS_TERRAFORM_BIN`).
    /// Empty means: look in the project directory, then on PATH.
    static inline std::string terraform_bin;

    /// Terraform release line this build is written against.
    static inline std::string required_terraform_prefix = "0.11.";
};

// ============================================================================
// Error Type
// ============================================================================

/// An error carried through `Result<T>`.
///
/// The message is user-facing. Callers add context with `wrap()` rather than
/// building a new error, so the innermost cause is always kept.
struct Error {
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : message(std::move(msg)) {}

    /// Returns a copy with `context: ` prefixed to the message.
    [[nodiscard]] auto wrap(std::string_view context) const -> Error {
        return Error(std::string(context) + ": " + message);
    }
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// `Result<T, E>` is used for operations that can fail, allowing error
/// handling without exceptions. Operations with no meaningful success value
/// return `Result<bool>` and yield `true`.
///
/// # Example
///
/// ```cpp
/// Result<int> parse_count(std::string_view s) {
///     // ... parsing logic ...
///     if (bad) return Error("invalid count");
///     return value;
/// }
///
/// auto result = parse_count("42");
/// if (is_ok(result)) {
///     int value = unwrap(result);
/// }
/// ```
template <typename T, typename E = Error> using Result = std::variant<T, E>;

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

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace wheels

#endif // WHEELS_COMMON_HPP
