//! # Common Definitions
//!
//! Common types and utilities shared by every Frost component.
//!
//! ## Overview
//!
//! - **Version Information**: Frost version constants
//! - **Result Type**: Error handling without exceptions
//! - **Build Errors**: The fatal error value that stops a build
//! - **Smart Pointers**: Aliases for unique and shared pointers
//!
//! ## Conventions
//!
//! - Fallible operations return `Result<T, E>`; exceptions never cross a
//!   module boundary.
//! - A `BuildError` is always fatal for the build that produced it. Conditions
//!   that only deserve a warning are logged and the operation continues.

#ifndef FROST_COMMON_HPP
#define FROST_COMMON_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace frost {

// ============================================================================
// Version Information
// ============================================================================

/// The Frost version string.
constexpr const char* VERSION = "0.3.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<fs::path, BuildError> r = pkg.assemble();
/// if (is_err(r)) {
///     FROST_LOG_ERROR("build", unwrap_err(r).message);
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
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Build Errors
// ============================================================================

/// Category of a fatal build error.
enum class BuildErrorKind {
    MissingStub,          ///< Required launcher stub variant not installed
    UnsafePath,           ///< Logical name escapes the output tree
    ContainmentViolation, ///< Refused to delete a protected directory
    MissingSource,        ///< Source file missing and not resolvable from a zip
    MissingCode,          ///< Module listed without a compiled payload
    Io,                   ///< Reading or writing an artifact failed
    InvalidInput          ///< Malformed build description or configuration
};

/// Returns a short lowercase name for an error kind (e.g., "unsafe-path").
inline const char* error_kind_name(BuildErrorKind kind) {
    switch (kind) {
    case BuildErrorKind::MissingStub:
        return "missing-stub";
    case BuildErrorKind::UnsafePath:
        return "unsafe-path";
    case BuildErrorKind::ContainmentViolation:
        return "containment-violation";
    case BuildErrorKind::MissingSource:
        return "missing-source";
    case BuildErrorKind::MissingCode:
        return "missing-code";
    case BuildErrorKind::Io:
        return "io";
    case BuildErrorKind::InvalidInput:
        return "invalid-input";
    }
    return "unknown";
}

/// A fatal, build-terminating condition.
struct BuildError {
    BuildErrorKind kind;
    std::string message;

    static auto make(BuildErrorKind kind, std::string msg) -> BuildError {
        return BuildError{kind, std::move(msg)};
    }

    /// Formats as "<kind>: <message>".
    [[nodiscard]] auto to_string() const -> std::string {
        return std::string(error_kind_name(kind)) + ": " + message;
    }
};

/// Result alias used by every assembling component.
template <typename T> using BuildResult = Result<T, BuildError>;

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Reference-counted shared pointer.
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace frost

#endif // FROST_COMMON_HPP
