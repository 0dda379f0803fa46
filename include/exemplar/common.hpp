//! # Common Definitions
//!
//! Types shared by every exemplar component: version constants, source
//! locations, the `Result` alias and the smart pointer aliases.
//!
//! ## Error Handling
//!
//! Engine internals report recoverable problems through `Result<T, E>`.
//! User code (example bodies, hooks, mocking collaborators) is allowed to
//! throw; the engine converts whatever it throws into a `core::Failure`
//! value at the boundary, so nothing thrown by user code escapes a run.

#ifndef EXEMPLAR_COMMON_HPP
#define EXEMPLAR_COMMON_HPP

#include <cstdint>
#include <memory>
#include <source_location>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace exemplar {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string.
constexpr const char* VERSION = "0.3.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Source Location
// ============================================================================

/// A position in a test source file.
///
/// Used for example declarations, hook declarations and the single frame
/// attached to failures raised through `exemplar::Error`.
struct SourceLocation {
    /// Path of the source file. Empty when unknown.
    std::string file;

    /// Line number (1-based). Zero when unknown.
    uint32_t line = 0;

    /// Captures the location of the caller.
    [[nodiscard]] static auto
    here(const std::source_location& loc = std::source_location::current()) -> SourceLocation {
        return SourceLocation{loc.file_name(), static_cast<uint32_t>(loc.line())};
    }

    /// Returns true if no file is attached.
    [[nodiscard]] auto is_unknown() const -> bool {
        return file.empty();
    }

    /// Formats as `file:line`.
    [[nodiscard]] auto to_string() const -> std::string {
        if (file.empty())
            return "<unknown>";
        return file + ":" + std::to_string(line);
    }

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

// ============================================================================
// Error Base
// ============================================================================

/// Base class for errors thrown by exemplar itself.
///
/// Carries the location where it was raised so that failure reports can
/// name a frame even though C++ exceptions have no backtrace.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message, SourceLocation location = {})
        : std::runtime_error(message), location_(std::move(location)) {}

    [[nodiscard]] auto location() const -> const SourceLocation& {
        return location_;
    }

private:
    SourceLocation location_;
};

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// ```cpp
/// Result<Configuration, std::string> cfg = load();
/// if (is_err(cfg)) { ... unwrap_err(cfg) ... }
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

template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

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

} // namespace exemplar

#endif // EXEMPLAR_COMMON_HPP
