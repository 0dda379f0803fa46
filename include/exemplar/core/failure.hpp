//! # Failure
//!
//! A captured error, detached from the exception mechanism that produced it.
//!
//! Anything thrown by an example body, a hook or a mocking collaborator is
//! turned into a `Failure` at the boundary where the engine catches it. The
//! original exception object is kept in `cause` so that callers can still
//! test its dynamic type.

#ifndef EXEMPLAR_CORE_FAILURE_HPP
#define EXEMPLAR_CORE_FAILURE_HPP

#include "exemplar/common.hpp"

#include <exception>
#include <string>
#include <vector>

namespace exemplar::core {

struct Failure {
    /// Demangled type name of the thrown object ("std::runtime_error", ...).
    std::string type;

    /// `what()` of the thrown object, or a description for non-standard throws.
    std::string message;

    /// Frames in `file:line` form. C++ exceptions carry no backtrace, so this
    /// holds at most the raise location of an `exemplar::Error`.
    std::vector<std::string> backtrace;

    /// The original exception. Null for failures built from plain values.
    std::exception_ptr cause;

    /// Converts the exception currently being handled. Must be called from
    /// inside a catch block.
    [[nodiscard]] static auto from_current_exception() -> Failure;

    /// Converts a stored exception.
    [[nodiscard]] static auto from_exception_ptr(std::exception_ptr error) -> Failure;

    /// Builds a failure from an exception object without throwing it.
    template <typename E> [[nodiscard]] static auto make(E error) -> Failure {
        return from_exception_ptr(std::make_exception_ptr(std::move(error)));
    }

    /// Builds a failure that has no exception object behind it.
    [[nodiscard]] static auto describe(std::string type, std::string message,
                                       SourceLocation location = {}) -> Failure;

    /// First backtrace frame, or "<no backtrace>".
    [[nodiscard]] auto first_frame() const -> std::string;

    /// True if `cause` is an exception of type `E` (or derived from it).
    template <typename E> [[nodiscard]] auto is() const -> bool {
        if (!cause || !standard_)
            return false;
        try {
            std::rethrow_exception(cause);
        } catch (const E&) {
            return true;
        } catch (const std::exception&) {
            return false;
        }
    }

private:
    bool standard_ = false; ///< `cause` derives from std::exception
};

/// Demangles a `typeid(...).name()` string where the ABI supports it.
[[nodiscard]] auto demangle(const char* mangled) -> std::string;

} // namespace exemplar::core

#endif // EXEMPLAR_CORE_FAILURE_HPP
