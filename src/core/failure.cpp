//! # Failure Conversion
//!
//! Turns thrown objects into `Failure` values.

#include "exemplar/core/failure.hpp"

#include <cstdlib>
#include <typeinfo>

#if defined(__GNUG__) || defined(__clang__)
#include <cxxabi.h>
#endif

namespace exemplar::core {

std::string demangle(const char* mangled) {
#if defined(__GNUG__) || defined(__clang__)
    int status = 0;
    char* readable = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
    if (status == 0 && readable) {
        std::string result(readable);
        std::free(readable);
        return result;
    }
#endif
    return mangled;
}

Failure Failure::from_current_exception() {
    Failure failure;
    failure.cause = std::current_exception();

    try {
        throw;
    } catch (const Error& e) {
        failure.type = demangle(typeid(e).name());
        failure.message = e.what();
        failure.standard_ = true;
        if (!e.location().is_unknown())
            failure.backtrace.push_back(e.location().to_string());
    } catch (const std::exception& e) {
        failure.type = demangle(typeid(e).name());
        failure.message = e.what();
        failure.standard_ = true;
    } catch (const std::string& s) {
        failure.type = "std::string";
        failure.message = s;
    } catch (const char* s) {
        failure.type = "const char*";
        failure.message = s ? s : "";
    } catch (...) {
        // Recorded as a failure; the object itself stays reachable through `cause`.
        failure.type = "unknown exception";
        failure.message = "a value of a non-standard type was thrown";
    }

    return failure;
}

Failure Failure::from_exception_ptr(std::exception_ptr error) {
    if (!error)
        return describe("unknown exception", "no exception was stored");

    try {
        std::rethrow_exception(error);
    } catch (...) {
        return from_current_exception();
    }
}

Failure Failure::describe(std::string type, std::string message, SourceLocation location) {
    Failure failure;
    failure.type = std::move(type);
    failure.message = std::move(message);
    if (!location.is_unknown())
        failure.backtrace.push_back(location.to_string());
    return failure;
}

std::string Failure::first_frame() const {
    if (backtrace.empty())
        return "<no backtrace>";
    return backtrace.front();
}

} // namespace exemplar::core
