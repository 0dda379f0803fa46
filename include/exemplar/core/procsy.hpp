//! # Procsy
//!
//! The value handed to around hooks. It wraps "run the rest of the pipeline"
//! together with the example's metadata, so a hook can decide whether, when
//! and how many times the wrapped pipeline runs.
//!
//! ```cpp
//! hooks.around([](GroupInstance& ctx, Procsy& example) {
//!     if (example.metadata().tag("slow") && !slow_enabled())
//!         return;          // body, before and after hooks never run
//!     example.run();
//! });
//! ```

#ifndef EXEMPLAR_CORE_PROCSY_HPP
#define EXEMPLAR_CORE_PROCSY_HPP

#include "exemplar/core/metadata.hpp"

#include <functional>

namespace exemplar::core {

class Procsy {
public:
    using Fn = std::function<void()>;

    Procsy(const Metadata& metadata, Fn fn) : metadata_(&metadata), fn_(std::move(fn)) {}

    /// Metadata of the wrapped example. Read-only.
    [[nodiscard]] auto metadata() const -> const Metadata& {
        return *metadata_;
    }

    /// Runs the wrapped pipeline. Each call runs it again.
    void run() const {
        fn_();
    }

    void operator()() const {
        run();
    }

    /// Same metadata, different callable. Used to layer around hooks.
    [[nodiscard]] auto wrap(Fn fn) const -> Procsy {
        return Procsy(*metadata_, std::move(fn));
    }

private:
    const Metadata* metadata_;
    Fn fn_;
};

} // namespace exemplar::core

#endif // EXEMPLAR_CORE_PROCSY_HPP
