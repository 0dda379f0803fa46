#include "exemplar/core/clock.hpp"

namespace exemplar::core {

Rc<Clock> SystemClock::shared() {
    static Rc<Clock> clock = make_rc<SystemClock>();
    return clock;
}

} // namespace exemplar::core
