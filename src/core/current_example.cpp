#include "exemplar/core/current_example.hpp"

namespace exemplar::core {

namespace {
const Example* g_current_example = nullptr;
} // namespace

const Example* current_example() {
    return g_current_example;
}

CurrentExampleScope::CurrentExampleScope(const Example& example) : previous_(g_current_example) {
    g_current_example = &example;
}

CurrentExampleScope::~CurrentExampleScope() {
    g_current_example = previous_;
}

} // namespace exemplar::core
