#include "resource_limits.hpp"
#include "constants.hpp"
#include <cmath>
#include <limits>

int64_t round_cpu_units(double cpu_limit) {
    if (!(cpu_limit > 0.0)) return 0;
    double units = std::ceil(cpu_limit);
    if (units >= std::ldexp(1.0, 63)) return std::numeric_limits<int64_t>::max();
    return static_cast<int64_t>(units);
}

void ResourceAggregator::Track::observe(int64_t value, int64_t floor,
                                        bool& defaulted, bool& raised) {
    if (value <= 0) {
        if (declared == 0) {
            floor_applied = true;
            defaulted = true;
        }
        return;
    }

    if (value > declared) {
        declared = value;
        raised = true;
    }
    // Tie with an already established floor still counts as default
    if (!(floor_applied && value == floor)) is_default = false;
}

AggregateStep ResourceAggregator::observe(double cpu_limit, int64_t memory_limit) {
    AggregateStep step;
    step.cpu_rounded = round_cpu_units(cpu_limit);

    cpu_.observe(step.cpu_rounded, DEFAULT_CPU_UNITS, step.cpu_defaulted, step.cpu_raised);
    memory_.observe(memory_limit, DEFAULT_MEMORY_BYTES, step.memory_defaulted, step.memory_raised);
    return step;
}

ResourceLimits ResourceAggregator::limits() const {
    ResourceLimits out;
    out.cpu = cpu_.ceiling(DEFAULT_CPU_UNITS);
    out.memory = memory_.ceiling(DEFAULT_MEMORY_BYTES);
    out.cpu_default = cpu_.is_default;
    out.memory_default = memory_.is_default;
    return out;
}
