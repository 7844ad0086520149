#pragma once

#include <cstdint>

// Job-wide resource ceiling shared by every container of a pod.
struct ResourceLimits {
    int64_t cpu = 0;            // whole CPU units
    int64_t memory = 0;         // bytes
    bool cpu_default = true;    // true while no declaration counts as explicit
    bool memory_default = true;
};

// What a single observe() call did, so the caller can report it.
struct AggregateStep {
    int64_t cpu_rounded = 0;      // container CPU limit after rounding up
    bool cpu_defaulted = false;   // floor applied for an undeclared CPU limit
    bool memory_defaulted = false;
    bool cpu_raised = false;      // declared maximum grew to this container's value
    bool memory_raised = false;
};

// Reduces per-container limits to one ceiling. Containers must be fed in pod
// order (init containers first) so the reported steps match the pod.
//
// A limit of 0 means "undeclared". The ceiling is the largest declared limit,
// or the floor when nothing was declared, whatever the order of observation.
// An undeclared limit seen before any declaration establishes the floor; a
// later declaration exactly equal to that floor does not clear the default
// flag. Any other declaration does.
class ResourceAggregator {
public:
    AggregateStep observe(double cpu_limit, int64_t memory_limit);

    ResourceLimits limits() const;

private:
    struct Track {
        int64_t declared = 0;       // largest declared value, 0 if none
        bool floor_applied = false; // an undeclared value came before any declaration
        bool is_default = true;

        // Sets the step flags for this observation.
        void observe(int64_t value, int64_t floor, bool& defaulted, bool& raised);
        int64_t ceiling(int64_t floor) const { return declared > 0 ? declared : floor; }
    };

    Track cpu_;
    Track memory_;
};

// Round a fractional CPU request up to whole units: 0.4 → 1, 1.2 → 2, 0 → 0.
// Values past the int64 range saturate.
int64_t round_cpu_units(double cpu_limit);
