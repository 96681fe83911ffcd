#pragma once

// Passed to every stage evaluation of one step.
struct TickContext {
    int    tick_index = 0;   // 0-based step index
    double time       = 0.0; // t0 + tick_index * dt
    double dt         = 0.0; // step length, in the configured time unit
};
