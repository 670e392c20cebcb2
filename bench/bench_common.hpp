// bench/bench_common.hpp
// Shared benchmark scenarios for command and console traffic.

#pragma once

#include <cstddef>
#include <string>

namespace easyquery_bench {

struct BenchScenario {
    const char* name;
    size_t payload_size;
};

constexpr BenchScenario SCENARIOS[] = {
    {"short_command", 16},
    {"typical_command", 64},
    {"player_list", 1024},
    {"large_dump", 16384},
};

constexpr size_t SCENARIO_COUNT = sizeof(SCENARIOS) / sizeof(SCENARIOS[0]);

// Generate a remote admin command of approximately the given size in bytes.
inline std::string generate_command(size_t size) {
    std::string base = "/broadcast 10 ";
    if (base.size() >= size) {
        return base;
    }
    base.append(size - base.size(), 'x');
    return base;
}

} // namespace easyquery_bench
