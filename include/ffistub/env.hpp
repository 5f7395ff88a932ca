#pragma once
#include <string>
#include <string_view>

namespace ffistub {

// Process environment snapshot (FFISTUB_* variables).
struct RunEnv {
    bool trace = false;       // FFISTUB_TRACE
    bool diag_json = false;   // FFISTUB_DIAG_JSON
    std::string target_triple; // FFISTUB_TARGET_TRIPLE, empty = none
    std::string edition;       // FFISTUB_EDITION, empty = default
};

// True when the variable is set to a value starting with 1/t/T/y/Y.
bool flag_enabled(const char* name);

RunEnv detect_env();

// Stage tracing to stderr when FFISTUB_TRACE is enabled: `[ffistub][stage] message`.
bool trace_enabled();
void trace(std::string_view stage, const std::string& message);

} // namespace ffistub
