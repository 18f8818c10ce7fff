#pragma once
#include <cstddef>

namespace wfproc::core::config {

    // Defaults applied when a request omits execution_options or error_handling.
    struct EngineConfig {
        std::size_t default_max_parallel = 3;
        std::size_t default_max_failures = 10;
        bool default_atomic = true;
        // Upper bound accepted for execution_options.max_parallel.
        std::size_t max_parallel_limit = 64;
    };

} // namespace wfproc::core::config
