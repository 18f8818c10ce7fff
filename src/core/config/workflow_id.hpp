#pragma once
#include <random>
#include <sstream>
#include <string>

namespace wfproc::core::config {

    // 8 hex characters prefixed with "wf-", used to tag log lines.
    inline std::string generate_workflow_id() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "wf-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace wfproc::core::config
