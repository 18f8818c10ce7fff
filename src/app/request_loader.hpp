#pragma once
#include <istream>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/workflow_errors.hpp"

namespace wfproc::app {

    // Reads the request document from a file, or from `stdin_stream` when
    // `source` is "-".
    wfproc::core::errors::Result<nlohmann::json> load_request(const std::string& source,
                                                              std::istream& stdin_stream);

} // namespace wfproc::app
