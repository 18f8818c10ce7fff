#include "app/request_loader.hpp"

#include <fstream>
#include <iterator>

namespace wfproc::app {

using wfproc::core::errors::ErrorCategory;
using wfproc::core::errors::WorkflowError;

wfproc::core::errors::Result<nlohmann::json> load_request(const std::string& source,
                                                          std::istream& stdin_stream) {
    std::string text;
    if (source == "-") {
        text.assign(std::istreambuf_iterator<char>(stdin_stream),
                    std::istreambuf_iterator<char>());
    } else {
        std::ifstream in(source);
        if (!in.is_open()) {
            return WorkflowError{ErrorCategory::Input,
                                 "Unable to open request file: " + source,
                                 "request_unreadable"};
        }
        text.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        if (in.bad()) {
            return WorkflowError{ErrorCategory::Input,
                                 "I/O error while reading request file: " + source,
                                 "request_unreadable"};
        }
    }

    nlohmann::json parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return WorkflowError{ErrorCategory::Input, "Request is not valid JSON: " + source,
                             "request_not_json"};
    }
    return parsed;
}

}  // namespace wfproc::app
