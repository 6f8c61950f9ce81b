#pragma once

#include <cf/suggest.h>
#include <string>
#include <vector>

namespace cf {
namespace cli_utils {

inline std::string create_unknown_arg_error(const std::string& arg, const std::vector<std::string>& valid_options) {
    std::string error = "Unknown argument: " + arg;
    std::string suggestion = suggest_similar(arg, valid_options);
    if (!suggestion.empty()) error += "\n  Did you mean '" + suggestion + "'?";
    return error;
}

}  // namespace cli_utils
}  // namespace cf
