#pragma once

#include <cf/options.h>
#include <string>

namespace cf {

// "maxConnections", "max_connections", "HTTPServer" -> "max-connections",
// "max-connections", "http-server".
std::string to_kebab_case(const std::string& identifier);

// Same word splitting as to_kebab_case, joined with '_'.
std::string to_snake_case(const std::string& identifier);

// Directive name for a declared field identifier under `policy`.
std::string translate_name(const std::string& identifier, NamingPolicy policy);

}  // namespace cf
