#pragma once

#include <cf/directive.h>
#include <cf/options.h>
#include <cstddef>
#include <string>

namespace cf {

// Render a Document as configuration text that parses back to an equal
// Document under `options.parser`. Comments are not written. Throws
// SerializeError for arguments the text syntax cannot express.
std::string serialize(const Document& doc, const MapperOptions& options = {});

// Render one directive (and its block) indented `depth` levels.
std::string serialize(const Directive& directive, const MapperOptions& options = {}, std::size_t depth = 0);

// `value` as a double-quoted string with escapes.
std::string quote(const std::string& value);

}  // namespace cf
