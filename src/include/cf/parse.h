#pragma once

#include <cf/directive.h>
#include <cf/options.h>
#include <string>

namespace cf {

// Parse configuration text into a Document. Throws LexError for malformed
// tokens, ParseError for structural errors and ResourceLimitExceeded when the
// limits in `options` are hit. An empty text yields an empty Document.
Document parse(const std::string& text, const ParserOptions& options = {});

}  // namespace cf
