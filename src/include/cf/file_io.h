#pragma once

#include <cf/directive.h>
#include <cf/mapper.h>
#include <cf/options.h>
#include <string>

namespace cf {

// Whole file as a string. Throws IoError when it cannot be opened or read.
std::string read_text_file(const std::string& path);

// Replace the file's contents with `text`. Throws IoError on failure.
void write_text_file(const std::string& path, const std::string& text);

// Parse a file. Syntax errors propagate unchanged; their positions refer to
// the file's text.
Document load_file(const std::string& path, const ParserOptions& options = {});

void save_file(const std::string& path, const Document& doc, const MapperOptions& options = {});

template <typename R>
R from_file(const std::string& path, const MapperOptions& opts = {}) {
    return map_from<R>(load_file(path, opts.parser), opts);
}

template <typename R>
void to_file(const std::string& path, const R& value, const MapperOptions& opts = {}) {
    write_text_file(path, to_string(value, opts));
}

}  // namespace cf
