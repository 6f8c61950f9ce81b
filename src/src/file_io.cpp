#include <cf/file_io.h>
#include <cf/parse.h>
#include <cf/serialize.h>
#include <fstream>
#include <sstream>

namespace cf {

std::string read_text_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) throw IoError("cannot open file", path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) throw IoError("cannot read file", path);
    return buffer.str();
}

void write_text_file(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) throw IoError("cannot open file for writing", path);
    out << text;
    out.flush();
    if (!out) throw IoError("cannot write file", path);
}

Document load_file(const std::string& path, const ParserOptions& options) {
    return parse(read_text_file(path), options);
}

void save_file(const std::string& path, const Document& doc, const MapperOptions& options) {
    write_text_file(path, serialize(doc, options));
}

}  // namespace cf
