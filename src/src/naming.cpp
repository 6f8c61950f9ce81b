#include <cf/naming.h>
#include <cctype>

namespace cf {

namespace {
    bool is_upper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
    bool is_lower_or_digit(char c) {
        return std::islower(static_cast<unsigned char>(c)) != 0 or std::isdigit(static_cast<unsigned char>(c)) != 0;
    }

    std::string split_words(const std::string& id, char sep) {
        std::string out;
        for (size_t k = 0; k < id.size(); ++k) {
            char c = id[k];
            if (c == '_' or c == '-') {
                if (not out.empty() and out.back() != sep) out.push_back(sep);
                continue;
            }
            if (is_upper(c)) {
                bool after_word = k > 0 and is_lower_or_digit(id[k - 1]);
                // end of an acronym: the 'S' in "HTTPServer"
                bool acronym_end = k > 0 and is_upper(id[k - 1]) and k + 1 < id.size() and
                                   std::islower(static_cast<unsigned char>(id[k + 1]));
                if ((after_word or acronym_end) and not out.empty() and out.back() != sep) out.push_back(sep);
                out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
                continue;
            }
            out.push_back(c);
        }
        if (not out.empty() and out.back() == sep) out.pop_back();
        return out;
    }
}

std::string to_kebab_case(const std::string& identifier) { return split_words(identifier, '-'); }

std::string to_snake_case(const std::string& identifier) { return split_words(identifier, '_'); }

std::string translate_name(const std::string& identifier, NamingPolicy policy) {
    switch (policy) {
        case NamingPolicy::KebabCase:
            return to_kebab_case(identifier);
        case NamingPolicy::SnakeCase:
            return to_snake_case(identifier);
        case NamingPolicy::AsDeclared:
            break;
    }
    return identifier;
}

}  // namespace cf
