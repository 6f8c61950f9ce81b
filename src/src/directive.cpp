#include <cf/directive.h>
#include <algorithm>
#include <stdexcept>

namespace cf {

bool operator==(const Argument& a, const Argument& b) {
    return a.value == b.value and a.is_expression() == b.is_expression() and
           a.is_punctuator() == b.is_punctuator();
}

Directive& Directive::add_child(Directive child) {
    has_block = true;
    children.push_back(std::move(child));
    return children.back();
}

Directive& Directive::add_argument(Argument arg) {
    arguments.push_back(std::move(arg));
    return *this;
}

const Directive* Directive::find(const std::string& child_name) const {
    for (auto const& c : children)
        if (c.name.value == child_name) return &c;
    return nullptr;
}

std::vector<const Directive*> Directive::find_all(const std::string& child_name) const {
    std::vector<const Directive*> out;
    for (auto const& c : children)
        if (c.name.value == child_name) out.push_back(&c);
    return out;
}

const std::string& Directive::arg(std::size_t index) const {
    if (index >= arguments.size())
        throw std::out_of_range("directive '" + name.value + "' has no argument " + std::to_string(index));
    return arguments[index].value;
}

bool operator==(const Directive& a, const Directive& b) {
    return a.name == b.name and a.has_block == b.has_block and a.arguments == b.arguments and
           a.children == b.children;
}

const Directive* Document::find(const std::string& name) const {
    for (auto const& d : directives)
        if (d.name.value == name) return &d;
    return nullptr;
}

namespace {
    std::size_t count_directives(const std::vector<Directive>& list) {
        std::size_t n = list.size();
        for (auto const& d : list) n += count_directives(d.children);
        return n;
    }

    std::size_t max_depth(const std::vector<Directive>& list) {
        std::size_t deepest = 0;
        for (auto const& d : list) {
            if (not d.has_block) continue;
            deepest = std::max(deepest, 1 + max_depth(d.children));
        }
        return deepest;
    }
}

std::size_t Document::count() const { return count_directives(directives); }

std::size_t Document::depth() const { return max_depth(directives); }

bool operator==(const Document& a, const Document& b) { return a.directives == b.directives; }

}  // namespace cf
