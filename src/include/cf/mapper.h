#pragma once

#include <cf/convert.h>
#include <cf/directive.h>
#include <cf/error.h>
#include <cf/naming.h>
#include <cf/options.h>
#include <cf/parse.h>
#include <cf/serialize.h>
#include <cf/suggest.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace cf {

template <typename R>
class Mapping;

// Specialize to make a record type mappable; a generator may emit these.
//
//   template <> struct cf::MappingTraits<ServerConfig> {
//       static void describe(cf::Mapping<ServerConfig>& m) {
//           m.name("ServerConfig");
//           m.field("host", &ServerConfig::host);
//           m.field("port", &ServerConfig::port);
//           m.field("maxConnections", &ServerConfig::max_connections).rename("max-connections");
//       }
//   };
//
// Records must be default-constructible.
template <typename R>
struct MappingTraits {};

template <typename R, typename = void>
struct has_mapping : std::false_type {};

template <typename R>
struct has_mapping<R, std::void_t<decltype(MappingTraits<R>::describe(std::declval<Mapping<R>&>()))>>
    : std::true_type {};

// How a std::vector of scalars is laid out: `tags a b c;` or `tag a; tag b; tag c;`.
enum class Collection { Arguments, Directives };

namespace detail {

    template <typename T>
    struct is_optional : std::false_type {};
    template <typename T>
    struct is_optional<std::optional<T>> : std::true_type {};

    template <typename T>
    struct is_vector : std::false_type {};
    template <typename T, typename A>
    struct is_vector<std::vector<T, A>> : std::true_type {};

    // Vectors hold records or plain scalars; optionals and nested vectors
    // have no text form as elements.
    template <typename M>
    struct supported_layout : std::true_type {};
    template <typename U, typename A>
    struct supported_layout<std::vector<U, A>>
        : std::integral_constant<bool, !is_optional<U>::value and !is_vector<U>::value> {};

    inline std::string join_path(const std::string& path, const std::string& key) {
        return path.empty() ? key : path + "." + key;
    }

    // Argument holding a converted value; text that reads as a number or
    // boolean literal is quoted so it stays text.
    inline Argument make_argument(std::string text, ValueKind kind) {
        bool quoted = kind == ValueKind::Text && looks_like_literal(text);
        return quoted ? Argument::quoted(std::move(text)) : Argument::word(std::move(text));
    }

    template <typename T>
    T convert_argument(const Conversion<T>& conv, const Argument& arg, const std::string& path) {
        try {
            return conv.parse(arg.value);
        } catch (const ConversionError& e) {
            throw ConversionError(path, e.cause());
        } catch (const std::invalid_argument& e) {
            throw ConversionError(path, e.what());
        } catch (const std::out_of_range& e) {
            throw ConversionError(path, e.what());
        }
    }

    // Last child with the given name; later occurrences override earlier ones.
    inline const Directive* find_last(const Directive& d, const std::string& key) {
        const Directive* found = nullptr;
        for (auto const& c : d.children)
            if (c.name.value == key) found = &c;
        return found;
    }

    // Last child with the given name that has no block; fields mapped to
    // different arguments of one directive share it.
    inline Directive* find_last_line(Directive& d, const std::string& key) {
        Directive* found = nullptr;
        for (auto& c : d.children)
            if (c.name.value == key and !c.has_block and c.children.empty()) found = &c;
        return found;
    }

    struct FieldLayout {
        std::string id;
        std::string rename;
        std::size_t argument = 0;
        Collection collection = Collection::Arguments;

        std::string key(const MapperOptions& opts) const {
            return rename.empty() ? translate_name(id, opts.naming) : rename;
        }
    };

    template <typename R>
    R read_record(const Directive& d, const MapperOptions& opts, const std::string& path);

    template <typename R>
    Directive write_record(const R& value, const std::string& name, const MapperOptions& opts);

    // Reads and writes one member type. The primary template handles scalars.
    template <typename M, typename Enable = void>
    struct FieldCodec {
        static_assert(has_value_converter<M>::value,
                      "field type needs a cf::ValueConverter specialization or a cf::MappingTraits one");
        using element_type = M;

        static Conversion<M> default_conversion() { return Conversion<M>::builtin(); }

        static void read(const Directive& d, const FieldLayout& layout, const Conversion<M>& conv, M& out,
                         const MapperOptions& opts, const std::string& path) {
            std::string key = layout.key(opts);
            const Directive* child = find_last(d, key);
            if (child == nullptr or child->arguments.size() <= layout.argument)
                throw MissingField(join_path(path, key));
            out = convert_argument(conv, child->arguments[layout.argument], join_path(path, key));
        }

        // Sets the value in the directive already holding other arguments of the
        // same key, or in a new one.
        static void write(Directive& d, const FieldLayout& layout, const Conversion<M>& conv, const M& value,
                          const MapperOptions& opts) {
            std::string key = layout.key(opts);
            Directive* child = find_last_line(d, key);
            if (child == nullptr) child = &d.add_child(Directive(Argument::word(key)));
            place(*child, layout.argument, make_argument(conv.render(value), conv.kind));
        }

        // One new directive per call; used for repeated directives.
        static void append(Directive& d, const FieldLayout& layout, const Conversion<M>& conv, const M& value,
                           const MapperOptions& opts) {
            Directive child(Argument::word(layout.key(opts)));
            place(child, layout.argument, make_argument(conv.render(value), conv.kind));
            d.add_child(std::move(child));
        }

      private:
        // positions before index hold empty placeholders until another field fills them
        static void place(Directive& child, std::size_t index, Argument arg) {
            while (child.arguments.size() < index) child.add_argument(Argument::quoted(""));
            if (child.arguments.size() == index)
                child.add_argument(std::move(arg));
            else
                child.arguments[index] = std::move(arg);
        }
    };

    // Nested record: a child directive with a block.
    template <typename M>
    struct FieldCodec<M, std::enable_if_t<has_mapping<M>::value>> {
        using element_type = M;

        static Conversion<M> default_conversion() { return Conversion<M>{}; }

        static void read(const Directive& d, const FieldLayout& layout, const Conversion<M>&, M& out,
                         const MapperOptions& opts, const std::string& path) {
            std::string key = layout.key(opts);
            const Directive* child = find_last(d, key);
            if (child == nullptr) throw MissingField(join_path(path, key));
            out = read_record<M>(*child, opts, join_path(path, key));
        }

        static void write(Directive& d, const FieldLayout& layout, const Conversion<M>&, const M& value,
                          const MapperOptions& opts) {
            d.add_child(write_record(value, layout.key(opts), opts));
        }
    };

    // Optional scalar or record: absent when its directive (or the argument) is missing.
    template <typename U>
    struct FieldCodec<std::optional<U>> {
        using inner = FieldCodec<U>;
        using element_type = typename inner::element_type;

        static Conversion<element_type> default_conversion() { return inner::default_conversion(); }

        static void read(const Directive& d, const FieldLayout& layout, const Conversion<element_type>& conv,
                         std::optional<U>& out, const MapperOptions& opts, const std::string& path) {
            std::string key = layout.key(opts);
            const Directive* child = find_last(d, key);
            if (child == nullptr) {
                out.reset();
                return;
            }
            if constexpr (!has_mapping<U>::value) {
                if (child->arguments.size() <= layout.argument) {
                    out.reset();
                    return;
                }
            }
            U value{};
            inner::read(d, layout, conv, value, opts, path);
            out = std::move(value);
        }

        static void write(Directive& d, const FieldLayout& layout, const Conversion<element_type>& conv,
                          const std::optional<U>& value, const MapperOptions& opts) {
            if (value) inner::write(d, layout, conv, *value, opts);
        }
    };

    // Collection of records (repeated child directives) or scalars (repeated
    // arguments, or repeated child directives when the field asks for it).
    template <typename U, typename A>
    struct FieldCodec<std::vector<U, A>> {
        static_assert(supported_layout<std::vector<U, A>>::value,
                      "std::vector of std::optional or of std::vector is not a supported field layout");
        using inner = FieldCodec<U>;
        using element_type = typename inner::element_type;

        static Conversion<element_type> default_conversion() { return inner::default_conversion(); }

        static void read(const Directive& d, const FieldLayout& layout, const Conversion<element_type>& conv,
                         std::vector<U, A>& out, const MapperOptions& opts, const std::string& path) {
            std::string key = layout.key(opts);
            out.clear();
            if constexpr (has_mapping<U>::value) {
                std::size_t index = 0;
                for (auto const* child : d.find_all(key))
                    out.push_back(read_record<U>(*child, opts, join_path(path, key) + "[" + std::to_string(index++) + "]"));
            } else if (layout.collection == Collection::Directives) {
                std::size_t index = 0;
                for (auto const* child : d.find_all(key)) {
                    std::string item = join_path(path, key) + "[" + std::to_string(index++) + "]";
                    if (child->arguments.size() <= layout.argument) throw MissingField(item);
                    out.push_back(convert_argument(conv, child->arguments[layout.argument], item));
                }
            } else {
                const Directive* child = find_last(d, key);
                if (child == nullptr) return;
                for (std::size_t k = 0; k < child->arguments.size(); ++k)
                    out.push_back(convert_argument(conv, child->arguments[k],
                                                   join_path(path, key) + "[" + std::to_string(k) + "]"));
            }
        }

        static void write(Directive& d, const FieldLayout& layout, const Conversion<element_type>& conv,
                          const std::vector<U, A>& value, const MapperOptions& opts) {
            if constexpr (has_mapping<U>::value) {
                for (auto const& item : value) inner::write(d, layout, conv, item, opts);
            } else if (layout.collection == Collection::Directives) {
                for (auto const& item : value) inner::append(d, layout, conv, item, opts);
            } else {
                if (value.empty()) return;
                Directive child(Argument::word(layout.key(opts)));
                for (auto const& item : value) child.add_argument(make_argument(conv.render(item), conv.kind));
                d.add_child(std::move(child));
            }
        }
    };

    // Argument of the record's own directive that a positional field occupies.
    struct ArgumentSlot {
        std::size_t index;
        std::string id;
        bool optional;
    };

    template <typename R>
    class FieldBase {
      public:
        virtual ~FieldBase() = default;

        virtual void read(const Directive& d, R& out, const MapperOptions& opts, const std::string& path) const = 0;
        virtual void write(const R& in, Directive& d, const MapperOptions& opts) const = 0;

        // Name of the child directive the field reads; empty for positional arguments.
        virtual std::string key(const MapperOptions& opts) const = 0;

        virtual std::optional<ArgumentSlot> slot() const { return std::nullopt; }
        virtual bool present(const R&) const { return true; }
    };

}  // namespace detail

// A member stored in a child directive of the record's directive.
template <typename R, typename M>
class MemberField : public detail::FieldBase<R> {
  public:
    using codec = detail::FieldCodec<M>;
    using element_type = typename codec::element_type;

    MemberField(std::string id, M R::*member) : member_(member), conv_(codec::default_conversion()) {
        layout_.id = std::move(id);
    }

    // Use `name` in text instead of the translated identifier.
    MemberField& rename(std::string name) {
        layout_.rename = std::move(name);
        return *this;
    }

    // Store a collection of scalars as one child directive per element.
    MemberField& repeated() {
        layout_.collection = Collection::Directives;
        return *this;
    }

    // Read scalars from this argument of the child directive instead of the first.
    MemberField& argument(std::size_t index) {
        layout_.argument = index;
        return *this;
    }

    MemberField& convert(Conversion<element_type> conversion) {
        conv_ = std::move(conversion);
        return *this;
    }

    void read(const Directive& d, R& out, const MapperOptions& opts, const std::string& path) const override {
        codec::read(d, layout_, conv_, out.*member_, opts, path);
    }

    void write(const R& in, Directive& d, const MapperOptions& opts) const override {
        codec::write(d, layout_, conv_, in.*member_, opts);
    }

    std::string key(const MapperOptions& opts) const override { return layout_.key(opts); }

  private:
    detail::FieldLayout layout_;
    M R::*member_;
    Conversion<element_type> conv_;
};

// A scalar (or optional scalar) stored as an argument of the record's own
// directive, e.g. the name in `server "example.com" { ... }`.
template <typename R, typename M>
class PositionalField : public detail::FieldBase<R> {
  public:
    using value_type = typename std::conditional_t<detail::is_optional<M>::value, M, std::optional<M>>::value_type;

    PositionalField(std::size_t index, std::string id, M R::*member)
        : index_(index), id_(std::move(id)), member_(member), conv_(Conversion<value_type>::builtin()) {}

    PositionalField& convert(Conversion<value_type> conversion) {
        conv_ = std::move(conversion);
        return *this;
    }

    void read(const Directive& d, R& out, const MapperOptions&, const std::string& path) const override {
        std::string where = detail::join_path(path, id_);
        if (d.arguments.size() <= index_) {
            if constexpr (detail::is_optional<M>::value) {
                (out.*member_).reset();
                return;
            } else {
                throw MissingField(where);
            }
        }
        out.*member_ = detail::convert_argument(conv_, d.arguments[index_], where);
    }

    void write(const R& in, Directive& d, const MapperOptions&) const override {
        const value_type* value = nullptr;
        if constexpr (detail::is_optional<M>::value) {
            if (!(in.*member_)) return;
            value = &*(in.*member_);
        } else {
            value = &(in.*member_);
        }
        while (d.arguments.size() <= index_) d.add_argument(Argument::quoted(""));
        d.arguments[index_] = detail::make_argument(conv_.render(*value), conv_.kind);
    }

    std::string key(const MapperOptions&) const override { return std::string(); }

    std::optional<detail::ArgumentSlot> slot() const override {
        return detail::ArgumentSlot{index_, id_, detail::is_optional<M>::value};
    }

    bool present(const R& in) const override {
        if constexpr (detail::is_optional<M>::value)
            return (in.*member_).has_value();
        else
            return true;
    }

  private:
    std::size_t index_;
    std::string id_;
    M R::*member_;
    Conversion<value_type> conv_;
};

// Field descriptors of a record type, in declaration order.
template <typename R>
class Mapping {
  public:
    using field_list = std::vector<std::unique_ptr<detail::FieldBase<R>>>;

    // Directive name of the record at the top level of a document.
    Mapping& name(std::string n) {
        name_ = std::move(n);
        return *this;
    }
    const std::string& name() const noexcept { return name_; }

    template <typename M>
    MemberField<R, M>& field(std::string id, M R::*member) {
        auto f = std::make_unique<MemberField<R, M>>(std::move(id), member);
        auto& ref = *f;
        fields_.push_back(std::move(f));
        return ref;
    }

    template <typename M>
    PositionalField<R, M>& argument(std::size_t index, std::string id, M R::*member) {
        auto f = std::make_unique<PositionalField<R, M>>(index, std::move(id), member);
        auto& ref = *f;
        fields_.push_back(std::move(f));
        return ref;
    }

    const field_list& fields() const noexcept { return fields_; }

    // The description of R, built once from MappingTraits<R>.
    static const Mapping& get() {
        static const Mapping instance = [] {
            Mapping m;
            MappingTraits<R>::describe(m);
            m.check_arguments();
            return m;
        }();
        return instance;
    }

  private:
    // An optional argument followed by a required one could not be told
    // apart from it when the optional one is absent.
    void check_arguments() const {
        for (auto const& a : fields_) {
            auto first = a->slot();
            if (!first or !first->optional) continue;
            for (auto const& b : fields_) {
                auto later = b->slot();
                if (later and !later->optional and later->index > first->index)
                    throw MapperError("optional argument '" + first->id + "' at index " +
                                          std::to_string(first->index) + " precedes required argument '" +
                                          later->id + "' at index " + std::to_string(later->index),
                                      first->id);
            }
        }
    }

    std::string name_;
    field_list fields_;
};

namespace detail {

    template <typename R>
    R read_record(const Directive& d, const MapperOptions& opts, const std::string& path) {
        const auto& mapping = Mapping<R>::get();
        R out{};
        for (auto const& f : mapping.fields()) f->read(d, out, opts, path);
        if (opts.strict) {
            std::vector<std::string> known;
            for (auto const& f : mapping.fields()) {
                std::string k = f->key(opts);
                if (!k.empty()) known.push_back(k);
            }
            for (auto const& c : d.children) {
                bool matched = false;
                for (auto const& k : known) matched = matched || k == c.name.value;
                if (!matched)
                    throw UnknownField(join_path(path, c.name.value), suggest_similar(c.name.value, known));
            }
        }
        return out;
    }

    template <typename R>
    Directive write_record(const R& value, const std::string& name, const MapperOptions& opts) {
        Directive d(Argument::word(name));
        d.has_block = true;
        const auto& fields = Mapping<R>::get().fields();
        for (auto const& f : fields) f->write(value, d, opts);
        // an absent optional argument may only be followed by absent ones
        for (auto const& f : fields) {
            auto s = f->slot();
            if (s and !f->present(value) and s->index < d.arguments.size())
                throw SerializeError("argument '" + s->id + "' at index " + std::to_string(s->index) +
                                     " is absent but a later argument is set");
        }
        return d;
    }

    template <typename R>
    std::string top_level_name() {
        const std::string& n = Mapping<R>::get().name();
        return n.empty() ? std::string("root") : n;
    }

}  // namespace detail

// Builds R from its directive. Throws MissingField, ConversionError and, in
// strict mode, UnknownField; unknown children are otherwise ignored.
template <typename R>
R from_directive(const Directive& d, const MapperOptions& opts = {}) {
    return detail::read_record<R>(d, opts, "");
}

// Directive for R named after its mapping ("root" when the mapping has no name).
template <typename R>
Directive to_directive(const R& value, const MapperOptions& opts = {}) {
    return detail::write_record(value, detail::top_level_name<R>(), opts);
}

// Maps the top-level directive named by R's mapping, or the first directive
// when the mapping has no name.
template <typename R>
R map_from(const Document& doc, const MapperOptions& opts = {}) {
    const std::string& name = Mapping<R>::get().name();
    const Directive* target = nullptr;
    if (name.empty())
        target = doc.empty() ? nullptr : &doc.directives.front();
    else
        target = doc.find(name);
    if (target == nullptr) throw MissingField(name.empty() ? detail::top_level_name<R>() : name);
    return from_directive<R>(*target, opts);
}

template <typename R>
Document map_to(const R& value, const MapperOptions& opts = {}) {
    Document doc;
    doc.directives.push_back(to_directive(value, opts));
    return doc;
}

template <typename R>
R from_string(const std::string& text, const MapperOptions& opts = {}) {
    return map_from<R>(parse(text, opts.parser), opts);
}

template <typename R>
std::string to_string(const R& value, const MapperOptions& opts = {}) {
    return serialize(map_to(value, opts), opts);
}

}  // namespace cf
