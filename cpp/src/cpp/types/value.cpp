#include <bspgraph/types/value.h>
#include <bspgraph/util/errors.h>

#include <cmath>
#include <stdexcept>

namespace bspgraph {

    std::string_view to_string(ValueKind kind) {
        switch (kind) {
            case ValueKind::NONE: return "none";
            case ValueKind::BOOL: return "bool";
            case ValueKind::INT: return "int";
            case ValueKind::DOUBLE: return "double";
            case ValueKind::STRING: return "string";
            case ValueKind::LIST: return "list";
            case ValueKind::MAP: return "map";
        }
        return "unknown";
    }

    Value Value::list(std::initializer_list<Value> items) { return Value{list_t{items}}; }

    Value Value::map(std::initializer_list<std::pair<const std::string, Value>> items) {
        return Value{map_t{items}};
    }

    ValueKind Value::kind() const { return static_cast<ValueKind>(_storage.index()); }

    namespace {
        template<typename T>
        const T &expect(const Value::storage_t &storage, ValueKind expected) {
            if (auto *v = std::get_if<T>(&storage)) { return *v; }
            throw_error<std::invalid_argument>("Expected a {} value, got {}", to_string(expected),
                                               to_string(static_cast<ValueKind>(storage.index())));
        }

        void append_escaped(std::string &out, const std::string &s) {
            out.push_back('"');
            for (char c: s) {
                switch (c) {
                    case '"': out += "\\\""; break;
                    case '\\': out += "\\\\"; break;
                    case '\n': out += "\\n"; break;
                    case '\t': out += "\\t"; break;
                    case '\r': out += "\\r"; break;
                    default: out.push_back(c);
                }
            }
            out.push_back('"');
        }

        void render(std::string &out, const Value &value) {
            switch (value.kind()) {
                case ValueKind::NONE: out += "null"; break;
                case ValueKind::BOOL: out += value.as_bool() ? "true" : "false"; break;
                case ValueKind::INT: out += fmt::format("{}", value.as_int()); break;
                case ValueKind::DOUBLE: {
                    auto d = value.as_double();
                    if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 1e15) {
                        out += fmt::format("{:.1f}", d);
                    } else {
                        out += fmt::format("{}", d);
                    }
                    break;
                }
                case ValueKind::STRING: append_escaped(out, value.as_string()); break;
                case ValueKind::LIST: {
                    out.push_back('[');
                    bool first{true};
                    for (const auto &item: value.as_list()) {
                        if (!first) { out.push_back(','); }
                        first = false;
                        render(out, item);
                    }
                    out.push_back(']');
                    break;
                }
                case ValueKind::MAP: {
                    out.push_back('{');
                    bool first{true};
                    for (const auto &[key, item]: value.as_map()) {
                        if (!first) { out.push_back(','); }
                        first = false;
                        append_escaped(out, key);
                        out.push_back(':');
                        render(out, item);
                    }
                    out.push_back('}');
                    break;
                }
            }
        }
    } // namespace

    bool Value::as_bool() const { return expect<bool>(_storage, ValueKind::BOOL); }

    int64_t Value::as_int() const { return expect<int64_t>(_storage, ValueKind::INT); }

    double Value::as_double() const { return expect<double>(_storage, ValueKind::DOUBLE); }

    double Value::as_number() const {
        if (is_int()) { return static_cast<double>(as_int()); }
        if (is_double()) { return as_double(); }
        throw_error<std::invalid_argument>("Expected a numeric value, got {}", bspgraph::to_string(kind()));
    }

    const std::string &Value::as_string() const { return expect<std::string>(_storage, ValueKind::STRING); }

    const Value::list_t &Value::as_list() const { return expect<list_t>(_storage, ValueKind::LIST); }

    Value::list_t &Value::as_list() { return const_cast<list_t &>(std::as_const(*this).as_list()); }

    const Value::map_t &Value::as_map() const { return expect<map_t>(_storage, ValueKind::MAP); }

    Value::map_t &Value::as_map() { return const_cast<map_t &>(std::as_const(*this).as_map()); }

    const Value *Value::find(std::string_view key) const {
        auto *m = std::get_if<map_t>(&_storage);
        if (m == nullptr) { return nullptr; }
        auto it = m->find(key);
        return it == m->end() ? nullptr : &it->second;
    }

    const Value &Value::at(std::string_view key) const {
        if (auto *v = find(key); v != nullptr) { return *v; }
        throw_error<std::out_of_range>("Key '{}' not present in {}", key, to_string());
    }

    const Value &Value::at(size_t index) const {
        const auto &l = as_list();
        if (index >= l.size()) { throw_error<std::out_of_range>("Index {} out of range for list of size {}", index, l.size()); }
        return l[index];
    }

    size_t Value::size() const {
        switch (kind()) {
            case ValueKind::NONE: return 0;
            case ValueKind::STRING: return as_string().size();
            case ValueKind::LIST: return as_list().size();
            case ValueKind::MAP: return as_map().size();
            default: return 1;
        }
    }

    std::string Value::to_string() const {
        std::string out;
        render(out, *this);
        return out;
    }

} // namespace bspgraph
