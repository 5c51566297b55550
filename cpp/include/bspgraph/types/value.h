#ifndef BSPGRAPH_TYPES_VALUE_H
#define BSPGRAPH_TYPES_VALUE_H

#include <bspgraph/bspgraph_base.h>

#include <cstdint>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace bspgraph {

    enum class ValueKind {
        NONE = 0,
        BOOL = 1,
        INT = 2,
        DOUBLE = 3,
        STRING = 4,
        LIST = 5,
        MAP = 6,
    };

    [[nodiscard]] BSPGRAPH_EXPORT std::string_view to_string(ValueKind kind);

    /**
     * The dynamically typed payload carried by channels, node outputs and checkpoints. A JSON-like tree:
     * none, bool, 64 bit integer, double, string, list and string keyed map. Maps are ordered so that the textual and
     * binary renderings are deterministic.
     *
     * Equality is structural. Integers and doubles are distinct kinds, so Value{1} != Value{1.0}; use as_number when
     * numeric comparison across the two is intended.
     */
    struct BSPGRAPH_EXPORT Value {
        using list_t = std::vector<Value>;
        using map_t = std::map<std::string, Value, std::less<>>;
        using storage_t = std::variant<std::monostate, bool, int64_t, double, std::string, list_t, map_t>;

        Value() = default;

        Value(std::nullptr_t) {}

        Value(bool v) : _storage{v} {}

        Value(int v) : _storage{static_cast<int64_t>(v)} {}

        Value(int64_t v) : _storage{v} {}

        Value(uint32_t v) : _storage{static_cast<int64_t>(v)} {}

        Value(uint64_t v) : _storage{static_cast<int64_t>(v)} {}

        Value(double v) : _storage{v} {}

        Value(const char *v) : _storage{std::string{v}} {}

        Value(std::string v) : _storage{std::move(v)} {}

        Value(std::string_view v) : _storage{std::string{v}} {}

        Value(list_t v) : _storage{std::move(v)} {}

        Value(map_t v) : _storage{std::move(v)} {}

        static Value list(std::initializer_list<Value> items = {});

        static Value map(std::initializer_list<std::pair<const std::string, Value>> items = {});

        [[nodiscard]] ValueKind kind() const;

        [[nodiscard]] bool is_none() const { return kind() == ValueKind::NONE; }
        [[nodiscard]] bool is_bool() const { return kind() == ValueKind::BOOL; }
        [[nodiscard]] bool is_int() const { return kind() == ValueKind::INT; }
        [[nodiscard]] bool is_double() const { return kind() == ValueKind::DOUBLE; }
        [[nodiscard]] bool is_number() const { return is_int() || is_double(); }
        [[nodiscard]] bool is_string() const { return kind() == ValueKind::STRING; }
        [[nodiscard]] bool is_list() const { return kind() == ValueKind::LIST; }
        [[nodiscard]] bool is_map() const { return kind() == ValueKind::MAP; }

        // Accessors throw std::invalid_argument when the kind does not match.
        [[nodiscard]] bool as_bool() const;

        [[nodiscard]] int64_t as_int() const;

        [[nodiscard]] double as_double() const;

        // Integer or double widened to double.
        [[nodiscard]] double as_number() const;

        [[nodiscard]] const std::string &as_string() const;

        [[nodiscard]] const list_t &as_list() const;

        [[nodiscard]] list_t &as_list();

        [[nodiscard]] const map_t &as_map() const;

        [[nodiscard]] map_t &as_map();

        // Map lookup, returns nullptr when this is not a map or the key is absent.
        [[nodiscard]] const Value *find(std::string_view key) const;

        [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }

        // Map lookup that throws std::out_of_range when the key is absent.
        [[nodiscard]] const Value &at(std::string_view key) const;

        [[nodiscard]] const Value &at(size_t index) const;

        [[nodiscard]] size_t size() const;

        [[nodiscard]] const storage_t &storage() const { return _storage; }

        [[nodiscard]] std::string to_string() const;

        friend bool operator==(const Value &lhs, const Value &rhs) = default;

    private:
        storage_t _storage;
    };

} // namespace bspgraph

template<>
struct fmt::formatter<bspgraph::Value> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const bspgraph::Value &value, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(value.to_string(), ctx);
    }
};

template<>
struct fmt::formatter<bspgraph::ValueKind> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(bspgraph::ValueKind kind, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(bspgraph::to_string(kind), ctx);
    }
};

#endif  // BSPGRAPH_TYPES_VALUE_H
