#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace data {
    class List;
    class Map;

    /**
     * Loosely typed value as it arrives from inputs, event payloads and YAML files. Containers
     * are shared and are treated as immutable once built.
     */
    class Value {
    public:
        using ValueType = std::variant<
            std::monostate,
            bool,
            int64_t,
            double,
            std::string,
            std::shared_ptr<List>,
            std::shared_ptr<Map>>;

        enum class Kind { Null, Bool, Int, Double, String, List, Map };

    private:
        ValueType _value;

    public:
        Value() = default;
        Value(const Value &) = default;
        Value(Value &&) noexcept = default;
        Value &operator=(const Value &) = default;
        Value &operator=(Value &&) noexcept = default;
        ~Value() = default;

        // NOLINTBEGIN(*-explicit-constructor)
        Value(std::monostate) noexcept {
        }
        Value(bool b) noexcept : _value(b) {
        }
        template<
            typename T,
            typename = std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>>
        Value(T i) noexcept : _value(static_cast<int64_t>(i)) {
        }
        Value(double d) noexcept : _value(d) {
        }
        Value(std::string s) noexcept : _value(std::move(s)) {
        }
        Value(std::string_view s) : _value(std::string(s)) {
        }
        Value(const char *s) : _value(std::string(s)) {
        }
        Value(std::shared_ptr<List> list) noexcept;
        Value(std::shared_ptr<Map> map) noexcept;
        // NOLINTEND(*-explicit-constructor)

        [[nodiscard]] Kind kind() const noexcept {
            return static_cast<Kind>(_value.index());
        }

        [[nodiscard]] bool isNull() const noexcept {
            return kind() == Kind::Null;
        }

        [[nodiscard]] bool isBool() const noexcept {
            return kind() == Kind::Bool;
        }

        [[nodiscard]] bool isInt() const noexcept {
            return kind() == Kind::Int;
        }

        [[nodiscard]] bool isDouble() const noexcept {
            return kind() == Kind::Double;
        }

        [[nodiscard]] bool isNumber() const noexcept {
            return isInt() || isDouble();
        }

        [[nodiscard]] bool isString() const noexcept {
            return kind() == Kind::String;
        }

        [[nodiscard]] bool isList() const noexcept {
            return kind() == Kind::List;
        }

        [[nodiscard]] bool isMap() const noexcept {
            return kind() == Kind::Map;
        }

        [[nodiscard]] bool isScalar() const noexcept {
            return !isList() && !isMap() && !isNull();
        }

        /**
         * Falsy values are null, false, zero and the empty string. Containers are always truthy.
         */
        [[nodiscard]] bool truthy() const noexcept;

        [[nodiscard]] bool getBool() const;
        [[nodiscard]] int64_t getInt() const;
        [[nodiscard]] double getDouble() const;
        [[nodiscard]] const std::string &getString() const;
        [[nodiscard]] std::shared_ptr<List> getList() const;
        [[nodiscard]] std::shared_ptr<Map> getMap() const;

        [[nodiscard]] const ValueType &base() const noexcept {
            return _value;
        }

        bool operator==(const Value &other) const;

        bool operator!=(const Value &other) const {
            return !(*this == other);
        }
    };

    class List {
        std::vector<Value> _items;

    public:
        List() = default;

        explicit List(std::vector<Value> items) : _items(std::move(items)) {
        }

        static std::shared_ptr<List> of(std::vector<Value> items) {
            return std::make_shared<List>(std::move(items));
        }

        void push(Value v) {
            _items.emplace_back(std::move(v));
        }

        [[nodiscard]] size_t size() const noexcept {
            return _items.size();
        }

        [[nodiscard]] bool empty() const noexcept {
            return _items.empty();
        }

        [[nodiscard]] const Value &at(size_t idx) const {
            return _items.at(idx);
        }

        [[nodiscard]] auto begin() const noexcept {
            return _items.begin();
        }

        [[nodiscard]] auto end() const noexcept {
            return _items.end();
        }

        bool operator==(const List &other) const {
            return _items == other._items;
        }
    };

    /**
     * String keyed map that keeps insertion order.
     */
    class Map {
    public:
        using Entry = std::pair<std::string, Value>;

    private:
        std::vector<Entry> _entries;

    public:
        Map() = default;

        static std::shared_ptr<Map> of(std::initializer_list<Entry> entries) {
            auto map = std::make_shared<Map>();
            for(const auto &e : entries) {
                map->put(e.first, e.second);
            }
            return map;
        }

        /**
         * Insert or replace. A replaced key keeps its original position.
         */
        void put(std::string_view key, Value value);

        [[nodiscard]] bool hasKey(std::string_view key) const noexcept;

        /**
         * Value for key, or null if not present.
         */
        [[nodiscard]] Value get(std::string_view key) const;

        [[nodiscard]] std::shared_ptr<Map> copy() const {
            return std::make_shared<Map>(*this);
        }

        [[nodiscard]] size_t size() const noexcept {
            return _entries.size();
        }

        [[nodiscard]] bool empty() const noexcept {
            return _entries.empty();
        }

        [[nodiscard]] auto begin() const noexcept {
            return _entries.begin();
        }

        [[nodiscard]] auto end() const noexcept {
            return _entries.end();
        }

        bool operator==(const Map &other) const {
            return _entries == other._entries;
        }
    };

} // namespace data
