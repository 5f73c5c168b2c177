#include "value.hpp"
#include "errors/errors.hpp"
#include <algorithm>

namespace data {

    Value::Value(std::shared_ptr<List> list) noexcept : _value(std::move(list)) {
        if(!std::get<std::shared_ptr<List>>(_value)) {
            _value = std::monostate{};
        }
    }

    Value::Value(std::shared_ptr<Map> map) noexcept : _value(std::move(map)) {
        if(!std::get<std::shared_ptr<Map>>(_value)) {
            _value = std::monostate{};
        }
    }

    bool Value::truthy() const noexcept {
        switch(kind()) {
            case Kind::Null:
                return false;
            case Kind::Bool:
                return std::get<bool>(_value);
            case Kind::Int:
                return std::get<int64_t>(_value) != 0;
            case Kind::Double:
                return std::get<double>(_value) != 0.0;
            case Kind::String:
                return !std::get<std::string>(_value).empty();
            case Kind::List:
            case Kind::Map:
                return true;
        }
        return false;
    }

    bool Value::getBool() const {
        if(!isBool()) {
            throw errors::ValueTypeError("Boolean value is expected");
        }
        return std::get<bool>(_value);
    }

    int64_t Value::getInt() const {
        if(isDouble()) {
            return static_cast<int64_t>(std::get<double>(_value));
        }
        if(!isInt()) {
            throw errors::ValueTypeError("Integer value is expected");
        }
        return std::get<int64_t>(_value);
    }

    double Value::getDouble() const {
        if(isInt()) {
            return static_cast<double>(std::get<int64_t>(_value));
        }
        if(!isDouble()) {
            throw errors::ValueTypeError("Numeric value is expected");
        }
        return std::get<double>(_value);
    }

    const std::string &Value::getString() const {
        if(!isString()) {
            throw errors::ValueTypeError("String value is expected");
        }
        return std::get<std::string>(_value);
    }

    std::shared_ptr<List> Value::getList() const {
        if(!isList()) {
            throw errors::ValueTypeError("List container is expected");
        }
        return std::get<std::shared_ptr<List>>(_value);
    }

    std::shared_ptr<Map> Value::getMap() const {
        if(!isMap()) {
            throw errors::ValueTypeError("Map container is expected");
        }
        return std::get<std::shared_ptr<Map>>(_value);
    }

    // NOLINTNEXTLINE(*-no-recursion)
    bool Value::operator==(const Value &other) const {
        if(kind() != other.kind()) {
            return false;
        }
        switch(kind()) {
            case Kind::List:
                return *getList() == *other.getList();
            case Kind::Map:
                return *getMap() == *other.getMap();
            default:
                return _value == other._value;
        }
    }

    void Map::put(std::string_view key, Value value) {
        auto i = std::find_if(
            _entries.begin(), _entries.end(), [key](const Entry &e) { return e.first == key; });
        if(i != _entries.end()) {
            i->second = std::move(value);
        } else {
            _entries.emplace_back(std::string(key), std::move(value));
        }
    }

    bool Map::hasKey(std::string_view key) const noexcept {
        return std::any_of(
            _entries.begin(), _entries.end(), [key](const Entry &e) { return e.first == key; });
    }

    Value Map::get(std::string_view key) const {
        auto i = std::find_if(
            _entries.begin(), _entries.end(), [key](const Entry &e) { return e.first == key; });
        if(i != _entries.end()) {
            return i->second;
        }
        return {};
    }

} // namespace data
