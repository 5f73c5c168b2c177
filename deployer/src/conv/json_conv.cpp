#include "json_conv.hpp"
#include "errors/errors.hpp"
#include <fstream>
#include <rapidjson/error/en.h>
#include <rapidjson/istreamwrapper.h>

namespace conv {

    static errors::JsonParseError parseError(const rapidjson::ParseResult &result) {
        return errors::JsonParseError(
            std::string("Unable to parse JSON: ") + rapidjson::GetParseError_En(result.Code())
            + " (offset " + std::to_string(result.Offset()) + ")");
    }

    data::Value JsonHelper::parse(const std::string &text) {
        data::Value value;
        JsonReader reader;
        reader.push(std::make_unique<JsonElementResponder>(reader, value));
        auto result = reader.readString(text);
        if(!result) {
            throw parseError(result);
        }
        return value;
    }

    data::Value JsonHelper::parseFile(const std::filesystem::path &path) {
        std::ifstream stream{path};
        if(!stream.is_open()) {
            throw errors::JsonParseError("Unable to read JSON file " + path.string());
        }
        data::Value value;
        JsonReader reader;
        reader.push(std::make_unique<JsonElementResponder>(reader, value));
        auto result = reader.readStream(stream);
        if(!result) {
            throw parseError(result);
        }
        return value;
    }

    std::string JsonHelper::toJson(const data::Value &value) {
        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        serialize(writer, value);
        return {buffer.GetString(), buffer.GetSize()};
    }

    // NOLINTNEXTLINE(*-no-recursion)
    void JsonHelper::serialize(
        rapidjson::Writer<rapidjson::StringBuffer> &writer, const data::Value &value) {
        switch(value.kind()) {
            case data::Value::Kind::Null:
                writer.Null();
                break;
            case data::Value::Kind::Bool:
                writer.Bool(value.getBool());
                break;
            case data::Value::Kind::Int:
                writer.Int64(value.getInt());
                break;
            case data::Value::Kind::Double:
                writer.Double(value.getDouble());
                break;
            case data::Value::Kind::String: {
                const auto &str = value.getString();
                writer.String(str.data(), static_cast<rapidjson::SizeType>(str.size()));
                break;
            }
            case data::Value::Kind::List:
                writer.StartArray();
                for(const auto &item : *value.getList()) {
                    serialize(writer, item);
                }
                writer.EndArray();
                break;
            case data::Value::Kind::Map:
                writer.StartObject();
                for(const auto &[key, item] : *value.getMap()) {
                    writer.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
                    serialize(writer, item);
                }
                writer.EndObject();
                break;
        }
    }

    rapidjson::ParseResult JsonReader::readStream(std::istream &stream) {
        rapidjson::IStreamWrapper wrapper{stream};
        rapidjson::Reader reader;
        return reader.Parse(wrapper, *this);
    }

    rapidjson::ParseResult JsonReader::readString(const std::string &text) {
        rapidjson::StringStream stream{text.c_str()};
        rapidjson::Reader reader;
        return reader.Parse(stream, *this);
    }

    bool JsonMapResponder::parseValue(data::Value value) {
        if(_state == JsonState::ExpectValue) {
            _state = JsonState::ExpectKey;
            _target->put(_key, std::move(value));
            return true;
        } else {
            return false;
        }
    }

    bool JsonMapResponder::parseKey(const std::string_view &key) {
        if(_state == JsonState::ExpectKey) {
            _state = JsonState::ExpectValue;
            _key = key;
            return true;
        } else {
            return false;
        }
    }

    bool JsonMapResponder::parseStartObject() {
        if(_state == JsonState::ExpectStartObject) {
            _state = JsonState::ExpectKey;
            return true;
        } else if(_state == JsonState::ExpectValue) {
            _reader.push(std::make_unique<JsonMapResponder>(_reader, true));
            return true;
        } else {
            return false;
        }
    }

    bool JsonMapResponder::parseEndObject() {
        if(_state == JsonState::ExpectKey) {
            // 'pop' will delete this responder
            return _reader.pop(data::Value{_target});
        } else {
            return false;
        }
    }

    bool JsonMapResponder::parseStartArray() {
        if(_state == JsonState::ExpectValue) {
            _reader.push(std::make_unique<JsonListResponder>(_reader, true));
            return true;
        } else {
            return false;
        }
    }

    bool JsonMapResponder::parseEndArray() {
        return false;
    }

    bool JsonListResponder::parseValue(data::Value value) {
        if(_state == JsonState::ExpectValue) {
            _target->push(std::move(value));
            return true;
        } else {
            return false;
        }
    }

    bool JsonListResponder::parseKey(const std::string_view &) {
        return false;
    }

    bool JsonListResponder::parseStartObject() {
        if(_state == JsonState::ExpectValue) {
            _reader.push(std::make_unique<JsonMapResponder>(_reader, true));
            return true;
        } else {
            return false;
        }
    }

    bool JsonListResponder::parseEndObject() {
        return false;
    }

    bool JsonListResponder::parseStartArray() {
        if(_state == JsonState::ExpectStartArray) {
            _state = JsonState::ExpectValue;
            return true;
        } else if(_state == JsonState::ExpectValue) {
            _reader.push(std::make_unique<JsonListResponder>(_reader, true));
            return true;
        } else {
            return false;
        }
    }

    bool JsonListResponder::parseEndArray() {
        if(_state == JsonState::ExpectValue) {
            // 'pop' will delete this responder
            return _reader.pop(data::Value{_target});
        } else {
            return false;
        }
    }

    bool JsonElementResponder::parseValue(data::Value value) {
        _value = value;
        return _reader.pop(std::move(value));
    }

    bool JsonElementResponder::parseStartObject() {
        _reader.push(std::make_unique<JsonMapResponder>(_reader, true));
        return true;
    }

    bool JsonElementResponder::parseStartArray() {
        _reader.push(std::make_unique<JsonListResponder>(_reader, true));
        return true;
    }

    bool JsonElementResponder::parseKey(const std::string_view &) {
        return false;
    }

    bool JsonElementResponder::parseEndObject() {
        return false;
    }

    bool JsonElementResponder::parseEndArray() {
        return false;
    }
} // namespace conv
