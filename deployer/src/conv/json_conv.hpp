#pragma once

#include "data/value.hpp"
#include <filesystem>
#include <limits>
#include <memory>
#include <vector>
#include <rapidjson/reader.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace conv {
    class JsonReader;

    enum class JsonState { ExpectValue, ExpectStartObject, ExpectStartArray, ExpectKey };

    /**
     * One level of the SAX parse. Nested containers push a new responder, which pops itself
     * and hands its built value to the parent when the container ends.
     */
    class JsonResponder {
    protected:
        JsonReader &_reader;

    public:
        explicit JsonResponder(JsonReader &reader) : _reader(reader) {
        }

        JsonResponder(const JsonResponder &) = delete;
        JsonResponder(JsonResponder &&) = delete;
        JsonResponder &operator=(const JsonResponder &) = delete;
        JsonResponder &operator=(JsonResponder &&) = delete;
        virtual ~JsonResponder() = default;

        virtual bool parseValue(data::Value value) = 0;
        virtual bool parseKey(const std::string_view &) = 0;
        virtual bool parseStartObject() = 0;
        virtual bool parseEndObject() = 0;
        virtual bool parseStartArray() = 0;
        virtual bool parseEndArray() = 0;
    };

    class JsonMapResponder : public JsonResponder {
        JsonState _state;
        std::string _key;
        std::shared_ptr<data::Map> _target{std::make_shared<data::Map>()};

    public:
        JsonMapResponder(JsonReader &reader, bool started)
            : JsonResponder(reader),
              _state(started ? JsonState::ExpectKey : JsonState::ExpectStartObject) {
        }

        bool parseValue(data::Value value) override;
        bool parseKey(const std::string_view &key) override;
        bool parseStartObject() override;
        bool parseEndObject() override;
        bool parseStartArray() override;
        bool parseEndArray() override;
    };

    class JsonListResponder : public JsonResponder {
        JsonState _state;
        std::shared_ptr<data::List> _target{std::make_shared<data::List>()};

    public:
        JsonListResponder(JsonReader &reader, bool started)
            : JsonResponder(reader),
              _state(started ? JsonState::ExpectValue : JsonState::ExpectStartArray) {
        }

        bool parseValue(data::Value value) override;
        bool parseKey(const std::string_view &key) override;
        bool parseStartObject() override;
        bool parseEndObject() override;
        bool parseStartArray() override;
        bool parseEndArray() override;
    };

    /**
     * Root responder, accepts exactly one value of any type.
     */
    class JsonElementResponder : public JsonResponder {
        data::Value &_value;

    public:
        JsonElementResponder(JsonReader &reader, data::Value &value)
            : JsonResponder(reader), _value(value) {
        }

        bool parseValue(data::Value value) override;
        bool parseKey(const std::string_view &view) override;
        bool parseStartObject() override;
        bool parseStartArray() override;
        bool parseEndObject() override;
        bool parseEndArray() override;
    };

    class JsonReader {
        std::vector<std::unique_ptr<JsonResponder>> _responders;

    public:
        [[nodiscard]] rapidjson::ParseResult readStream(std::istream &stream);
        [[nodiscard]] rapidjson::ParseResult readString(const std::string &text);

        void push(std::unique_ptr<JsonResponder> responder) {
            _responders.emplace_back(std::move(responder));
        }

        [[nodiscard]] bool nested() const {
            return !_responders.empty();
        }

        JsonResponder &top() {
            return *_responders.back();
        }

        bool pop(data::Value value) {
            _responders.pop_back();
            if(nested()) {
                return top().parseValue(std::move(value));
            }
            return true;
        }

        bool Null() {
            return top().parseValue({});
        }

        bool Bool(bool b) {
            return top().parseValue(b);
        }

        bool Int(int i) {
            return Int64(i);
        }

        bool Uint(unsigned u) {
            return Int64(u);
        }

        bool Int64(int64_t i) {
            return top().parseValue(i);
        }

        bool Uint64(uint64_t u) {
            if(u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return Double(static_cast<double>(u));
            }
            return Int64(static_cast<int64_t>(u));
        }

        bool Double(double d) {
            return top().parseValue(d);
        }

        bool StartObject() {
            return top().parseStartObject();
        }

        bool EndObject(rapidjson::SizeType) {
            return top().parseEndObject();
        }

        bool StartArray() {
            return top().parseStartArray();
        }

        bool EndArray(rapidjson::SizeType) {
            return top().parseEndArray();
        }

        bool Key(const char *str, rapidjson::SizeType len, bool) {
            return top().parseKey(std::string_view(str, len));
        }

        bool String(const char *str, rapidjson::SizeType len, bool) {
            return top().parseValue(std::string(str, len));
        }

        bool RawNumber(const char *str, rapidjson::SizeType len, bool copy) {
            return String(str, len, copy);
        }
    };

    struct JsonHelper {
        /**
         * Strict parse: text must hold exactly one JSON document.
         * @throws errors::JsonParseError
         */
        static data::Value parse(const std::string &text);

        /**
         * @throws errors::JsonParseError if the file cannot be read or parsed
         */
        static data::Value parseFile(const std::filesystem::path &path);

        /**
         * Compact JSON text of value
         */
        static std::string toJson(const data::Value &value);

        static void serialize(
            rapidjson::Writer<rapidjson::StringBuffer> &writer, const data::Value &value);
    };
} // namespace conv
