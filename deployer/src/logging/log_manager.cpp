#include "log_manager.hpp"
#include "conv/json_conv.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string_util.hpp>

namespace logging {

    std::shared_ptr<LogManagerBase<DeployerLoggingTraits>> DeployerLoggingTraits::getManager() {
        return LogManager::instance();
    }

    std::shared_ptr<LogManager> LogManager::instance() {
        static const std::shared_ptr<LogManager> manager{std::make_shared<LogManager>()};
        return manager;
    }

    std::optional<Level> LogManager::parseLevel(std::string_view level) {
        auto found = LEVEL_MAP.lookup(util::upper(level));
        if(found.has_value()) {
            return found;
        }
        if(util::upper(level) == NONE_LEVEL) {
            return Level::None;
        }
        return {};
    }

    std::optional<Format> LogManager::parseFormat(std::string_view format) {
        return FORMAT_MAP.lookup(util::upper(format));
    }

    void LogManager::setLevel(Level level) {
        _level = level;
    }

    Level LogManager::getLevel() const {
        return _level;
    }

    void LogManager::setFormat(Format format) {
        std::unique_lock guard{_mutex};
        _format = format;
    }

    Format LogManager::getFormat() const {
        std::unique_lock guard{_mutex};
        return _format;
    }

    void LogManager::setStream(std::ostream &stream) {
        std::unique_lock guard{_mutex};
        _stream = &stream;
    }

    void LogManager::resetStream() {
        std::unique_lock guard{_mutex};
        _stream = &std::cerr;
    }

    void LogManager::logEvent(StructArgType entry) {
        std::unique_lock guard{_mutex};
        if(_format == Format::Json) {
            writeJson(*entry, *_stream);
        } else {
            writeText(*entry, *_stream);
        }
    }

    void LogManager::writeJson(const data::Map &entry, std::ostream &stream) const {
        stream << conv::JsonHelper::toJson(data::Value{entry.copy()}) << "\n";
    }

    static std::string renderText(const data::Value &value) {
        if(value.isString()) {
            return value.getString();
        }
        return conv::JsonHelper::toJson(value);
    }

    static std::string formatTimestamp(int64_t millis) {
        std::time_t seconds = millis / 1000;
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        std::ostringstream out;
        out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
            << std::setfill('0') << (millis % 1000) << 'Z';
        return out.str();
    }

    // Format: <timestamp> [<LEVEL>] (<logger>) <event>: <message>. {k=v, ...}
    void LogManager::writeText(const data::Map &entry, std::ostream &stream) const {
        auto timestamp = entry.get(TIMESTAMP_KEY);
        if(timestamp.isInt()) {
            stream << formatTimestamp(timestamp.getInt()) << ' ';
        }
        stream << '[' << renderText(entry.get(LEVEL_KEY)) << "] ("
               << renderText(entry.get(LOGGER_NAME_KEY)) << ')';
        auto event = entry.get(EVENT_KEY);
        if(event.truthy()) {
            stream << ' ' << renderText(event) << ':';
        }
        auto message = entry.get(MESSAGE_KEY);
        if(message.truthy()) {
            stream << ' ' << renderText(message) << '.';
        }
        auto contexts = entry.get(CONTEXTS_KEY);
        if(contexts.isMap() && !contexts.getMap()->empty()) {
            stream << " {";
            bool first = true;
            for(const auto &[key, value] : *contexts.getMap()) {
                if(!first) {
                    stream << ", ";
                }
                first = false;
                stream << key << '=' << renderText(value);
            }
            stream << '}';
        }
        auto cause = entry.get(CAUSE_KEY);
        if(cause.isMap()) {
            stream << " cause=" << renderText(cause.getMap()->get(CAUSE_KIND_KEY));
        }
        stream << "\n";
    }

} // namespace logging
