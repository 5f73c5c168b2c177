#pragma once

#include "lookup_table.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string_view>

/**
 * Structured logging facade. When logging an item, it isn't simply logging a string, but logging
 * structured data: an event type, a message, an optional cause and a set of key/value pairs.
 * Minimal work is done when a log-level is disabled. The actual formatting and output lives
 * behind Traits::getManager().
 */
namespace logging {

    enum class Level { None, Trace, Debug, Info, Warn, Error };
    enum class Format { Text, Json };

    template<typename Traits>
    class LoggerBase;

    template<typename Traits>
    class Event;

    /**
     * Interface for the log manager implementation
     */
    template<typename Traits>
    class LogManagerBase : public std::enable_shared_from_this<LogManagerBase<Traits>> {

    public:
        using SymbolType = typename Traits::SymbolType;
        using SymbolArgType = typename Traits::SymbolArgType;
        using StructArgType = typename Traits::StructArgType;

        static constexpr std::string_view NONE_LEVEL{"NONE"};
        static constexpr std::string_view TRACE_LEVEL{"TRACE"};
        static constexpr std::string_view DEBUG_LEVEL{"DEBUG"};
        static constexpr std::string_view INFO_LEVEL{"INFO"};
        static constexpr std::string_view WARN_LEVEL{"WARN"};
        static constexpr std::string_view ERROR_LEVEL{"ERROR"};

        static constexpr std::string_view CAUSE_KEY{"cause"};
        static constexpr std::string_view CONTEXTS_KEY{"contexts"};
        static constexpr std::string_view EVENT_KEY{"event"};
        static constexpr std::string_view LEVEL_KEY{"level"};
        static constexpr std::string_view LOGGER_NAME_KEY{"loggerName"};
        static constexpr std::string_view MESSAGE_KEY{"message"};
        static constexpr std::string_view TIMESTAMP_KEY{"timestamp"};
        static constexpr std::string_view CAUSE_MESSAGE_KEY{"message"};
        static constexpr std::string_view CAUSE_KIND_KEY{"kind"};

        static constexpr util::LookupTable<std::string_view, Level, 5> LEVEL_MAP{
            TRACE_LEVEL,
            Level::Trace,
            DEBUG_LEVEL,
            Level::Debug,
            INFO_LEVEL,
            Level::Info,
            WARN_LEVEL,
            Level::Warn,
            ERROR_LEVEL,
            Level::Error};

    public:
        LogManagerBase() = default;

        LogManagerBase(const LogManagerBase &) noexcept = delete;

        LogManagerBase(LogManagerBase &&) noexcept = delete;

        LogManagerBase &operator=(const LogManagerBase &) noexcept = delete;

        LogManagerBase &operator=(LogManagerBase &&) noexcept = delete;

        virtual ~LogManagerBase() noexcept = default;

        static std::string_view toSymbol(Level level) noexcept {
            return LEVEL_MAP.rlookup(level).value_or(NONE_LEVEL);
        }

        virtual void setLevel(Level level) = 0;

        [[nodiscard]] virtual Level getLevel() const = 0;

        virtual void logEvent(StructArgType entry) = 0;

        LoggerBase<Traits> getLogger(SymbolArgType loggerName) noexcept;
    };

    namespace detail {
        template<typename Traits>
        struct EventImplBase;

        /**
         * Per-name logger state shared by all copies of a Logger
         */
        template<typename Traits>
        class LoggerImpl : public std::enable_shared_from_this<LoggerImpl<Traits>> {
        public:
            using SymbolType = typename Traits::SymbolType;
            using SymbolArgType = typename Traits::SymbolArgType;
            using ArgValue = typename Traits::ArgType;
            using StructType = typename Traits::StructType;
            using StructArgType = typename Traits::StructArgType;

        private:
            const std::shared_ptr<LogManagerBase<Traits>> _manager;
            const SymbolType _loggerName;
            mutable std::shared_mutex _mutex;
            StructType _context{Traits::newStruct()};

        public:
            LoggerImpl(const LoggerImpl &) = delete;

            LoggerImpl(LoggerImpl &&) = delete;

            LoggerImpl &operator=(const LoggerImpl &) = delete;

            LoggerImpl &operator=(LoggerImpl &&) = delete;

            ~LoggerImpl() noexcept = default;

            LoggerImpl(
                const std::shared_ptr<LogManagerBase<Traits>> &manager, SymbolArgType loggerName)
                : _manager(manager), _loggerName(loggerName) {
            }

            void addKV(SymbolArgType key, const ArgValue &val) {
                std::unique_lock guard{_mutex};
                Traits::putStruct(_context, key, val);
            }

            [[nodiscard]] StructType cloneContext() const {
                std::shared_lock guard{_mutex};
                return Traits::cloneStruct(_context);
            }

            void commit(StructArgType entry) {
                Traits::putStruct(
                    entry, LogManagerBase<Traits>::LOGGER_NAME_KEY, ArgValue{_loggerName});
                _manager->logEvent(entry);
            }

            [[nodiscard]] bool isEnabled(Level level) const {
                if(level == Level::None) {
                    return false;
                }
                Level current = _manager->getLevel();
                if(current == Level::None) {
                    return false;
                } else {
                    return current <= level;
                }
            }

            [[nodiscard]] std::shared_ptr<EventImplBase<Traits>> atLevel(Level level);

            [[nodiscard]] std::shared_ptr<LoggerImpl> clone() const {
                auto copy = std::make_shared<LoggerImpl>(_manager, _loggerName);
                copy->_context = cloneContext();
                return copy;
            }
        };

        /**
         * Interface for event implementation
         */
        template<typename Traits>
        struct EventImplBase {
            using SymbolArgType = typename Traits::SymbolArgType;
            using ArgValue = typename Traits::ArgType;
            using ErrorType = typename Traits::ErrorType;

            EventImplBase() noexcept = default;

            EventImplBase(const EventImplBase &) noexcept = default;

            EventImplBase(EventImplBase &&) noexcept = default;

            EventImplBase &operator=(const EventImplBase &) noexcept = default;

            EventImplBase &operator=(EventImplBase &&) noexcept = default;

            virtual ~EventImplBase() noexcept = default;

            virtual void setCause(const ErrorType &) = 0;

            virtual void setEvent(SymbolArgType) = 0;

            virtual void setMessage(const ArgValue &) = 0;

            virtual void addKV(SymbolArgType, const ArgValue &) = 0;

            virtual void addLazyKV(SymbolArgType, const std::function<ArgValue()> &) = 0;

            virtual void commit() = 0;
        };

        /**
         * Event when not logging - optimize for this use-case to do nothing
         */
        template<typename Traits>
        struct EventNoopImpl : public EventImplBase<Traits> {
            using SymbolArgType = typename Traits::SymbolArgType;
            using ArgValue = typename Traits::ArgType;
            using ErrorType = typename Traits::ErrorType;

            void setCause(const ErrorType &) override {
            }

            void setEvent(SymbolArgType) override {
            }

            void setMessage(const ArgValue &) override {
            }

            void addKV(SymbolArgType, const ArgValue &) override {
            }

            void addLazyKV(SymbolArgType, const std::function<ArgValue()> &) override {
            }

            void commit() override {
            }

            inline static std::shared_ptr<EventImplBase<Traits>> self() {
                const static std::shared_ptr<EventImplBase<Traits>> singleton{
                    std::make_shared<EventNoopImpl>()};
                return singleton;
            }
        };

        /**
         * Event when logging. Note that this is intended to be used by only one (current)
         * thread.
         */
        template<typename Traits>
        class EventActiveImpl : public EventImplBase<Traits> {
        public:
            using SymbolArgType = typename Traits::SymbolArgType;
            using ArgValue = typename Traits::ArgType;
            using StructType = typename Traits::StructType;
            using ErrorType = typename Traits::ErrorType;
            using Manager = LogManagerBase<Traits>;

        private:
            std::shared_ptr<LoggerImpl<Traits>> _logger;
            StructType _context;
            StructType _data{Traits::newStruct()};
            Level _level;
            const std::chrono::system_clock::time_point _timestamp =
                std::chrono::system_clock::now();

        public:
            EventActiveImpl(const std::shared_ptr<LoggerImpl<Traits>> &logger, Level level)
                : _logger(logger), _context(logger->cloneContext()), _level(level) {
            }

            void setCause(const ErrorType &error) override {
                StructType cause{Traits::newStruct()};
                std::string what;
                if(error.what() != nullptr) {
                    what = error.what();
                }
                Traits::putStruct(cause, Manager::CAUSE_KIND_KEY, ArgValue{error.kind()});
                Traits::putStruct(cause, Manager::CAUSE_MESSAGE_KEY, ArgValue{what});
                Traits::putStruct(_data, Manager::CAUSE_KEY, Traits::wrapStruct(cause));
                setMessage(ArgValue{what});
            }

            void setEvent(SymbolArgType eventType) override {
                Traits::putStruct(_data, Manager::EVENT_KEY, ArgValue{eventType});
            }

            void setMessage(const ArgValue &message) override {
                Traits::putStruct(_data, Manager::MESSAGE_KEY, message);
            }

            void addKV(SymbolArgType key, const ArgValue &value) override {
                Traits::putStruct(_context, key, value);
            }

            void addLazyKV(SymbolArgType key, const std::function<ArgValue()> &func) override {
                addKV(key, func());
            }

            void commit() override {
                Traits::putStruct(_data, Manager::LEVEL_KEY, ArgValue{Manager::toSymbol(_level)});
                Traits::putStruct(
                    _data,
                    Manager::TIMESTAMP_KEY,
                    ArgValue{static_cast<int64_t>(
                        std::chrono::duration_cast<std::chrono::milliseconds>(
                            _timestamp.time_since_epoch())
                            .count())});
                Traits::putStruct(_data, Manager::CONTEXTS_KEY, Traits::wrapStruct(_context));
                _logger->commit(_data);
            }
        };

        template<typename Traits>
        [[nodiscard]] std::shared_ptr<EventImplBase<Traits>> LoggerImpl<Traits>::atLevel(
            Level level) {
            if(isEnabled(level)) {
                return std::make_shared<EventActiveImpl<Traits>>(this->shared_from_this(), level);
            } else {
                return EventNoopImpl<Traits>::self();
            }
        }

    } // namespace detail

    /**
     * Builder to build a single event.
     */
    template<typename Traits>
    class Event {
        std::shared_ptr<detail::EventImplBase<Traits>> _impl;

    public:
        using SymbolArgType = typename Traits::SymbolArgType;
        using ArgValue = typename Traits::ArgType;
        using ErrorType = typename Traits::ErrorType;

        explicit Event(const std::shared_ptr<detail::EventImplBase<Traits>> &impl) : _impl(impl) {
        }

        Event() : _impl(detail::EventNoopImpl<Traits>::self()) {
        }

        /**
         * Log a cause of error/event
         */
        Event &cause(const ErrorType &cause) {
            _impl->setCause(cause);
            return *this;
        }

        Event &cause(const std::exception &cause) {
            _impl->setCause(ErrorType::of(cause));
            return *this;
        }

        /**
         * Log an event type - this is expected to be a 'constant' string
         */
        Event &event(SymbolArgType eventType) {
            _impl->setEvent(eventType);
            return *this;
        }

        /**
         * Add context information to event
         */
        Event &kv(SymbolArgType key, const ArgValue &value) {
            _impl->addKV(key, value);
            return *this;
        }

        /**
         * Add context information to event with lazy evaluation as a lambda
         */
        Event &kv(SymbolArgType key, const std::function<ArgValue()> &fn) {
            _impl->addLazyKV(key, fn);
            return *this;
        }

        /**
         * Commit the log entry and throw exception
         */
        template<typename E>
        [[noreturn]] void logAndThrow(const E &err) {
            _impl->setCause(err);
            _impl->commit();
            throw err;
        }

        /**
         * Commit the log entry with no/existing message
         */
        void log() {
            _impl->commit();
        }

        /**
         * Commit the log entry with a message
         */
        void log(const ArgValue &value) {
            _impl->setMessage(value);
            _impl->commit();
        }
    };

    /**
     * Event factory for logging to a given name
     */
    template<typename Traits>
    class LoggerBase {
        std::shared_ptr<detail::LoggerImpl<Traits>> _impl;

    public:
        using SymbolType = typename Traits::SymbolType;
        using SymbolArgType = typename Traits::SymbolArgType;
        using ArgValue = typename Traits::ArgType;

        explicit LoggerBase(const std::shared_ptr<detail::LoggerImpl<Traits>> &impl) : _impl(impl) {
        }

        /**
         * Contextual information added to each event
         */
        LoggerBase &addDefaultKeyValue(SymbolArgType key, const ArgValue &value) {
            _impl->addKV(key, value);
            return *this;
        }

        /**
         * Builder for an enum log level. If not logging, the returned Event is a no-op.
         */
        [[nodiscard]] Event<Traits> atLevel(Level level) const {
            return Event<Traits>{_impl->atLevel(level)};
        }

        [[nodiscard]] Event<Traits> atTrace() const {
            return atLevel(Level::Trace);
        }

        [[nodiscard]] Event<Traits> atTrace(SymbolArgType eventType) const {
            return atTrace().event(eventType);
        }

        [[nodiscard]] Event<Traits> atDebug() const {
            return atLevel(Level::Debug);
        }

        [[nodiscard]] Event<Traits> atDebug(SymbolArgType eventType) const {
            return atDebug().event(eventType);
        }

        [[nodiscard]] Event<Traits> atInfo() const {
            return atLevel(Level::Info);
        }

        [[nodiscard]] Event<Traits> atInfo(SymbolArgType eventType) const {
            return atInfo().event(eventType);
        }

        [[nodiscard]] Event<Traits> atWarn() const {
            return atLevel(Level::Warn);
        }

        [[nodiscard]] Event<Traits> atWarn(SymbolArgType eventType) const {
            return atWarn().event(eventType);
        }

        [[nodiscard]] Event<Traits> atError() const {
            return atLevel(Level::Error);
        }

        [[nodiscard]] Event<Traits> atError(SymbolArgType eventType) const {
            return atError().event(eventType);
        }

        [[nodiscard]] bool isEnabled(Level level) const {
            return _impl->isEnabled(level);
        }

        [[nodiscard]] bool isDebugEnabled() const {
            return isEnabled(Level::Debug);
        }

        /**
         * Copy this instance for purpose of applying additional key/value pairs
         */
        [[nodiscard]] LoggerBase createChild() const {
            return LoggerBase(_impl->clone());
        }

        static LoggerBase of(SymbolArgType loggerName) noexcept {
            std::shared_ptr<logging::LogManagerBase<Traits>> mgr = Traits::getManager();
            return mgr->getLogger(loggerName);
        }
    };

    /**
     * Retrieve logger for given name. The returned value may be stored statically and is
     * thread safe.
     */
    template<typename Traits>
    LoggerBase<Traits> LogManagerBase<Traits>::getLogger(SymbolArgType loggerName) noexcept {
        auto impl{std::make_shared<detail::LoggerImpl<Traits>>(
            LogManagerBase<Traits>::shared_from_this(), loggerName)};
        return LoggerBase<Traits>(impl);
    }
} // namespace logging
