#pragma once
#include "data/value.hpp"
#include "errors/error_base.hpp"
#include <atomic>
#include <iostream>
#include <logging.hpp>
#include <optional>

namespace logging {

    class LogManager;

    struct DeployerLoggingTraits {
        using SymbolType = std::string;
        using SymbolArgType = std::string_view;
        using ArgType = data::Value;
        using StructType = std::shared_ptr<data::Map>;
        using StructArgType = const StructType &;
        using ErrorType = errors::Error;

        static StructType newStruct() {
            return std::make_shared<data::Map>();
        }
        static StructType cloneStruct(StructArgType s) {
            return s->copy();
        }
        static void putStruct(StructArgType s, std::string_view key, const ArgType &value) {
            s->put(key, value);
        }
        static ArgType wrapStruct(StructArgType s) {
            return ArgType{s};
        }

        static std::shared_ptr<LogManagerBase<DeployerLoggingTraits>> getManager();
    };

    /**
     * Process-wide log sink. Each event is written as one line, either as text or as JSON.
     */
    class LogManager : public LogManagerBase<DeployerLoggingTraits> {
        using Traits = DeployerLoggingTraits;
        mutable std::mutex _mutex;
        std::atomic<Level> _level{Level::Info};
        Format _format{Format::Text};
        std::ostream *_stream{&std::cerr};

        void writeText(const data::Map &entry, std::ostream &stream) const;
        void writeJson(const data::Map &entry, std::ostream &stream) const;

    public:
        static constexpr util::LookupTable<std::string_view, Format, 2> FORMAT_MAP{
            "TEXT",
            Format::Text,
            "JSON",
            Format::Json,
        };

        static std::shared_ptr<LogManager> instance();

        static std::optional<Level> parseLevel(std::string_view level);
        static std::optional<Format> parseFormat(std::string_view format);

        void setLevel(Level level) override;
        [[nodiscard]] Level getLevel() const override;
        void logEvent(StructArgType entry) override;

        void setFormat(Format format);
        [[nodiscard]] Format getFormat() const;

        /**
         * Redirect output, stream must outlive its use. Used by tests.
         */
        void setStream(std::ostream &stream);
        void resetStream();
    };

    using Logger = LoggerBase<DeployerLoggingTraits>;
} // namespace logging
