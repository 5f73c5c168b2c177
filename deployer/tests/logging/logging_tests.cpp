#include "conv/json_conv.hpp"
#include "errors/errors.hpp"
#include "logging/log_manager.hpp"
#include <catch2/catch_all.hpp>
#include <sstream>

using Catch::Matchers::ContainsSubstring;

// NOLINTBEGIN

class CapturedLog {
    std::shared_ptr<logging::LogManager> _manager{logging::LogManager::instance()};

public:
    std::stringstream out;

    explicit CapturedLog(logging::Level level, logging::Format format = logging::Format::Text) {
        _manager->setStream(out);
        _manager->setLevel(level);
        _manager->setFormat(format);
    }

    ~CapturedLog() {
        _manager->resetStream();
        _manager->setLevel(logging::Level::Info);
        _manager->setFormat(logging::Format::Text);
    }
};

SCENARIO("Basic use of logging", "[logging]") {
    const auto LOG = // NOLINT(cert-err58-cpp)
        logging::Logger::of("deployer.test.Logging");

    GIVEN("Text output at info level") {
        CapturedLog captured(logging::Level::Info);
        WHEN("Logging a simple event at error") {
            LOG.atError().event("log-event").kv("key", "value").log("message");
            THEN("One line carries the event details") {
                auto line = captured.out.str();
                REQUIRE_THAT(line, ContainsSubstring("[ERROR] (deployer.test.Logging)"));
                REQUIRE_THAT(line, ContainsSubstring("log-event: message."));
                REQUIRE_THAT(line, ContainsSubstring("{key=value}"));
            }
        }
        WHEN("Logging below the level") {
            LOG.atDebug("hidden").log("not shown");
            THEN("Nothing is written") {
                REQUIRE(captured.out.str().empty());
                REQUIRE_FALSE(LOG.isDebugEnabled());
            }
        }
        WHEN("Logging with a cause") {
            LOG.atWarn("with-cause").cause(errors::StatusReportError("boom")).log();
            THEN("The error kind is shown") {
                REQUIRE_THAT(captured.out.str(), ContainsSubstring("cause=StatusReportError"));
            }
        }
        WHEN("Logging through a child logger with a default key") {
            auto child = LOG.createChild();
            child.addDefaultKeyValue("binary", "helm3");
            child.atInfo("exec").kv("exitCode", 0).log();
            LOG.atInfo("parent").log();
            THEN("Only the child's events carry the default key") {
                auto text = captured.out.str();
                auto split = text.find('\n');
                REQUIRE(split != std::string::npos);
                REQUIRE_THAT(text.substr(0, split), ContainsSubstring("binary=helm3"));
                REQUIRE_THAT(text.substr(0, split), ContainsSubstring("exitCode=0"));
                REQUIRE_THAT(text.substr(split + 1), !ContainsSubstring("binary="));
            }
        }
        WHEN("Logging and throwing") {
            THEN("The error is thrown after it was logged") {
                REQUIRE_THROWS_AS(
                    LOG.atError("fatal").logAndThrow(errors::PluginInstallError("failed")),
                    errors::PluginInstallError);
                REQUIRE_THAT(captured.out.str(), ContainsSubstring("fatal"));
            }
        }
    }

    GIVEN("JSON output at trace level") {
        CapturedLog captured(logging::Level::Trace, logging::Format::Json);
        WHEN("Logging an event") {
            LOG.atTrace("json-event").kv("count", 3).log("structured");
            THEN("The line is a JSON object with the entry fields") {
                auto entry = conv::JsonHelper::parse(captured.out.str()).getMap();
                REQUIRE(entry->get("event").getString() == "json-event");
                REQUIRE(entry->get("level").getString() == "TRACE");
                REQUIRE(entry->get("message").getString() == "structured");
                REQUIRE(entry->get("loggerName").getString() == "deployer.test.Logging");
                REQUIRE(entry->get("contexts").getMap()->get("count").getInt() == 3);
            }
        }
    }

    GIVEN("Level and format names") {
        THEN("They parse case-insensitively") {
            REQUIRE(logging::LogManager::parseLevel("Debug") == logging::Level::Debug);
            REQUIRE(logging::LogManager::parseLevel("WARN") == logging::Level::Warn);
            REQUIRE_FALSE(logging::LogManager::parseLevel("verbose").has_value());
            REQUIRE(logging::LogManager::parseFormat("json") == logging::Format::Json);
        }
    }
}

// NOLINTEND
