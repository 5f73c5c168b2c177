#pragma once
#include "logging/log_manager.hpp"
#include <exception>

namespace util {

    /**
     * Run a best-effort step. A std::exception is logged as a warning and dropped; the step's
     * outcome never reaches the caller.
     * @return true if the step completed without throwing
     */
    template<typename Func>
    bool nonFatal(const logging::Logger &log, std::string_view event, Func &&step) {
        try {
            std::forward<Func>(step)();
            return true;
        } catch(const std::exception &err) {
            log.atWarn(event).cause(err).log();
            return false;
        }
    }
} // namespace util
