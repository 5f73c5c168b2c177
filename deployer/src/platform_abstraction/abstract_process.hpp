#pragma once

#include <functional>
#include <span>
#include <string_view>

namespace ipc {

    using OutputCallback = std::function<void(std::string_view)>;

    // implementation-defined process information
    class AbstractProcess {
    protected:
        OutputCallback _onOut;
        OutputCallback _onErr;

    public:
        AbstractProcess() noexcept = default;
        AbstractProcess(const AbstractProcess &) = delete;
        AbstractProcess(AbstractProcess &&) = delete;
        AbstractProcess &operator=(const AbstractProcess &) = delete;
        AbstractProcess &operator=(AbstractProcess &&) = delete;
        virtual ~AbstractProcess() noexcept = default;

        // Pump output to the handlers until the process exits, then return its exit code
        [[nodiscard]] virtual int wait() = 0;
    };

} // namespace ipc

#if defined(__linux__)
#include "linux/process.hpp"
#else
#error "Only Linux process support is implemented"
#endif
