#pragma once

#include "file_descriptor.hpp"
#include "platform_abstraction/abstract_process.hpp"

#include <system_error>

namespace ipc {

    class LinuxProcess final : public AbstractProcess {
        FileDescriptor _pidfd;
        FileDescriptor _err;
        FileDescriptor _out;

        void drain(FileDescriptor &fd, const OutputCallback &handler);

    public:
        LinuxProcess() noexcept = default;
        LinuxProcess(const LinuxProcess &) = delete;
        LinuxProcess(LinuxProcess &&) = delete;
        LinuxProcess &operator=(const LinuxProcess &) = delete;
        LinuxProcess &operator=(LinuxProcess &&) = delete;
        ~LinuxProcess() noexcept override = default;

        LinuxProcess &setPidFd(FileDescriptor &&pidfd) noexcept {
            _pidfd = std::move(pidfd);
            return *this;
        }

        LinuxProcess &setOut(FileDescriptor out) noexcept {
            _out = std::move(out);
            return *this;
        }

        LinuxProcess &setErr(FileDescriptor err) noexcept {
            _err = std::move(err);
            return *this;
        }

        LinuxProcess &setErrHandler(OutputCallback handler) noexcept {
            _onErr = std::move(handler);
            return *this;
        }

        LinuxProcess &setOutHandler(OutputCallback handler) noexcept {
            _onOut = std::move(handler);
            return *this;
        }

        [[nodiscard]] int queryReturnCode(std::error_code &ec) noexcept;

        [[nodiscard]] int wait() override;
    };

    using Process = LinuxProcess;
} // namespace ipc
