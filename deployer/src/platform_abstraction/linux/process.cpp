#include "process.hpp"
#include "syscall.hpp"

#include <array>
#include <cerrno>
#include <poll.h>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace ipc {

    int LinuxProcess::queryReturnCode(std::error_code &ec) noexcept {
        siginfo_t info{};
        int rc;
        do {
            rc = pidfd_wait(_pidfd.get(), &info, WEXITED);
        } while(rc < 0 && errno == EINTR);
        if(rc < 0) {
            ec = {errno, std::generic_category()};
            return -1;
        }
        ec = {};
        if(info.si_code == CLD_EXITED) {
            return info.si_status;
        }
        // killed or dumped, report as a shell would
        return 128 + info.si_status;
    }

    void LinuxProcess::drain(FileDescriptor &fd, const OutputCallback &handler) {
        auto message = fd.readAll();
        if(!message.empty() && handler) {
            handler(message);
        }
    }

    int LinuxProcess::wait() {
        // Read both pipes until the child closes them, then reap it
        while(_out || _err) {
            std::array<pollfd, 2> fds{
                pollfd{.fd = _out.get(), .events = POLLIN, .revents = 0},
                pollfd{.fd = _err.get(), .events = POLLIN, .revents = 0},
            };
            if(poll(fds.data(), fds.size(), -1) == -1) {
                if(errno == EINTR) {
                    continue;
                }
                throw std::system_error(errno, std::generic_category());
            }
            if(fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
                drain(_out, _onOut);
                if(fds[0].revents & (POLLHUP | POLLERR) && !(fds[0].revents & POLLIN)) {
                    _out.close();
                }
            }
            if(fds[1].revents & (POLLIN | POLLHUP | POLLERR)) {
                drain(_err, _onErr);
                if(fds[1].revents & (POLLHUP | POLLERR) && !(fds[1].revents & POLLIN)) {
                    _err.close();
                }
            }
        }
        std::error_code ec{};
        auto returnCode = queryReturnCode(ec);
        if(ec) {
            throw std::system_error(ec, "waitid");
        }
        _pidfd.close();
        return returnCode;
    }
} // namespace ipc
