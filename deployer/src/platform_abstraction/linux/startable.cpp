#include "platform_abstraction/startable.hpp"
#include "file_descriptor.hpp"
#include "pipe.hpp"
#include "process.hpp"
#include "syscall.hpp"
#include <cstdio>
#include <memory>
#include <string_view>
#include <system_error>
#include <tuple>
#include <unistd.h>

namespace ipc {

    // exit code of a child whose exec failed, matching the shell convention
    inline constexpr int execFailedExitCode = 127;

    std::unique_ptr<Process> Startable::start(
        std::string_view command, std::span<char *> argv, std::span<char *> envp) const {

        // prepare to capture child process output
        Pipe outPipe{};
        Pipe errPipe{};

        // Note: all memory allocation for the child process must be performed before forking

        int pidfdOut = -1;

        clone_args clargs{
            .flags = CLONE_PIDFD,
            // NOLINTNEXTLINE(*-pro-type-reinterpret-cast) Linux API compatibility
            .pidfd = reinterpret_cast<__aligned_u64>(&pidfdOut),
            .exit_signal = SIGCHLD,
        };

        auto pid = sys_clone3(&clargs);

        switch(pid) {
            // parent, on error
            case -1:
                perror("clone3");
                throw std::system_error(errno, std::generic_category());

            // child, runs process
            case 0: {
                // At this point, child should be extremely careful which APIs they call;
                // async-signal-safe to be safest

                // create a session so all decendants are reaped with the child
                std::ignore = setsid();

                // close stdin
                FileDescriptor{STDIN_FILENO}.close();

                // pipe program output to parent process
                outPipe.input().duplicate(STDOUT_FILENO);
                errPipe.input().duplicate(STDERR_FILENO);
                std::ignore = outPipe.input().release();
                std::ignore = errPipe.input().release();
                std::ignore = outPipe.output().release();
                std::ignore = errPipe.output().release();

                std::ignore = execvpe(command.data(), argv.data(), envp.data());
                // only reachable if exec fails
                perror("execvpe");
                _exit(execFailedExitCode);
            }

            // parent process, PID is child process
            default: {
                FileDescriptor pidfd{pidfdOut};
                if(!pidfd) {
                    // Most likely: out of file descriptors
                    throw std::system_error(std::error_code{EMFILE, std::generic_category()});
                }

                outPipe.input().close();
                errPipe.input().close();
                outPipe.output().setNonBlocking();
                errPipe.output().setNonBlocking();

                auto process = std::make_unique<Process>();
                process->setPidFd(std::move(pidfd))
                    .setOut(std::move(outPipe.output()))
                    .setErr(std::move(errPipe.output()))
                    .setErrHandler(_errHandler.value_or([](auto &&...) {}))
                    .setOutHandler(_outHandler.value_or([](auto &&...) {}));
                return process;
            }
        }
    }

} // namespace ipc
