#include "pipe.hpp"
#include <array>
#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>

namespace ipc {
    std::pair<FileDescriptor, FileDescriptor> Pipe::MakePipe() {
        std::array<int, 2> fds{};
        // close-on-exec: the child only keeps the ends it dup2s onto stdout/stderr
        if(pipe2(fds.data(), O_CLOEXEC) == -1) {
            perror("pipe2");
            throw std::system_error(errno, std::generic_category());
        }
        return {FileDescriptor{fds[0]}, FileDescriptor{fds[1]}};
    }
} // namespace ipc
