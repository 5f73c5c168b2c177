#include "file_descriptor.hpp"
#include <array>
#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>

namespace {
    constexpr bool isNonBlockingError(int err) noexcept {
        if constexpr(EAGAIN == EWOULDBLOCK) {
            return err == EWOULDBLOCK;
        } else {
            return err == EWOULDBLOCK || err == EAGAIN;
        }
    }
} // namespace

void FileDescriptor::reset(int newFd) noexcept {
    if(int old = std::exchange(_fd, newFd); old != -1) {
        if(::close(old) == -1) {
            perror("close");
        }
    }
}

void FileDescriptor::duplicate(int fd) const {
    if(dup2(_fd, fd) == -1) {
        throw std::system_error(errno, std::generic_category());
    }
}

void FileDescriptor::setNonBlocking() const {
    int flags = fcntl(_fd, F_GETFL);
    if(flags == -1 || fcntl(_fd, F_SETFL, flags | O_NONBLOCK) == -1) {
        throw std::system_error(errno, std::generic_category());
    }
}

std::string FileDescriptor::readAll() const {
    if(!*this) {
        return {};
    }

    std::string output;
    static constexpr size_t defaultBufferSize = 0xFFF;
    std::array<char, defaultBufferSize> buffer{};

    for(;;) {
        ssize_t bytesRead = read(buffer);
        if(bytesRead == -1) {
            if(errno == EINTR) {
                continue;
            }
            if(isNonBlockingError(errno)) {
                break;
            }
            perror("read");
            throw std::system_error(errno, std::generic_category());
        }
        if(bytesRead == 0) {
            break; // EOF
        }
        output.append(buffer.data(), bytesRead);
    }

    return output;
}

ssize_t FileDescriptor::read(std::span<char> buffer) const noexcept {
    return ::read(_fd, buffer.data(), buffer.size_bytes());
}
