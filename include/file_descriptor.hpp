/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

class FileDescriptor {
    int fd_ = -1;

   public:
    FileDescriptor() = default;

    explicit FileDescriptor(int fd) : fd_(fd) {
        if (fd_ < -1) [[unlikely]] {
            throw std::invalid_argument("FileDescriptor: negative descriptor");
        }
    }

    ~FileDescriptor() noexcept {
        reset();
    }

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.fd_, -1));
        }
        return *this;
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    // Both ends are close-on-exec; the child side is dup2'ed onto a standard
    // stream, which clears the flag on the copy only.
    static std::pair<FileDescriptor, FileDescriptor> make_pipe() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) == -1) {
            throw std::system_error(errno, std::generic_category(), "Failed to create pipe");
        }
        return {FileDescriptor(fds[0]), FileDescriptor(fds[1])};
    }

    void reset(int new_fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = new_fd;
    }

    [[nodiscard]] int get() const {
        if (fd_ < 0) [[unlikely]] {
            throw std::logic_error("FileDescriptor: read of a closed descriptor");
        }
        return fd_;
    }

    explicit operator bool() const noexcept {
        return fd_ >= 0;
    }
};
