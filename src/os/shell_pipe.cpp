#include "include/shell_pipe.hpp"
#include "include/config.hpp"
#include "include/interrupts.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <format>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

#include <poll.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

int pidfd_open(pid_t pid, unsigned int flags) {
#ifdef __NR_pidfd_open
    return static_cast<int>(syscall(__NR_pidfd_open, pid, flags));
#else
    errno = ENOSYS;
    return -1;
#endif
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

struct CappedStream {
    std::string* text = nullptr;
    bool truncated = false;

    void append(const char* data, std::size_t size) {
        if (truncated) return;
        if (text->size() + size > Config::MAX_PIPE_OUTPUT) {
            *text += "\n[Output truncated (too large)]";
            truncated = true;
            return;
        }
        text->append(data, size);
    }
};

}  // namespace

ShellPipe::ShellPipe(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw std::invalid_argument("ShellPipe: Empty argument list");
    }

    std::vector<std::string> args_copy = args;
    std::vector<char*> c_args;
    c_args.reserve(args_copy.size() + 1);

    for (auto& arg : args_copy) {
        c_args.push_back(arg.data());
    }
    c_args.push_back(nullptr);

    auto [out_read, out_write] = FileDescriptor::make_pipe();
    auto [err_read, err_write] = FileDescriptor::make_pipe();
    auto [status_read, status_write] = FileDescriptor::make_pipe();

    pid_t pid = ::fork();
    if (pid == -1) {
        throw std::system_error(errno, std::generic_category(), "Failed to fork process");
    }

    if (pid == 0) {
        int err = 0;
        if (::dup2(out_write.get(), STDOUT_FILENO) == -1 ||
            ::dup2(err_write.get(), STDERR_FILENO) == -1) {
            err = errno;
        } else {
            ::execvp(c_args[0], c_args.data());
            err = errno;
        }

        [[maybe_unused]] auto val = ::write(status_write.get(), &err, sizeof(err));
        ::_exit(127);
    }

    out_write.reset();
    err_write.reset();
    status_write.reset();

    // The status pipe closes on a successful exec; otherwise the child sends errno.
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(status_read.get(), &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        while (::waitpid(pid, nullptr, 0) == -1 && errno == EINTR) {
        }
        throw std::system_error(
            child_errno, std::generic_category(), std::format("Failed to execute '{}'", args.front()));
    }

    stdout_fd_ = std::move(out_read);
    stderr_fd_ = std::move(err_read);
    pid_ = pid;
}

ShellPipe::~ShellPipe() {
    terminate();
}

void ShellPipe::terminate() noexcept {
    stdout_fd_.reset();
    stderr_fd_.reset();

    if (pid_ == -1) {
        return;
    }

    int status;
    if (::waitpid(pid_, &status, WNOHANG) == pid_) {
        pid_ = -1;
        return;
    }

    ::kill(pid_, SIGTERM);

    bool reaped = false;
    int pfd = pidfd_open(pid_, 0);

    if (pfd >= 0) {
        struct pollfd pfd_struct;
        pfd_struct.fd = pfd;
        pfd_struct.events = POLLIN;

        int ret = ::poll(&pfd_struct, 1, Config::TERMINATE_GRACE_MS);
        ::close(pfd);

        if (ret > 0) {
            ::waitpid(pid_, &status, 0);
            reaped = true;
        }
    }

    if (!reaped) {
        for (int i = 0; i < 5; ++i) {
            if (::waitpid(pid_, &status, WNOHANG) == pid_) {
                reaped = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (!reaped) {
            ::kill(pid_, SIGKILL);
            ::waitpid(pid_, nullptr, 0);
        }
    }

    pid_ = -1;
}

std::expected<ProcessOutput, PipeError> ShellPipe::read_all(std::chrono::milliseconds timeout,
                                                            std::stop_token stop) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;

    ProcessOutput result;
    std::array<char, 4096> buffer;
    std::array<CappedStream, 2> streams{CappedStream{&result.stdout_text},
                                        CappedStream{&result.stderr_text}};
    std::array<FileDescriptor*, 2> owners{&stdout_fd_, &stderr_fd_};

    auto cancelled = [&] { return stop.stop_requested() || interrupted(); };

    while (stdout_fd_ || stderr_fd_) {
        if (cancelled()) {
            terminate();
            return std::unexpected(PipeError::Cancelled);
        }

        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        if (remaining.count() <= 0) {
            terminate();
            return std::unexpected(PipeError::TimedOut);
        }

        std::array<struct pollfd, 2> fds{};
        std::array<std::size_t, 2> index{};
        nfds_t count = 0;
        for (std::size_t i = 0; i < owners.size(); ++i) {
            if (*owners[i]) {
                fds[count].fd = owners[i]->get();
                fds[count].events = POLLIN;
                index[count] = i;
                ++count;
            }
        }

        int slice = static_cast<int>(
            std::min<long long>(remaining.count(), Config::PIPE_POLL_SLICE_MS));
        int ret = ::poll(fds.data(), count, slice);
        if (ret == -1) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "Failed to poll pipe");
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;

            ssize_t bytes_read = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (bytes_read > 0) {
                streams[index[i]].append(buffer.data(), static_cast<std::size_t>(bytes_read));
            } else if (bytes_read == 0) {
                owners[index[i]]->reset();
            } else if (errno != EINTR && errno != EAGAIN) {
                throw std::system_error(errno, std::generic_category(), "Failed to read from pipe");
            }
        }
    }

    // Both streams hit EOF; the child may still be running with them closed.
    while (true) {
        int status = 0;
        pid_t reaped = ::waitpid(pid_, &status, WNOHANG);
        if (reaped == pid_) {
            pid_ = -1;
            result.exit_code = decode_status(status);
            return result;
        }
        if (reaped == -1 && errno != EINTR) {
            int err = errno;
            pid_ = -1;
            throw std::system_error(err, std::generic_category(), "Failed to wait for child process");
        }
        if (cancelled()) {
            terminate();
            return std::unexpected(PipeError::Cancelled);
        }
        if (clock::now() >= deadline) {
            terminate();
            return std::unexpected(PipeError::TimedOut);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}
