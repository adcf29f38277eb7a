/**
 * @file process.cpp
 * @brief fork/exec child process runner (POSIX)
 */

#include <backend/process.hpp>
#include <cerrno>
#include <csignal>
#include <system_error>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace Terrasplit {

namespace {

[[noreturn]] void throw_errno(const char* what) {
    throw std::system_error(errno, std::generic_category(), what);
}

/**
 * @brief Owning file descriptor
 */
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { close(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    bool is_open() const { return fd_ >= 0; }

    void reset(int fd) {
        close();
        fd_ = fd;
    }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

struct PipePair {
    FileDescriptor read_end;
    FileDescriptor write_end;

    PipePair() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) throw_errno("pipe2");
        read_end.reset(fds[0]);
        write_end.reset(fds[1]);
    }
};

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        throw_errno("fcntl");
    }
}

/**
 * @brief Ignore SIGPIPE while feeding a child that may exit before reading its input.
 */
class SigpipeGuard {
public:
    SigpipeGuard() {
        struct sigaction ignore {};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        ::sigaction(SIGPIPE, &ignore, &previous_);
    }
    ~SigpipeGuard() { ::sigaction(SIGPIPE, &previous_, nullptr); }

    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

private:
    struct sigaction previous_ {};
};

// Drain whatever is readable; closes fd on EOF.
void drain(FileDescriptor& fd, std::string& sink) {
    char buffer[8192];
    while (true) {
        ssize_t n = ::read(fd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            sink.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            fd.close();
            return;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return;
        throw_errno("read");
    }
}

void write_all_raw(int fd, const std::string& text) {
    size_t done = 0;
    while (done < text.size()) {
        ssize_t n = ::write(fd, text.data() + done, text.size() - done);
        if (n <= 0) return;
        done += static_cast<size_t>(n);
    }
}

} // namespace

ChildProcess::~ChildProcess() {
    if (reaped_ || pid_ <= 0) return;
    ::kill(pid_, SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
}

int ChildProcess::wait() {
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0) {
        if (errno != EINTR) throw_errno("waitpid");
    }
    reaped_ = true;
    return status;
}

ProcessResult run_process(const std::string& executable,
                          const std::vector<std::string>& args,
                          const std::string& working_directory,
                          const std::string& input) {
    PipePair stdin_pipe;
    PipePair stdout_pipe;
    PipePair stderr_pipe;

    // Everything the child touches is prepared before fork.
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const std::string exec_failed = "failed to execute " + executable + "\n";
    const std::string chdir_failed = "cannot enter directory " + working_directory + "\n";

    SigpipeGuard sigpipe_guard;

    pid_t pid = ::fork();
    if (pid < 0) throw_errno("fork");

    if (pid == 0) {
        ::dup2(stdin_pipe.read_end.get(), STDIN_FILENO);
        ::dup2(stdout_pipe.write_end.get(), STDOUT_FILENO);
        ::dup2(stderr_pipe.write_end.get(), STDERR_FILENO);

        if (!working_directory.empty() && ::chdir(working_directory.c_str()) != 0) {
            write_all_raw(STDERR_FILENO, chdir_failed);
            ::_exit(126);
        }
        ::execvp(executable.c_str(), argv.data());
        write_all_raw(STDERR_FILENO, exec_failed);
        ::_exit(127);
    }

    // From here on every exit path reaps the child.
    ChildProcess child(pid);

    stdin_pipe.read_end.close();
    stdout_pipe.write_end.close();
    stderr_pipe.write_end.close();

    FileDescriptor& in = stdin_pipe.write_end;
    FileDescriptor& out = stdout_pipe.read_end;
    FileDescriptor& err = stderr_pipe.read_end;

    ProcessResult result;
    size_t written = 0;

    if (input.empty()) {
        in.close();
    } else {
        set_nonblocking(in.get());
    }
    set_nonblocking(out.get());
    set_nonblocking(err.get());

    while (in.is_open() || out.is_open() || err.is_open()) {
        pollfd fds[3];
        nfds_t count = 0;
        int in_slot = -1, out_slot = -1, err_slot = -1;

        if (in.is_open())  { in_slot = static_cast<int>(count);  fds[count++] = {in.get(), POLLOUT, 0}; }
        if (out.is_open()) { out_slot = static_cast<int>(count); fds[count++] = {out.get(), POLLIN, 0}; }
        if (err.is_open()) { err_slot = static_cast<int>(count); fds[count++] = {err.get(), POLLIN, 0}; }

        if (::poll(fds, count, -1) < 0) {
            if (errno == EINTR) continue;
            throw_errno("poll");
        }

        if (in_slot >= 0 && fds[in_slot].revents != 0) {
            ssize_t n = ::write(in.get(), input.data() + written, input.size() - written);
            if (n > 0) {
                written += static_cast<size_t>(n);
                if (written == input.size()) in.close();
            } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                // Child closed its stdin early (EPIPE); its exit status tells the rest.
                in.close();
            }
        }
        if (out_slot >= 0 && fds[out_slot].revents != 0) drain(out, result.stdout_text);
        if (err_slot >= 0 && fds[err_slot].revents != 0) drain(err, result.stderr_text);
    }

    int status = child.wait();

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = -1;
        result.signal = WTERMSIG(status);
    }
    return result;
}

} // namespace Terrasplit
