#include "lpb/interrupt.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <print>
#include <unistd.h>

namespace libprobe {

namespace {

constexpr char SIGNAL_BYTE = 's';
constexpr char STOP_BYTE = 'q';

std::atomic<int> signal_fd{-1};
std::atomic<Persistence *> watched{nullptr};
struct sigaction previous_int;
struct sigaction previous_term;

extern "C" void on_termination_signal(int) {
    const int saved_errno = errno;
    if (Persistence *persistence = watched.load()) {
        persistence->begin_shutdown();
    }
    const int fd = signal_fd.load();
    if (fd != -1) {
        const char c = SIGNAL_BYTE;
        [[maybe_unused]] ssize_t n = ::write(fd, &c, 1);
    }
    errno = saved_errno;
}

} // namespace

Result<std::unique_ptr<InterruptWatcher>> InterruptWatcher::start(Persistence &persistence, Terminate terminate) {
    if (signal_fd.load() != -1) {
        return std::unexpected("An interrupt watcher is already running");
    }

    int fds[2];
    if (::pipe(fds) != 0) {
        return std::unexpected(std::format("Failed to create signal pipe: {}", std::strerror(errno)));
    }
    // compiler subprocesses must not inherit the pipe
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    signal_fd.store(fds[1]);
    watched.store(&persistence);

    struct sigaction action {};
    action.sa_handler = on_termination_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &action, &previous_int) != 0 || ::sigaction(SIGTERM, &action, &previous_term) != 0) {
        const int err = errno;
        signal_fd.store(-1);
        watched.store(nullptr);
        ::close(fds[0]);
        ::close(fds[1]);
        return std::unexpected(std::format("Failed to install signal handlers: {}", std::strerror(err)));
    }

    if (!terminate) {
        terminate = [](int exit_code) { std::_Exit(exit_code); };
    }
    return std::make_unique<InterruptWatcher>(Key{}, persistence, std::move(terminate), fds[0], fds[1]);
}

InterruptWatcher::InterruptWatcher(Key, Persistence &persistence, Terminate terminate, int read_fd, int write_fd)
    : persistence(persistence), terminate(std::move(terminate)), read_fd(read_fd), write_fd(write_fd) {
    thread = std::jthread([this] { watch(); });
}

InterruptWatcher::~InterruptWatcher() {
    ::sigaction(SIGINT, &previous_int, nullptr);
    ::sigaction(SIGTERM, &previous_term, nullptr);
    signal_fd.store(-1);
    watched.store(nullptr);

    const char c = STOP_BYTE;
    [[maybe_unused]] ssize_t n = ::write(write_fd, &c, 1);
    if (thread.joinable()) {
        thread.join();
    }
    ::close(read_fd);
    ::close(write_fd);
}

void InterruptWatcher::watch() {
    char c = 0;
    while (true) {
        ssize_t n = ::read(read_fd, &c, 1);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0 || c == STOP_BYTE)
            return;
        break;
    }

    persistence.begin_shutdown();
    std::println("Exiting due to interrupt, saving catalog");
    if (auto res = persistence.flush(); !res) {
        std::println(stderr, "{}", res.error());
    }
    std::fflush(nullptr);
    terminate(EXIT_INTERRUPTED);
}

} // namespace libprobe
