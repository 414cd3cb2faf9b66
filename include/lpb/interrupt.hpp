#pragma once

#include "lpb/persistence.hpp"
#include "lpb/utility.hpp"

#include <functional>
#include <memory>
#include <thread>

namespace libprobe {

inline constexpr int EXIT_INTERRUPTED = 2;

/**
 * @brief Flushes the catalog and ends the process on SIGINT or SIGTERM.
 *
 * A background thread waits for the signal for the lifetime of the object. The signal handler
 * itself puts `persistence` into shutdown, so the probing thread can no longer finalize the
 * library it was working on. The thread then flushes `persistence` and calls `terminate` with
 * `EXIT_INTERRUPTED`; the default terminate exits the process immediately, without unwinding the
 * probing thread.
 *
 * Only one watcher may exist at a time. The previous signal dispositions are restored on
 * destruction.
 */
class InterruptWatcher {
    struct Key {
        explicit Key() = default;
    };

public:
    using Terminate = std::function<void(int exit_code)>;

    static Result<std::unique_ptr<InterruptWatcher>> start(Persistence &persistence, Terminate terminate = {});

    /** @brief Only `start` can construct a watcher. */
    InterruptWatcher(Key, Persistence &persistence, Terminate terminate, int read_fd, int write_fd);
    ~InterruptWatcher();

    InterruptWatcher(const InterruptWatcher &) = delete;
    InterruptWatcher &operator=(const InterruptWatcher &) = delete;

private:
    void watch();

    Persistence &persistence;
    Terminate terminate;
    int read_fd;
    int write_fd;
    std::jthread thread;
};

} // namespace libprobe
