#pragma once

#include "lpb/utility.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace libprobe {

struct ProcessResult {
    int status = 0;
    int signal = 0; ///< Signal that ended the process, 0 if it exited normally.
    bool timed_out = false;
    std::string output; ///< stdout followed by stderr.
};

/**
 * @brief Executes a subprocess and waits for it.
 *
 * @param args The command line arguments (first argument is the executable).
 * @param working_dir Optional working directory for the subprocess.
 * @param deadline Optional limit on the run time. On expiry the process is terminated and
 *                 `timed_out` is set.
 * @return The exit status and captured output, or an error if the process could not be run.
 */
Result<ProcessResult> process_exec(std::vector<std::string> &&args,
                                   std::optional<std::string> working_dir = std::nullopt,
                                   std::optional<std::chrono::milliseconds> deadline = std::nullopt);

} // namespace libprobe
