#include "lpb/process_exec.hpp"

#include <cstdint>
#include <expected>
#include <format>
#include <reproc++/drain.hpp>
#include <reproc++/run.hpp>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace libprobe {

static constexpr auto STOP_GRACE = reproc::milliseconds(2000);
// reproc reports a process ended by a signal as UINT8_MAX + signal number
static constexpr int SIGNAL_STATUS_BASE = UINT8_MAX;

Result<ProcessResult> process_exec(std::vector<std::string> &&args,
                                   std::optional<std::string> working_dir,
                                   std::optional<std::chrono::milliseconds> deadline) {
    if (args.empty()) {
        return std::unexpected("Cannot execute empty command");
    }

    reproc::options options;
    if (working_dir) {
        options.working_directory = working_dir->c_str();
    }
    if (deadline && deadline->count() > 0) {
        options.deadline = reproc::milliseconds(static_cast<int>(deadline->count()));
    }
    options.stop = {
        {reproc::stop::wait, reproc::deadline},
        {reproc::stop::terminate, STOP_GRACE},
        {reproc::stop::kill, STOP_GRACE},
    };

    ProcessResult result;
    std::string err;
    reproc::sink::string out_sink(result.output);
    reproc::sink::string err_sink(err);

    auto [status, ec] = reproc::run(args, options, out_sink, err_sink);
    result.output += err;

    if (ec == std::errc::timed_out) {
        result.timed_out = true;
        result.status = -1;
        return result;
    }
    if (ec) {
        return std::unexpected(std::format("Failed to execute {}: {}", args.front(), ec.message()));
    }

    result.status = status;
    if (status > SIGNAL_STATUS_BASE) {
        result.signal = status - SIGNAL_STATUS_BASE;
    }
    return result;
}

} // namespace libprobe
