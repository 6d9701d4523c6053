#include "include/command_runner.hpp"

#include <format>
#include <stdexcept>
#include <system_error>

namespace netcheck {

ProbeResult<ProcessOutput> ProcessRunner::run(const std::string& command,
                                              const std::vector<std::string>& args,
                                              std::chrono::seconds timeout,
                                              std::stop_token stop) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(command);
    argv.insert(argv.end(), args.begin(), args.end());

    try {
        ShellPipe pipe(argv);
        auto output = pipe.read_all(timeout, stop);
        if (output) {
            return std::move(*output);
        }

        switch (output.error()) {
            case PipeError::TimedOut:
                return probe_failure(
                    ProbeErrorKind::Timeout,
                    std::format("'{}' timed out after {} seconds", command, timeout.count()));
            case PipeError::Cancelled:
                break;
        }
        return probe_failure(ProbeErrorKind::Unknown, std::format("'{}' was cancelled", command));

    } catch (const std::system_error& e) {
        if (e.code() == std::errc::no_such_file_or_directory) {
            return probe_failure(ProbeErrorKind::NotFound,
                                 std::format("'{}' command not found", command));
        }
        return probe_failure(ProbeErrorKind::Unknown, e.what());
    } catch (const std::exception& e) {
        return probe_failure(ProbeErrorKind::Unknown, e.what());
    }
}

}  // namespace netcheck
