#ifndef IPMICURVE_PROCESS_UTILS_HPP
#define IPMICURVE_PROCESS_UTILS_HPP

#include <string>
#include <vector>

namespace ipmicurve {

struct ProcessResult {
    int exitCode;        // -1 if the child never exited normally
    bool timedOut;
    std::string stdOut;
    std::string stdErr;

    bool ok() const { return exitCode == 0 && !timedOut; }
};

/**
 * Executes a command without a shell (no injection through arguments).
 * The child is killed once timeoutSec elapses.
 * @param args The command and its arguments; args[0] is looked up in PATH.
 * @param timeoutSec Timeout in seconds.
 * @return ProcessResult containing exit code and captured output.
 */
ProcessResult executeSafe(const std::vector<std::string>& args, int timeoutSec = 30);

// Short human readable reason for a failed ProcessResult.
std::string describeFailure(const ProcessResult& result);

} // namespace ipmicurve

#endif // IPMICURVE_PROCESS_UTILS_HPP
