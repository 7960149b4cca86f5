#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace bubble {

struct process_options {
    /**
     * @brief argv[0] is looked up in PATH
     */
    std::vector<std::string> command;

    /**
     * @brief Written to the stdin of the child, then stdin is closed
     */
    std::string stdin_payload;

    /**
     * @brief At most this many bytes of stdout and of stderr are kept
     * Further data is read and discarded but still counted, so a chatty
     * program can not block on a full pipe.
     */
    size_t stream_limit = 0;

    /**
     * @brief Seconds after which the whole process group is killed, negative disables the watchdog
     */
    double watchdog = -1;
};

struct process_result {
    /**
     * @brief Exit code of the child, or 128 + signal number if it was killed by a signal
     */
    int exitcode = -1;

    /**
     * @brief Signal that terminated the child, -1 if it exited normally
     */
    int signal = -1;

    std::string stdout_data;
    std::string stderr_data;

    /**
     * @brief Total bytes the child wrote, including the discarded part
     */
    size_t stdout_bytes = 0;
    size_t stderr_bytes = 0;

    bool stdout_truncated = false;
    bool stderr_truncated = false;

    /**
     * @brief The watchdog fired and the process group was killed
     */
    bool watchdog_fired = false;

    /**
     * @brief Wall clock time from fork to reaping the child, in seconds
     */
    double wall_time = 0;
};

/**
 * @brief Run a command and wait for it
 * 1. Create pipes for stdin, stdout, stderr and a close-on-exec pipe to report exec failures
 * 2. fork, the child moves into its own process group so that the whole tree can be signalled
 * 3. The parent pumps stdin/stdout/stderr with poll until both output pipes are closed
 *    1. If the watchdog deadline passes, SIGTERM then SIGKILL the process group
 *    2. If the child exits while descendants still hold the pipes, SIGKILL the process group
 * 4. Reap the child and translate the wait status
 * @throw std::system_error if pipes can not be created or fork fails
 * @throw sandbox_error if the command could not be executed
 */
process_result run_process(const process_options &opt);

}  // namespace bubble
