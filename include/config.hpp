#pragma once

#include <string>

namespace bubble {

/**
 * @brief Memory limit in KB for the compile step, default to 1048576 (1GB)
 * Compilers are trusted more than the programs they build but still run in the sandbox.
 */
extern int COMPILE_MEM_LIMIT;

/**
 * @brief Time limit in seconds for the compile step, default to 10
 */
extern double COMPILE_TIME_LIMIT;

/**
 * @brief File size limit in KB for the compile step, default to 524288 (512MB)
 */
extern int COMPILE_FILE_LIMIT;

/**
 * @brief Grace period in seconds between SIGTERM and SIGKILL of the wall-clock guard
 */
extern double KILL_AFTER;

/**
 * @brief Extra seconds the host-side watchdog waits on top of time limit and KILL_AFTER
 * before it kills the whole sandbox process group itself.
 */
extern double WATCHDOG_SLACK;

/**
 * @brief Whether debug mode is on
 * In debug mode the workspace is not emptied after a request, so the files
 * produced by the last run can be inspected by hand.
 */
extern bool DEBUG;

/**
 * @brief Version string printed by --version
 */
extern const char *VERSION;

}  // namespace bubble
