#pragma once

#include <filesystem>
#include <mutex>
#include "common/io_utils.hpp"

namespace bubble {

/**
 * @brief Proof that the holder has exclusive use of a workspace
 * Holds the in-process mutex and the flock of the workspace directory, so
 * neither another thread nor another process can run on the same workspace.
 */
struct workspace_lock {
    std::unique_lock<std::mutex> guard;
    scoped_file_lock file_lock;
};

/**
 * @brief The host directory owned by one sandbox instance
 * Nothing is cleaned up implicitly, callers reset the directories before use.
 */
struct workspace {
    /**
     * @param root host directory, created if missing and made absolute
     */
    explicit workspace(const std::filesystem::path &root);

    workspace(const workspace &) = delete;
    workspace &operator=(const workspace &) = delete;

    const std::filesystem::path &root() const;

    /**
     * @brief Directory receiving the source code and the compiled artifact
     */
    std::filesystem::path program_dir() const;

    /**
     * @brief Writable working directory of each run
     */
    std::filesystem::path run_dir() const;

    /**
     * @brief Empty the program and the run directories
     * @throw std::filesystem::filesystem_error
     */
    void reset();

    /**
     * @brief Empty the run directory only, the prepared program is kept
     * @throw std::filesystem::filesystem_error
     */
    void reset_run();

    /**
     * @brief Wait until the workspace is free and take it
     * @throw std::system_error if the lock file can not be created
     */
    workspace_lock acquire();

private:
    std::filesystem::path root_dir;
    std::mutex instance_mutex;
};

}  // namespace bubble
