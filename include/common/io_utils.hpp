#pragma once

#include <filesystem>
#include <string>

namespace bubble {

/**
 * @brief Read the whole content of a file
 * @param path file path
 * @return file content, bytes are kept as-is
 * @throw std::system_error if the file cannot be opened
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief Replace the content of a file, creating it if necessary
 * @throw std::system_error if the file cannot be written
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief Assert that subpath never climbs out of the directory it is joined to
 * File names coming from configuration end up under the workspace, a name
 * containing "../" could overwrite host files.
 * @param subpath file name to check
 * @return subpath itself
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief Remove everything inside dir and make sure dir exists afterwards
 * @param dir directory to empty
 */
void clear_directory(const std::filesystem::path &dir);

struct scoped_file_lock {
    scoped_file_lock();
    scoped_file_lock(const std::filesystem::path &path, bool shared);
    scoped_file_lock(scoped_file_lock &&);
    scoped_file_lock(const scoped_file_lock &) = delete;
    ~scoped_file_lock();

    scoped_file_lock &operator=(scoped_file_lock &&);

    void release();

private:
    int fd;
    bool valid;
};

/**
 * @brief Lock a directory
 * The directory is created if missing, the lock is an flock on dir/.lock
 * @param dir directory to lock
 * @param shared true for a shared (read) lock, false for an exclusive (write) lock
 * @return the held lock, released on destruction
 */
scoped_file_lock lock_directory(const std::filesystem::path &dir, bool shared);

}  // namespace bubble
