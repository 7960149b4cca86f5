#include "common/io_utils.hpp"
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <fstream>
#include <system_error>

namespace bubble {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path, ios::in | ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::out | ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to create " + path.string());
    fout.write(content.data(), content.size());
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty() || subpath.find("..") != string::npos || subpath.front() == '/')
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

void clear_directory(const fs::path &dir) {
    if (fs::exists(dir) && !fs::is_directory(dir))
        fs::remove(dir);
    fs::create_directories(dir);
    for (auto &entry : fs::directory_iterator(dir))
        fs::remove_all(entry.path());
}

scoped_file_lock::scoped_file_lock() : fd(-1), valid(false) {}

scoped_file_lock::scoped_file_lock(const fs::path &path, bool shared) : fd(-1), valid(false) {
    fd = open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0)
        throw system_error(errno, system_category(), "unable to open lock file " + path.string());
    if (flock(fd, shared ? LOCK_SH : LOCK_EX) != 0) {
        int err = errno;
        close(fd);
        throw system_error(err, system_category(), "unable to lock " + path.string());
    }
    valid = true;
}

scoped_file_lock::scoped_file_lock(scoped_file_lock &&lock) : scoped_file_lock() {
    *this = move(lock);
}

scoped_file_lock::~scoped_file_lock() {
    release();
}

scoped_file_lock &scoped_file_lock::operator=(scoped_file_lock &&lock) {
    swap(fd, lock.fd);
    swap(valid, lock.valid);
    return *this;
}

void scoped_file_lock::release() {
    if (!valid) return;
    flock(fd, LOCK_UN);
    close(fd);
    valid = false;
}

scoped_file_lock lock_directory(const fs::path &dir, bool shared) {
    fs::create_directories(dir);
    fs::path lock_file = dir / ".lock";
    if (fs::is_directory(lock_file))
        fs::remove_all(lock_file);
    return scoped_file_lock(lock_file, shared);
}

}  // namespace bubble
