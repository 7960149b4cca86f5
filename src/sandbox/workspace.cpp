#include "sandbox/workspace.hpp"
#include <glog/logging.h>

namespace bubble {
using namespace std;
namespace fs = std::filesystem;

workspace::workspace(const fs::path &root) {
    fs::create_directories(root);
    root_dir = fs::weakly_canonical(fs::absolute(root));
}

const fs::path &workspace::root() const {
    return root_dir;
}

fs::path workspace::program_dir() const {
    return root_dir / "program";
}

fs::path workspace::run_dir() const {
    return root_dir / "run";
}

void workspace::reset() {
    clear_directory(program_dir());
    clear_directory(run_dir());
}

void workspace::reset_run() {
    clear_directory(run_dir());
}

workspace_lock workspace::acquire() {
    unique_lock<mutex> guard(instance_mutex);
    scoped_file_lock file_lock = lock_directory(root_dir, false);
    DLOG(INFO) << "acquired workspace " << root_dir;
    return workspace_lock{move(guard), move(file_lock)};
}

}  // namespace bubble
