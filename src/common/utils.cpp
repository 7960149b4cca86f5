#include "common/utils.hpp"
#include <boost/algorithm/string/join.hpp>
#include <cstdlib>

namespace bubble {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

static string quote_argument(const string &arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n'\"\\$") == string::npos)
        return arg;
    string quoted = "'";
    for (char c : arg) {
        if (c == '\'')
            quoted += "'\\''";
        else
            quoted += c;
    }
    return quoted + "'";
}

string join_command(const vector<string> &argv) {
    vector<string> quoted;
    quoted.reserve(argv.size());
    for (auto &arg : argv)
        quoted.push_back(quote_argument(arg));
    return boost::algorithm::join(quoted, " ");
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return duration<chrono::duration<double>>().count();
}

}  // namespace bubble
