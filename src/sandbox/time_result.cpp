#include "sandbox/time_result.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <map>
#include <sstream>
#include <vector>

namespace bubble {
using namespace std;

const char *TIME_FORMAT =
    "Command: %C\n"
    "Elapsed time: %E\n"
    "User CPU time: %U\n"
    "System CPU time: %S\n"
    "CPU Percentage: %P\n"
    "Avg total memory usage: %K KB\n"
    "Avg shared memory size: %D KB\n"
    "Avg unshared data size: %p KB\n"
    "Avg unshared stack size: %t KB\n"
    "Page reclaims (soft page faults): %R\n"
    "Page faults (hard page faults): %F\n"
    "Swaps: %W\n"
    "Block input operations: %I\n"
    "Block output operations: %O\n"
    "IPC messages sent: %r\n"
    "IPC messages received: %s\n"
    "Signals received: %k\n"
    "Voluntary context switches: %w\n"
    "Involuntary context switches: %c\n"
    "Maximum resident set size: %M KB\n"
    "Exit status: %x";

/**
 * @return nothing if a key appears twice, which only happens when the record was tampered with
 */
static optional<map<string, string>> read_metadata(const string &text) {
    map<string, string> mp;
    istringstream fin(text);
    string line;
    while (getline(fin, line)) {
        size_t end = line.find(':');
        if (end == string::npos) continue;
        string key = boost::algorithm::trim_copy(line.substr(0, end));
        string value = boost::algorithm::trim_copy(line.substr(end + 1));
        if (!mp.emplace(key, value).second) {
            LOG(WARNING) << "duplicate key in resource usage record: " << key;
            return nullopt;
        }
    }
    return mp;
}

template <typename T>
static bool try_to_parse(const string &text, T &value) {
    try {
        T parsed = boost::lexical_cast<T>(text);
        if (parsed < 0) return false;
        value = parsed;
        return true;
    } catch (boost::bad_lexical_cast &) {
        return false;
    }
}

/**
 * @brief Parse "123 KB", only the leading number is taken
 */
static bool try_to_parse_kb(const string &text, int64_t &value) {
    return try_to_parse(text.substr(0, text.find(' ')), value);
}

/**
 * @brief Parse %E, which is "[hours:]minutes:seconds", or plain seconds
 */
static bool try_to_parse_elapsed(const string &text, double &value) {
    vector<string> parts;
    boost::algorithm::split(parts, text, [](char c) { return c == ':'; });
    if (parts.empty() || parts.size() > 3) return false;
    double seconds = 0;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        int64_t unit;
        if (!try_to_parse(parts[i], unit)) return false;
        seconds = seconds * 60 + unit * 60;
    }
    double last;
    if (!try_to_parse(parts.back(), last)) return false;
    value = seconds + last;
    return true;
}

optional<time_result> parse_time_result(const string &text) {
    auto parsed = read_metadata(text);
    if (!parsed) return nullopt;
    const map<string, string> &metadata = *parsed;
    time_result result;
    bool ok = true;

    auto field = [&](const char *key) -> const string * {
        auto it = metadata.find(key);
        if (it == metadata.end()) {
            ok = false;
            return nullptr;
        }
        return &it->second;
    };
    auto number = [&](const char *key, auto &value) {
        if (auto text = field(key); text && !try_to_parse(*text, value)) ok = false;
    };
    auto kb = [&](const char *key, int64_t &value) {
        if (auto text = field(key); text && !try_to_parse_kb(*text, value)) ok = false;
    };

    if (auto text = field("Command")) result.command = *text;
    if (auto text = field("Elapsed time"); text && !try_to_parse_elapsed(*text, result.elapsed_time)) ok = false;
    number("User CPU time", result.user_cpu_time);
    number("System CPU time", result.system_cpu_time);
    if (auto text = field("CPU Percentage")) result.cpu_percentage = *text;
    kb("Avg total memory usage", result.avg_total_mem);
    kb("Avg shared memory size", result.avg_shared_mem);
    kb("Avg unshared data size", result.avg_unshared_data);
    kb("Avg unshared stack size", result.avg_unshared_stack);
    number("Page reclaims (soft page faults)", result.page_reclaims);
    number("Page faults (hard page faults)", result.page_faults);
    number("Swaps", result.swaps);
    number("Block input operations", result.block_input_ops);
    number("Block output operations", result.block_output_ops);
    number("IPC messages sent", result.ipc_msgs_sent);
    number("IPC messages received", result.ipc_msgs_received);
    number("Signals received", result.signals_received);
    number("Voluntary context switches", result.voluntary_ctxt_switches);
    number("Involuntary context switches", result.involuntary_ctxt_switches);
    kb("Maximum resident set size", result.max_resident_set_size);
    number("Exit status", result.exit_status);

    if (!ok) return nullopt;
    return result;
}

optional<time_result> read_time_result(const filesystem::path &path) {
    ifstream fin(path);
    if (!fin) {
        LOG(INFO) << "no resource usage record at " << path;
        return nullopt;
    }
    string text((istreambuf_iterator<char>(fin)), istreambuf_iterator<char>());
    auto result = parse_time_result(text);
    if (!result)
        LOG(WARNING) << "incomplete resource usage record at " << path;
    return result;
}

}  // namespace bubble
