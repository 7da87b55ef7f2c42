#include "common/utils.hpp"
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <mutex>

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

static bool is_executable_file(const fs::path &path) {
    error_code ec;
    return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

optional<fs::path> find_executable(const string &program, const string &search_path) {
    if (program.empty()) return nullopt;
    if (program.find('/') != string::npos) {
        if (is_executable_file(program)) return fs::absolute(program);
        return nullopt;
    }

    vector<string> dirs;
    boost::split(dirs, search_path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / program;
        if (is_executable_file(candidate)) return candidate;
    }
    return nullopt;
}

string trim(const string &str) {
    return boost::algorithm::trim_copy(str);
}

vector<string> split_lines(const string &str) {
    vector<string> lines;
    string line;
    for (char c : str) {
        if (c == '\n') {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            lines.push_back(move(line));
            line.clear();
        } else {
            line.push_back(c);
        }
    }
    if (!line.empty()) {
        if (line.back() == '\r') line.pop_back();
        lines.push_back(move(line));
    }
    return lines;
}

string random_uuid() {
    // random_generator 不是线程安全的
    static mutex generator_mutex;
    static boost::uuids::random_generator generator;
    scoped_lock guard(generator_mutex);
    return boost::lexical_cast<string>(generator());
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return chrono::duration<double>(chrono::steady_clock::now() - start).count();
}

}  // namespace grader
