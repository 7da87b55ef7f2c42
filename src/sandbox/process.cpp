#include "sandbox/process.hpp"
#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <glog/logging.h>

namespace grader::sandbox {
using namespace std;
namespace fs = std::filesystem;

optional<process_info> read_process_info(pid_t pid) {
    ifstream fin("/proc/" + to_string(pid) + "/stat");
    if (!fin) return nullopt;
    string content((istreambuf_iterator<char>(fin)), istreambuf_iterator<char>());

    // 进程名可能包含空格和括号，从最后一个 ')' 之后开始解析
    size_t paren = content.rfind(')');
    if (paren == string::npos) return nullopt;
    istringstream fields(content.substr(paren + 1));

    // 字段 3 起：state ppid pgrp session tty_nr tpgid flags minflt cminflt majflt cmajflt
    // utime stime cutime cstime priority nice num_threads itrealvalue starttime vsize rss
    string state;
    process_info info{pid, 0, 0, 0};
    fields >> state >> info.ppid >> info.pgrp;
    string skip;
    for (int i = 0; i < 18 && fields; ++i) fields >> skip;
    fields >> info.rss_pages;
    if (!fields) return nullopt;
    // 僵尸进程不占用内存，也不需要再杀死
    if (state == "Z") info.rss_pages = 0;
    return info;
}

vector<process_info> list_processes() {
    vector<process_info> processes;
    error_code ec;
    for (auto &entry : fs::directory_iterator("/proc", ec)) {
        string name = entry.path().filename().string();
        if (name.empty() || name.find_first_not_of("0123456789") != string::npos) continue;
        auto info = read_process_info(stoi(name));
        if (info) processes.push_back(*info);
    }
    if (ec) LOG(WARNING) << "Unable to list /proc: " << ec.message();
    return processes;
}

vector<pid_t> collect_process_tree(pid_t root, pid_t pgid) {
    vector<process_info> processes = list_processes();
    multimap<pid_t, pid_t> children;
    set<pid_t> result;
    for (auto &info : processes) {
        children.emplace(info.ppid, info.pid);
        if (pgid > 0 && info.pgrp == pgid) result.insert(info.pid);
    }

    set<pid_t> visited;
    vector<pid_t> stack(result.begin(), result.end());
    stack.push_back(root);
    while (!stack.empty()) {
        pid_t pid = stack.back();
        stack.pop_back();
        if (!visited.insert(pid).second) continue;
        result.insert(pid);
        auto range = children.equal_range(pid);
        for (auto it = range.first; it != range.second; ++it) stack.push_back(it->second);
    }
    return vector<pid_t>(result.begin(), result.end());
}

long long process_tree_memory(pid_t root, pid_t pgid) {
    static const long page_size = sysconf(_SC_PAGESIZE);
    vector<pid_t> tree = collect_process_tree(root, pgid);
    long long total = 0;
    for (pid_t pid : tree) {
        auto info = read_process_info(pid);
        if (info) total += (long long)info->rss_pages * page_size;
    }
    return total;
}

void kill_process_tree(pid_t root, pid_t pgid) {
    // 先杀死进程组，防止组内进程继续 fork
    if (pgid > 0 && kill(-pgid, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "Unable to kill process group " << pgid << ": " << strerror(errno);

    for (pid_t pid : collect_process_tree(root, pgid)) {
        if (kill(pid, SIGKILL) != 0 && errno != ESRCH)
            LOG(WARNING) << "Unable to kill process " << pid << ": " << strerror(errno);
    }
}

}  // namespace grader::sandbox
