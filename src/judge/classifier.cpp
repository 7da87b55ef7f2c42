#include "judge/classifier.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <vector>
#include "common/utils.hpp"

namespace grader {
using namespace std;

classify_mode classify_mode::bare() {
    return classify_mode{false, 0};
}

classify_mode classify_mode::graded_with(size_t test_count) {
    return classify_mode{true, test_count};
}

string last_nonempty_line(const string &text) {
    vector<string> lines = split_lines(text);
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        string line = trim(*it);
        if (!line.empty()) return line;
    }
    return "";
}

static string with_truncation_note(const string &text, size_t total, bool truncated) {
    if (!truncated) return text;
    string result = text;
    if (!result.empty() && result.back() != '\n') result += '\n';
    result += fmt::format("[... {} bytes truncated]", total - text.size());
    return result;
}

/**
 * @brief 运行错误的描述：标准错误流的最后一个非空行，没有时使用退出状态
 */
static string runtime_fault_message(const sandbox::raw_result &raw) {
    string line = last_nonempty_line(raw.stderr_text);
    if (!line.empty()) return line;
    return sandbox::describe_exit(raw);
}

classification classify(const sandbox::raw_result &raw, const classify_mode &mode) {
    classification result;
    result.stdout_text = with_truncation_note(raw.stdout_text, raw.stdout_bytes, raw.stdout_truncated);
    result.stderr_text = with_truncation_note(raw.stderr_text, raw.stderr_bytes, raw.stderr_truncated);

    if (raw.timed_out) {
        result.stat = status::TIMEOUT;
        result.kind = error_kind::TIME_LIMIT_EXCEEDED;
        result.error_message = fmt::format("time_limit_exceeded: killed after {:.2f}s (limit {:.2f}s)", raw.wall_time, raw.time_limit);
        return result;
    }

    if (raw.killed_for_memory) {
        result.stat = status::ERROR;
        result.kind = error_kind::MEMORY_LIMIT_EXCEEDED;
        result.error_message = fmt::format("memory_limit_exceeded: used {} MB (limit {} MB)",
                                           raw.memory_peak / (1024 * 1024), raw.memory_limit);
        return result;
    }

    if (!mode.graded) {
        if (raw.exit_code == 0) {
            result.stat = status::SUCCESS;
        } else {
            result.stat = status::ERROR;
            result.kind = error_kind::RUNTIME_FAULT;
            result.error_message = runtime_fault_message(raw);
        }
        return result;
    }

    size_t failed = count_if(raw.markers.begin(), raw.markers.end(), [](auto &m) { return !m.passed; });
    if (failed > 0) {
        result.stat = status::FAILURE;
        result.error_message = fmt::format("{} of {} tests failed", failed, mode.test_count);
        return result;
    }

    if (raw.markers.size() == mode.test_count && raw.exit_code == 0) {
        result.stat = status::SUCCESS;
        return result;
    }

    // 没有报告全部测试点：测试程序中途崩溃、调用了 exit，或者选手代码在加载时就出错
    result.stat = status::ERROR;
    result.kind = error_kind::RUNTIME_FAULT;
    result.error_message = runtime_fault_message(raw);
    return result;
}

}  // namespace grader
