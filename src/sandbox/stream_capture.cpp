#include "sandbox/stream_capture.hpp"
#include <algorithm>
#include <cctype>
#include "common/utils.hpp"

namespace grader::sandbox {
using namespace std;

// 标记行 delimiter 之后的部分，形如 " 12 PASS"，超过该长度的一定不是标记
static const size_t MAX_MARKER_TAIL = 32;

bool test_marker::operator==(const test_marker &other) const {
    return index == other.index && passed == other.passed;
}

stream_capture::stream_capture(size_t limit, string delimiter)
    : limit(limit), delimiter(move(delimiter)) {}

void stream_capture::emit(const char *data, size_t size) {
    total += size;
    if (kept.size() < limit)
        kept.append(data, min(size, limit - kept.size()));
}

/**
 * @brief str 的后缀与 prefix 的前缀最长的重叠长度，且小于 prefix 的长度
 */
static size_t partial_overlap(const string &str, const string &prefix) {
    size_t longest = min(str.size(), prefix.size() - 1);
    for (size_t k = longest; k > 0; --k)
        if (str.compare(str.size() - k, k, prefix, 0, k) == 0) return k;
    return 0;
}

bool stream_capture::parse_marker(const string &tail) {
    string text = trim(tail);
    size_t space = text.find(' ');
    if (space == string::npos || space == 0 || space > 9) return false;
    string index = text.substr(0, space);
    string verdict = trim(text.substr(space + 1));
    if (!all_of(index.begin(), index.end(), [](char c) { return isdigit((unsigned char)c); })) return false;
    if (verdict != "PASS" && verdict != "FAIL") return false;
    found.push_back({(size_t)stoul(index), verdict == "PASS"});
    return true;
}

void stream_capture::scan(bool eof) {
    while (!pending.empty()) {
        size_t hit = pending.find(delimiter);
        if (hit == string::npos) {
            size_t keep = eof ? 0 : partial_overlap(pending, delimiter);
            emit(pending.data(), pending.size() - keep);
            pending.erase(0, pending.size() - keep);
            return;
        }
        if (hit > 0) {
            emit(pending.data(), hit);
            pending.erase(0, hit);
        }

        // pending 以 delimiter 开头
        size_t newline = pending.find('\n', delimiter.size());
        if (newline == string::npos) {
            if (!eof && pending.size() <= delimiter.size() + MAX_MARKER_TAIL) return;
            if (eof && parse_marker(pending.substr(delimiter.size()))) {
                pending.clear();
                return;
            }
        } else if (newline - delimiter.size() <= MAX_MARKER_TAIL &&
                   parse_marker(pending.substr(delimiter.size(), newline - delimiter.size()))) {
            pending.erase(0, newline + 1);
            continue;
        }

        // 不是合法的标记，按普通输出处理
        emit(pending.data(), delimiter.size());
        pending.erase(0, delimiter.size());
    }
}

void stream_capture::feed(const char *data, size_t size) {
    if (delimiter.empty()) {
        emit(data, size);
        return;
    }
    pending.append(data, size);
    scan(false);
}

void stream_capture::finish() {
    if (!delimiter.empty()) scan(true);
}

const string &stream_capture::content() const {
    return kept;
}

size_t stream_capture::total_bytes() const {
    return total;
}

bool stream_capture::truncated() const {
    return total > kept.size();
}

const vector<test_marker> &stream_capture::markers() const {
    return found;
}

}  // namespace grader::sandbox
