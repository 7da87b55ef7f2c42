#include "translate/signature.hpp"
#include <cctype>
#include <set>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace grader::translate {
using namespace std;

[[noreturn]] static void malformed(const string &text, const string &reason) {
    throw translation_error(translation_error::kind::MALFORMED_SIGNATURE,
                            "malformed signature \"" + text + "\": " + reason);
}

static bool is_identifier(const string &name) {
    if (name.empty() || isdigit((unsigned char)name[0])) return false;
    for (char c : name)
        if (!isalnum((unsigned char)c) && c != '_') return false;
    return true;
}

/**
 * @brief 按顶层逗号切分，返回每一段（未去空白）
 * @return 若括号不匹配返回 false
 */
static bool split_top_level(const string &text, vector<string> &parts) {
    int depth = 0;
    string current;
    char prev = 0;
    for (char c : text) {
        // => 和 -> 中的 > 不是括号
        bool arrow = c == '>' && (prev == '=' || prev == '-');
        prev = c;
        if (c == '[' || c == '(' || c == '{' || c == '<') ++depth;
        else if (c == ']' || c == ')' || c == '}' || (c == '>' && !arrow)) {
            if (--depth < 0) return false;
        }
        if (c == ',' && depth == 0) {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (depth != 0) return false;
    parts.push_back(current);
    return true;
}

size_t count_parameters(const string &params) {
    vector<string> parts;
    if (!split_top_level(params, parts)) return 0;
    size_t count = 0;
    for (auto &part : parts) {
        string p = trim(part);
        // Python 的 self 与 *、/ 分隔符不是实际参数
        if (p.empty() || p == "self" || p == "*" || p == "/") continue;
        ++count;
    }
    return count;
}

function_signature parse_signature(const string &text) {
    string s = trim(text);
    if (s.rfind("def ", 0) == 0 || s.rfind("def\t", 0) == 0) s = trim(s.substr(4));
    if (!s.empty() && s.back() == ':') s = trim(s.substr(0, s.size() - 1));

    size_t open = s.find('(');
    if (open == string::npos) malformed(text, "missing parameter list");

    function_signature signature;
    signature.name = trim(s.substr(0, open));
    if (!is_identifier(signature.name)) malformed(text, "invalid function name \"" + signature.name + "\"");

    // 找到与 open 匹配的右括号
    int depth = 0;
    size_t close = string::npos;
    for (size_t i = open; i < s.size(); ++i) {
        if (s[i] == '(' || s[i] == '[') ++depth;
        else if (s[i] == ')' || s[i] == ']') {
            if (--depth == 0) {
                if (s[i] != ')') malformed(text, "unbalanced brackets");
                close = i;
                break;
            }
        }
    }
    if (close == string::npos) malformed(text, "unbalanced brackets");

    string params = s.substr(open + 1, close - open - 1);
    if (!trim(params).empty()) {
        vector<string> parts;
        if (!split_top_level(params, parts)) malformed(text, "unbalanced brackets");

        set<string> names;
        for (auto &raw : parts) {
            string part = trim(raw);
            if (part.empty()) malformed(text, "empty parameter");
            if (part.find('=') != string::npos) malformed(text, "default values are not supported");

            parameter param;
            size_t colon = part.find(':');
            if (colon == string::npos) {
                param.name = part;
                param.type = canonical_type{type_kind::ANY, {}};
            } else {
                param.name = trim(part.substr(0, colon));
                param.type = parse_type(trim(part.substr(colon + 1)));
                param.annotated = true;
            }
            if (!is_identifier(param.name)) malformed(text, "invalid parameter name \"" + param.name + "\"");
            if (!names.insert(param.name).second) malformed(text, "duplicate parameter " + param.name);
            signature.parameters.push_back(move(param));
        }
    }

    string rest = trim(s.substr(close + 1));
    if (rest.empty()) {
        signature.return_type = canonical_type{type_kind::ANY, {}};
    } else if (rest.rfind("->", 0) == 0) {
        string ret = trim(rest.substr(2));
        if (ret.empty()) malformed(text, "missing return type");
        signature.return_type = parse_type(ret);
        signature.has_return_type = true;
    } else {
        malformed(text, "unexpected \"" + rest + "\" after parameter list");
    }
    return signature;
}

string to_string(const function_signature &signature) {
    string result = signature.name + "(";
    for (size_t i = 0; i < signature.parameters.size(); ++i) {
        auto &param = signature.parameters[i];
        if (i) result += ", ";
        result += param.name;
        if (param.annotated) result += ": " + to_string(param.type);
    }
    result += ")";
    if (signature.has_return_type) result += " -> " + to_string(signature.return_type);
    return result;
}

}  // namespace grader::translate
