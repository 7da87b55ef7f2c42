#include "judge/problem.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <regex>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

bool test_case::structured() const {
    return !inputs.empty() || expected.has_value();
}

bool problem_spec::supports(const string &language) const {
    return find(supported_languages.begin(), supported_languages.end(), language) != supported_languages.end();
}

static size_t indentation_of(const string &line) {
    size_t i = 0;
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
    return i;
}

static bool is_blank_or_comment(const string &line) {
    string t = trim(line);
    return t.empty() || t[0] == '#';
}

static bool is_assertion(const string &trimmed) {
    return trimmed.rfind("assert ", 0) == 0 || trimmed.rfind("assert(", 0) == 0;
}

vector<test_step> parse_test_steps(const string &code) {
    vector<string> lines = split_lines(code);
    size_t common = string::npos;
    for (auto &line : lines)
        if (!is_blank_or_comment(line)) common = min(common, indentation_of(line));

    vector<test_step> steps;
    for (auto &line : lines) {
        if (is_blank_or_comment(line)) continue;
        string dedented = line.substr(common);
        string trimmed = trim(dedented);
        if (is_assertion(trimmed)) {
            steps.push_back({test_step::kind::ASSERTION, trimmed, dedented.substr(0, indentation_of(dedented))});
        } else {
            steps.push_back({test_step::kind::SETUP, dedented, ""});
        }
    }
    return steps;
}

// 测试文件中引用选手代码与测试框架的行，拼接进同一个文件后不再需要
static bool is_ignored_preamble(const string &trimmed) {
    return trimmed.rfind("import pytest", 0) == 0 ||
           trimmed.rfind("from solution import", 0) == 0 ||
           trimmed.rfind("import solution", 0) == 0 ||
           trimmed.rfind("@", 0) == 0;
}

vector<test_case> split_test_code(const string &code, visibility vis) {
    static const regex test_function(R"(^(?:async\s+)?def\s+(test\w*)\s*\(\s*\)\s*(?:->\s*None\s*)?:\s*(?:#.*)?$)");

    string preamble;
    vector<pair<string, string>> blocks;  // 测试函数名，函数体
    bool in_test = false;
    for (auto &line : split_lines(code)) {
        smatch match;
        bool top_level = !line.empty() && indentation_of(line) == 0;
        if (top_level && regex_match(line, match, test_function)) {
            blocks.emplace_back(match[1].str(), "");
            in_test = true;
        } else if (in_test && (!top_level || is_blank_or_comment(line))) {
            blocks.back().second += line + "\n";
        } else {
            in_test = false;
            if (!is_ignored_preamble(trim(line))) preamble += line + "\n";
        }
    }

    vector<test_case> tests;
    if (blocks.empty()) {
        if (trim(code).empty()) return tests;
        test_case test;
        test.name = "test";
        test.vis = vis;
        test.steps = parse_test_steps(code);
        tests.push_back(move(test));
        return tests;
    }

    vector<test_step> shared = parse_test_steps(preamble);
    for (auto &step : shared) step.type = test_step::kind::SETUP;
    for (auto &[name, body] : blocks) {
        test_case test;
        test.name = name;
        test.vis = vis;
        test.steps = shared;
        for (auto &step : parse_test_steps(body)) test.steps.push_back(move(step));
        tests.push_back(move(test));
    }
    return tests;
}

// 字符串视为表达式源码，其他 JSON 值视为字面量
static string expression_source(const nlohmann::json &j) {
    if (j.is_string()) return j.get<string>();
    return j.dump();
}

void from_json(const nlohmann::json &j, test_case &test) {
    if (j.count("name")) j.at("name").get_to(test.name);
    if (j.count("visibility")) {
        string vis = j.at("visibility").get<string>();
        if (vis == "public") test.vis = visibility::PUBLIC;
        else if (vis == "private" || vis == "hidden") test.vis = visibility::PRIVATE;
        else throw translation_error(translation_error::kind::MALFORMED_TEST, "unknown test visibility " + vis);
    }
    if (j.count("hidden") && j.at("hidden").get<bool>()) test.vis = visibility::PRIVATE;

    if (j.count("inputs")) {
        for (auto &input : j.at("inputs")) test.inputs.push_back(expression_source(input));
        if (!j.count("expected"))
            throw translation_error(translation_error::kind::MALFORMED_TEST, "test " + test.name + " has inputs but no expected value");
    }
    if (j.count("expected")) test.expected = expression_source(j.at("expected"));
    if (j.count("code")) test.steps = parse_test_steps(j.at("code").get<string>());

    if (!test.structured() && test.steps.empty())
        throw translation_error(translation_error::kind::MALFORMED_TEST, "test " + test.name + " has neither inputs nor code");
}

void from_json(const nlohmann::json &j, problem_spec &problem) {
    if (j.count("id")) j.at("id").get_to(problem.id);
    if (j.count("title")) j.at("title").get_to(problem.title);
    if (j.count("difficulty")) j.at("difficulty").get_to(problem.difficulty);
    if (j.count("category")) j.at("category").get_to(problem.category);
    if (j.count("description")) j.at("description").get_to(problem.description);
    if (j.count("time_limit_sec")) j.at("time_limit_sec").get_to(problem.time_limit_sec);
    if (j.count("memory_limit_mb")) j.at("memory_limit_mb").get_to(problem.memory_limit_mb);
    if (!(problem.time_limit_sec > 0))
        throw invalid_request(fmt::format("problem {} has non-positive time limit {}", problem.id, problem.time_limit_sec));
    if (problem.memory_limit_mb <= 0)
        throw invalid_request(fmt::format("problem {} has non-positive memory limit {}", problem.id, problem.memory_limit_mb));
    j.at("function_signature").get_to(problem.function_signature);

    if (j.count("tests")) {
        for (auto &elem : j.at("tests")) {
            test_case test = elem.get<test_case>();
            if (test.name.empty()) test.name = "test_" + to_string(problem.tests.size() + 1);
            problem.tests.push_back(move(test));
        }
    }
    if (j.count("test_code") && j.at("test_code").is_string()) {
        for (auto &test : split_test_code(j.at("test_code").get<string>()))
            problem.tests.push_back(move(test));
    }

    if (j.count("supported_languages") && !j.at("supported_languages").is_null())
        j.at("supported_languages").get_to(problem.supported_languages);
    if (j.count("hint") && j.at("hint").is_string()) problem.hint = j.at("hint").get<string>();
    if (j.count("solution") && j.at("solution").is_string()) problem.solution = j.at("solution").get<string>();
}

problem_spec load_problem(const fs::path &problems_dir, const string &id) {
    if (id.find('/') != string::npos) throw invalid_request("invalid problem id " + id);
    string file;
    try {
        file = assert_safe_path(id + ".json");
    } catch (std::runtime_error &) {
        throw invalid_request("invalid problem id " + id);
    }
    fs::path path = problems_dir / file;
    if (!fs::exists(path)) throw invalid_request("problem " + id + " does not exist");

    problem_spec problem = nlohmann::json::parse(read_file_content(path)).get<problem_spec>();
    if (problem.id.empty()) problem.id = id;
    return problem;
}

}  // namespace grader
