#include "translate/translator.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <boost/regex.hpp>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace grader::translate {
using namespace std;

const char *const ENTRY_ALIAS = "__grader_entry";

/**
 * @brief 在选手代码中搜索，匹配过于复杂时视为没有找到
 * boost::regex 的匹配不是递归实现，恶意构造的代码不会耗尽栈空间
 */
static bool search_declaration(const string &code, const boost::regex &pattern) {
    try {
        return boost::regex_search(code, pattern);
    } catch (std::runtime_error &ex) {
        LOG(WARNING) << "Giving up searching declaration " << pattern.str() << ": " << ex.what();
        return false;
    }
}

string locate_function(const function_signature &signature, const language_profile &language, const string &code) {
    for (auto &pattern : language.declaration_patterns) {
        boost::regex declaration(expand_template(pattern, {{"name", signature.name}}));
        if (search_declaration(code, declaration)) return signature.name;
    }

    // 选手可能给函数改了名字，选择第一个参数个数相同的顶层函数
    size_t best_position = string::npos;
    string best;
    for (auto &pattern : language.function_patterns) {
        boost::regex function(pattern);
        try {
            for (boost::sregex_iterator it(code.begin(), code.end(), function), end; it != end; ++it) {
                auto &match = *it;
                if (count_parameters(match[2].str()) != signature.parameters.size()) continue;
                if ((size_t)match.position(0) < best_position) {
                    best_position = match.position(0);
                    best = match[1].str();
                }
                break;
            }
        } catch (std::runtime_error &ex) {
            LOG(WARNING) << "Giving up searching functions " << pattern << ": " << ex.what();
        }
    }
    if (best.empty())
        throw translation_error(translation_error::kind::SIGNATURE_NOT_FOUND,
                                fmt::format("no function matching {} found in the submitted {} code",
                                            to_string(signature), language.name));
    return best;
}

static string join_parameters(const function_signature &signature, const language_profile &language,
                              const string &pattern) {
    string result;
    for (size_t i = 0; i < signature.parameters.size(); ++i) {
        auto &param = signature.parameters[i];
        if (i) result += ", ";
        result += expand_template(pattern, {{"name", param.name}, {"type", render_type(param.type, language.types)}});
    }
    return result;
}

string render_signature(const function_signature &signature, const language_profile &language) {
    string docs;
    if (!language.parameter_doc_template.empty()) {
        for (auto &param : signature.parameters)
            docs += expand_template(language.parameter_doc_template,
                                    {{"name", param.name}, {"type", render_type(param.type, language.types)}});
    }
    return expand_template(language.signature_template,
                           {{"name", signature.name},
                            {"parameters", join_parameters(signature, language, language.parameter_template)},
                            {"parameter_docs", docs},
                            {"return_type", render_type(signature.return_type, language.types)}});
}

string render_signature(const problem_spec &problem, const language_profile &language) {
    return render_signature(parse_signature(problem.function_signature), language);
}

static string render_function_type(const function_signature &signature, const language_profile &language) {
    string types;
    for (size_t i = 0; i < signature.parameters.size(); ++i) {
        if (i) types += ", ";
        types += render_type(signature.parameters[i].type, language.types);
    }
    return expand_template(language.function_type_template,
                           {{"parameters", join_parameters(signature, language, "{{name}}: {{type}}")},
                            {"parameter_types", types},
                            {"return_type", render_type(signature.return_type, language.types)}});
}

static string render_assertion(const expression &expr, const string &indent, const language_profile &language,
                               const map<string, string> &renames) {
    return expand_template(language.assertion_template,
                           {{"indent", indent},
                            {"condition", render_expression(expr, language.literals, renames)}});
}

static string render_test_body(const test_case &test, const function_signature &signature,
                               const language_profile &language, const map<string, string> &renames) {
    string body;
    if (test.structured()) {
        if (test.inputs.size() != signature.parameters.size())
            throw translation_error(translation_error::kind::MALFORMED_TEST,
                                    fmt::format("expected {} inputs but got {}", signature.parameters.size(), test.inputs.size()));
        call invocation{signature.name, {}};
        for (auto &input : test.inputs) invocation.arguments.push_back(parse_expression(input));
        expression check = make_comparison(comparison_operator::EQUAL, expression{move(invocation)},
                                           parse_expression(test.expected.value_or("None")));
        body += render_assertion(check, language.body_indent, language, renames);
    }
    for (auto &step : test.steps) {
        if (step.type == test_step::kind::SETUP) {
            body += language.body_indent + step.source + "\n";
        } else {
            body += render_assertion(parse_assertion(step.source), language.body_indent + step.indent, language, renames);
        }
    }
    return body;
}

static string render_tests(const problem_spec &problem, const function_signature &signature,
                           const language_profile &language) {
    map<string, string> renames = {{signature.name, ENTRY_ALIAS}};
    string tests;
    for (size_t i = 0; i < problem.tests.size(); ++i) {
        auto &test = problem.tests[i];
        string body;
        try {
            body = render_test_body(test, signature, language, renames);
        } catch (translation_error &ex) {
            // 私有测试点的名字和断言不能出现在返回给选手的消息中
            if (test.vis == visibility::PRIVATE)
                throw translation_error(ex.type(), fmt::format("private test #{} is malformed", i));
            throw translation_error(ex.type(), fmt::format("test {}: {}", test.name, ex.what()));
        }
        tests += "\n\n";
        tests += expand_template(language.test_template, {{"index", std::to_string(i)}, {"body", body}});
    }
    return tests;
}

harness_source translate(const problem_spec &problem, const language_profile &language,
                         const string &code, const string &nonce) {
    function_signature signature = parse_signature(problem.function_signature);
    string tests = render_tests(problem, signature, language);

    harness_source harness;
    harness.entry_function = locate_function(signature, language, code);
    harness.delimiter = "@@GRADER:" + nonce + "@@";
    harness.test_count = problem.tests.size();
    harness.extra_files = language.extra_files;

    string &out = harness.code;
    out = code;
    if (!out.empty() && out.back() != '\n') out += '\n';
    out += "\n\n";
    if (harness.entry_function != signature.name)
        out += expand_template(language.canonical_bind_template,
                               {{"canonical", signature.name}, {"function", harness.entry_function}});
    out += expand_template(language.shim_template,
                           {{"alias", ENTRY_ALIAS},
                            {"function", harness.entry_function},
                            {"function_type", render_function_type(signature, language)}});
    out += "\n\n";
    out += expand_template(language.prelude, {{"delimiter", harness.delimiter}});
    out += tests;

    DLOG(INFO) << "Translated " << problem.tests.size() << " tests of problem " << problem.id
               << " to " << language.name << ", entry function " << harness.entry_function;
    return harness;
}

harness_source translate(const problem_spec &problem, const language_profile &language, const string &code) {
    return translate(problem, language, code, random_uuid());
}

void validate(const problem_spec &problem, const language_registry &languages) {
    function_signature signature = parse_signature(problem.function_signature);
    if (problem.tests.empty())
        throw translation_error(translation_error::kind::MALFORMED_TEST, "problem " + problem.id + " has no tests");
    if (problem.supported_languages.empty())
        throw invalid_request("problem " + problem.id + " supports no language");
    if (!(problem.time_limit_sec > 0) || problem.memory_limit_mb <= 0)
        throw invalid_request("problem " + problem.id + " has non-positive resource limits");

    for (auto &name : problem.supported_languages) {
        if (!languages.contains(name))
            throw invalid_request("problem " + problem.id + " declares unsupported language " + name);
        const language_profile &language = languages.get(name);
        render_signature(signature, language);
        render_function_type(signature, language);
        render_tests(problem, signature, language);
    }
}

}  // namespace grader::translate
