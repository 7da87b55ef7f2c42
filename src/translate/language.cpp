#include "translate/language.hpp"
#include <boost/assign.hpp>
#include "common/exceptions.hpp"

namespace grader::translate {
using namespace std;

string expand_template(const string &pattern, const map<string, string> &values) {
    // 只扫描一遍模板，替换进去的内容不会再被当作占位符
    string result;
    size_t pos = 0;
    while (pos < pattern.size()) {
        size_t open = pattern.find("{{", pos);
        if (open == string::npos) break;
        result.append(pattern, pos, open - pos);
        size_t close = pattern.find("}}", open + 2);
        auto it = close == string::npos ? values.end() : values.find(pattern.substr(open + 2, close - open - 2));
        if (it == values.end()) {
            // {{{key}}} 中第一个花括号是字面量
            result += pattern[open];
            pos = open + 1;
        } else {
            result += it->second;
            pos = close + 2;
        }
    }
    result.append(pattern, pos, string::npos);
    return result;
}

static const char *python_prelude = R"(import sys as __grader_sys
import traceback as __grader_traceback


def __grader_report(index, test):
    try:
        passed = test() is not False
    except Exception:
        __grader_traceback.print_exc()
        passed = False
    __grader_sys.stdout.flush()
    __grader_sys.stdout.write("{{delimiter}} %d %s\n" % (index, "PASS" if passed else "FAIL"))
    __grader_sys.stdout.flush()
)";

static const char *typescript_prelude = R"(const __grader_equal = (a: any, b: any): boolean => {
  if (a === b) return true;
  if (a == null || b == null) return a == null && b == null;
  if (typeof a === "number" && typeof b === "number") return Number.isNaN(a) && Number.isNaN(b);
  if (typeof a !== "object" || typeof b !== "object") return false;
  if (a instanceof Set || b instanceof Set) {
    if (!(a instanceof Set && b instanceof Set) || a.size !== b.size) return false;
    for (const x of a) if (![...b].some((y: any) => __grader_equal(x, y))) return false;
    return true;
  }
  if (a instanceof Map || b instanceof Map) {
    if (!(a instanceof Map && b instanceof Map) || a.size !== b.size) return false;
    for (const [k, v] of a) if (!b.has(k) || !__grader_equal(v, b.get(k))) return false;
    return true;
  }
  if (Array.isArray(a) || Array.isArray(b)) {
    if (!Array.isArray(a) || !Array.isArray(b) || a.length !== b.length) return false;
    return a.every((x: any, i: number) => __grader_equal(x, b[i]));
  }
  const keys = Object.keys(a);
  if (keys.length !== Object.keys(b).length) return false;
  return keys.every((k: string) => Object.prototype.hasOwnProperty.call(b, k) && __grader_equal(a[k], b[k]));
};

const __grader_same = (a: any, b: any): boolean => a === b || (a == null && b == null);

const __grader_report = (index: number, test: () => unknown): void => {
  let passed = false;
  try {
    passed = test() !== false;
  } catch (error) {
    console.error(error);
  }
  process.stdout.write("{{delimiter}} " + index + " " + (passed ? "PASS" : "FAIL") + "\n");
};
)";

static const char *javascript_prelude = R"(const __grader_equal = (a, b) => {
  if (a === b) return true;
  if (a == null || b == null) return a == null && b == null;
  if (typeof a === "number" && typeof b === "number") return Number.isNaN(a) && Number.isNaN(b);
  if (typeof a !== "object" || typeof b !== "object") return false;
  if (a instanceof Set || b instanceof Set) {
    if (!(a instanceof Set && b instanceof Set) || a.size !== b.size) return false;
    for (const x of a) if (![...b].some((y) => __grader_equal(x, y))) return false;
    return true;
  }
  if (a instanceof Map || b instanceof Map) {
    if (!(a instanceof Map && b instanceof Map) || a.size !== b.size) return false;
    for (const [k, v] of a) if (!b.has(k) || !__grader_equal(v, b.get(k))) return false;
    return true;
  }
  if (Array.isArray(a) || Array.isArray(b)) {
    if (!Array.isArray(a) || !Array.isArray(b) || a.length !== b.length) return false;
    return a.every((x, i) => __grader_equal(x, b[i]));
  }
  const keys = Object.keys(a);
  if (keys.length !== Object.keys(b).length) return false;
  return keys.every((k) => Object.prototype.hasOwnProperty.call(b, k) && __grader_equal(a[k], b[k]));
};

const __grader_same = (a, b) => a === b || (a == null && b == null);

const __grader_report = (index, test) => {
  let passed = false;
  try {
    passed = test() !== false;
  } catch (error) {
    console.error(error);
  }
  process.stdout.write("{{delimiter}} " + index + " " + (passed ? "PASS" : "FAIL") + "\n");
};
)";

static literal_syntax ecmascript_literals() {
    literal_syntax syntax;
    syntax.null_literal = "null";
    syntax.true_literal = "true";
    syntax.false_literal = "false";
    syntax.tuple_open = "[";
    syntax.tuple_close = "]";
    syntax.single_tuple_trailing_comma = false;
    syntax.set_open = "new Set([";
    syntax.set_close = "])";
    syntax.empty_set = "new Set()";
    syntax.and_operator = "&&";
    syntax.or_operator = "||";
    syntax.not_template = "!{{operand}}";
    syntax.equal_template = "__grader_equal({{lhs}}, {{rhs}})";
    syntax.not_equal_template = "!__grader_equal({{lhs}}, {{rhs}})";
    syntax.is_template = "__grader_same({{lhs}}, {{rhs}})";
    syntax.is_not_template = "!__grader_same({{lhs}}, {{rhs}})";
    return syntax;
}

static type_table ecmascript_types() {
    type_table table;
    table.patterns = boost::assign::map_list_of
        (type_kind::INT, "number")
        (type_kind::FLOAT, "number")
        (type_kind::BOOL, "boolean")
        (type_kind::STR, "string")
        (type_kind::NONE, "void")
        (type_kind::ANY, "any")
        (type_kind::LIST, "{0?}[]")
        (type_kind::TUPLE, "[{*}]")
        (type_kind::SET, "Set<{0}>")
        (type_kind::DICT, "Record<{0}, {1}>")
        (type_kind::OPTIONAL, "{0} | null")
        .convert_to_container<map<type_kind, string>>();
    return table;
}

// 顶层的 function 声明与箭头函数
static const vector<string> ecmascript_declarations = {
    R"((?:^|\n)[ \t]*(?:export[ \t]+)?(?:default[ \t]+)?(?:async[ \t]+)?function[ \t]*\*?[ \t]*{{name}}[ \t]*[<(])",
    R"((?:^|\n)[ \t]*(?:export[ \t]+)?(?:const|let|var)[ \t]+{{name}}[ \t]*(?::[^=\n]+)?=[^=])"};

static const vector<string> ecmascript_functions = {
    R"((?:^|\n)(?:export[ \t]+)?(?:default[ \t]+)?(?:async[ \t]+)?function[ \t]*\*?[ \t]*([A-Za-z_$][\w$]*)[ \t]*(?:<[^>\n]*>)?[ \t]*\(([^)]*)\))",
    R"((?:^|\n)(?:export[ \t]+)?(?:const|let|var)[ \t]+([A-Za-z_$][\w$]*)[ \t]*=[ \t]*(?:async[ \t]*)?\(([^)]*)\)[^=\n]*=>)"};

language_profile python_profile() {
    language_profile profile;
    profile.name = "python";
    profile.aliases = {"py", "python3"};
    profile.source_file = "main.py";
    profile.command = {"python3", "{{source}}"};
    profile.environment = boost::assign::map_list_of
        ("PYTHONIOENCODING", "utf-8")
        ("PYTHONDONTWRITEBYTECODE", "1")
        .convert_to_container<map<string, string>>();

    profile.types.patterns = boost::assign::map_list_of
        (type_kind::INT, "int")
        (type_kind::FLOAT, "float")
        (type_kind::BOOL, "bool")
        (type_kind::STR, "str")
        (type_kind::NONE, "None")
        (type_kind::ANY, "Any")
        (type_kind::LIST, "list[{0}]")
        (type_kind::TUPLE, "tuple[{*}]")
        (type_kind::SET, "set[{0}]")
        (type_kind::DICT, "dict[{0}, {1}]")
        (type_kind::OPTIONAL, "{0} | None")
        .convert_to_container<map<type_kind, string>>();
    profile.literals = literal_syntax();

    profile.signature_template = "def {{name}}({{parameters}}) -> {{return_type}}:";
    profile.parameter_template = "{{name}}: {{type}}";
    profile.function_type_template = "Callable[[{{parameter_types}}], {{return_type}}]";
    // 类型标注写成字符串，运行时不会求值，也就不需要 import typing
    profile.shim_template = "{{alias}}: \"{{function_type}}\" = {{function}}\n";
    profile.canonical_bind_template = "{{canonical}} = {{function}}\n";

    // Python 中只有顶层函数可以直接调用，类中的方法不算
    profile.declaration_patterns = {
        R"((?:^|\n)(?:async[ \t]+)?def[ \t]+{{name}}[ \t]*\()",
        R"((?:^|\n){{name}}[ \t]*(?::[^=\n]*)?=[^=])"};
    profile.function_patterns = {
        R"((?:^|\n)(?:async[ \t]+)?def[ \t]+([A-Za-z_]\w*)[ \t]*\(([^)]*)\))"};

    profile.prelude = python_prelude;
    profile.test_template =
        "def __grader_test_{{index}}():\n"
        "{{body}}"
        "    return True\n"
        "\n"
        "\n"
        "__grader_report({{index}}, __grader_test_{{index}})\n";
    profile.assertion_template =
        "{{indent}}if not ({{condition}}):\n"
        "{{indent}}    return False\n";
    profile.body_indent = "    ";
    return profile;
}

language_profile typescript_profile() {
    language_profile profile;
    profile.name = "typescript";
    profile.aliases = {"ts"};
    profile.source_file = "main.ts";
    profile.command = {"tsx", "{{source}}"};
    profile.extra_files = {{"package.json", "{\"type\": \"module\"}\n"}};
    profile.environment = {{"NODE_NO_WARNINGS", "1"}};

    profile.types = ecmascript_types();
    profile.literals = ecmascript_literals();

    profile.signature_template = "function {{name}}({{parameters}}): {{return_type}}";
    profile.parameter_template = "{{name}}: {{type}}";
    profile.function_type_template = "({{parameters}}) => {{return_type}}";
    profile.shim_template = "const {{alias}}: {{function_type}} = {{function}};\n";
    profile.canonical_bind_template = "const {{canonical}} = {{function}};\n";
    profile.declaration_patterns = ecmascript_declarations;
    profile.function_patterns = ecmascript_functions;

    profile.prelude = typescript_prelude;
    profile.test_template =
        "__grader_report({{index}}, () => {\n"
        "{{body}}"
        "  return true;\n"
        "});\n";
    profile.assertion_template = "{{indent}}if (!({{condition}})) return false;\n";
    profile.body_indent = "  ";
    return profile;
}

language_profile javascript_profile() {
    language_profile profile;
    profile.name = "javascript";
    profile.aliases = {"js", "node"};
    profile.source_file = "main.mjs";
    profile.command = {"node", "{{source}}"};
    profile.environment = {{"NODE_NO_WARNINGS", "1"}};

    profile.types = ecmascript_types();
    profile.literals = ecmascript_literals();

    profile.signature_template =
        "/**\n"
        "{{parameter_docs}}"
        " * @returns {{{return_type}}}\n"
        " */\n"
        "function {{name}}({{parameters}})";
    profile.parameter_template = "{{name}}";
    profile.parameter_doc_template = " * @param {{{type}}} {{name}}\n";
    profile.function_type_template = "({{parameters}}) => {{return_type}}";
    profile.shim_template = "/** @type {{{function_type}}} */\nconst {{alias}} = {{function}};\n";
    profile.canonical_bind_template = "const {{canonical}} = {{function}};\n";
    profile.declaration_patterns = ecmascript_declarations;
    profile.function_patterns = ecmascript_functions;

    profile.prelude = javascript_prelude;
    profile.test_template =
        "__grader_report({{index}}, () => {\n"
        "{{body}}"
        "  return true;\n"
        "});\n";
    profile.assertion_template = "{{indent}}if (!({{condition}})) return false;\n";
    profile.body_indent = "  ";
    return profile;
}

language_registry::language_registry() {
    add(python_profile());
    add(typescript_profile());
    add(javascript_profile());
}

void language_registry::add(language_profile profile) {
    auto missing = missing_types(profile.types);
    if (!missing.empty())
        throw internal_error("type table of language " + profile.name + " is incomplete");
    for (auto &alias : profile.aliases) aliases[alias] = profile.name;
    string name = profile.name;
    profiles[name] = move(profile);
}

void language_registry::configure(const nlohmann::json &j) {
    for (auto &[name, override_config] : j.items()) {
        language_profile &profile = profiles.at(normalize(name));
        if (override_config.count("command")) {
            auto command = override_config.at("command").get<vector<string>>();
            if (command.empty()) throw invalid_request("run command of language " + name + " is empty");
            profile.command = command;
        }
        if (override_config.count("environment"))
            override_config.at("environment").get_to(profile.environment);
        if (override_config.count("source_file"))
            override_config.at("source_file").get_to(profile.source_file);
    }
}

string language_registry::normalize(const string &name) const {
    if (profiles.count(name)) return name;
    auto it = aliases.find(name);
    if (it != aliases.end()) return it->second;
    throw invalid_request("unsupported language " + name);
}

const language_profile &language_registry::get(const string &name) const {
    return profiles.at(normalize(name));
}

bool language_registry::contains(const string &name) const {
    return profiles.count(name) || aliases.count(name);
}

vector<string> language_registry::names() const {
    vector<string> result;
    for (auto &[name, profile] : profiles) result.push_back(name);
    return result;
}

}  // namespace grader::translate
