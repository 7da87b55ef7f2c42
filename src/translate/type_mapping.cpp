#include "translate/type_mapping.hpp"
#include <boost/algorithm/string/replace.hpp>
#include <boost/assign.hpp>
#include <cctype>
#include "common/exceptions.hpp"

namespace grader::translate {
using namespace std;

static const map<string, type_kind> type_names = boost::assign::map_list_of
    ("int", type_kind::INT)
    ("float", type_kind::FLOAT)
    ("bool", type_kind::BOOL)
    ("str", type_kind::STR)
    ("none", type_kind::NONE)
    ("None", type_kind::NONE)
    ("any", type_kind::ANY)
    ("Any", type_kind::ANY)
    ("list", type_kind::LIST)
    ("List", type_kind::LIST)
    ("tuple", type_kind::TUPLE)
    ("Tuple", type_kind::TUPLE)
    ("set", type_kind::SET)
    ("Set", type_kind::SET)
    ("dict", type_kind::DICT)
    ("Dict", type_kind::DICT)
    ("optional", type_kind::OPTIONAL)
    ("Optional", type_kind::OPTIONAL);

static const map<type_kind, string> canonical_names = boost::assign::map_list_of
    (type_kind::INT, "int")
    (type_kind::FLOAT, "float")
    (type_kind::BOOL, "bool")
    (type_kind::STR, "str")
    (type_kind::NONE, "none")
    (type_kind::ANY, "any")
    (type_kind::LIST, "list")
    (type_kind::TUPLE, "tuple")
    (type_kind::SET, "set")
    (type_kind::DICT, "dict")
    (type_kind::OPTIONAL, "optional");

bool canonical_type::operator==(const canonical_type &other) const {
    return kind == other.kind && arguments == other.arguments;
}

const vector<type_kind> &all_type_kinds() {
    static const vector<type_kind> kinds = {
        type_kind::INT, type_kind::FLOAT, type_kind::BOOL, type_kind::STR,
        type_kind::NONE, type_kind::ANY, type_kind::LIST, type_kind::TUPLE,
        type_kind::SET, type_kind::DICT, type_kind::OPTIONAL};
    return kinds;
}

optional<type_kind> lookup_type_name(const string &name) {
    auto it = type_names.find(name);
    if (it == type_names.end()) return nullopt;
    return it->second;
}

/**
 * @brief 类型参数个数是否合法，tuple 至少一个参数，容器类型参数个数固定
 */
static bool check_arity(type_kind kind, size_t count) {
    switch (kind) {
        case type_kind::LIST:
        case type_kind::SET:
        case type_kind::OPTIONAL:
            return count == 1;
        case type_kind::DICT:
            return count == 2;
        case type_kind::TUPLE:
            return count >= 1;
        default:
            return count == 0;
    }
}

namespace {

struct type_parser {
    explicit type_parser(const string &text) : text(text) {}

    canonical_type parse() {
        canonical_type type = parse_union();
        skip_spaces();
        if (pos != text.size())
            fail("unexpected '" + text.substr(pos) + "'");
        return type;
    }

private:
    const string &text;
    size_t pos = 0;

    [[noreturn]] void fail(const string &reason) const {
        throw translation_error(translation_error::kind::MALFORMED_SIGNATURE,
                                "malformed type \"" + text + "\": " + reason);
    }

    void skip_spaces() {
        while (pos < text.size() && isspace((unsigned char)text[pos])) ++pos;
    }

    bool consume(char c) {
        skip_spaces();
        if (pos < text.size() && text[pos] == c) {
            ++pos;
            return true;
        }
        return false;
    }

    // X | None 与 Optional[X] 等价，其他联合类型不在词汇表中
    canonical_type parse_union() {
        vector<canonical_type> members = {parse_primary()};
        while (consume('|')) members.push_back(parse_primary());
        if (members.size() == 1) return members[0];

        canonical_type none{type_kind::NONE, {}};
        vector<canonical_type> others;
        bool has_none = false;
        for (auto &member : members) {
            if (member == none) has_none = true;
            else others.push_back(member);
        }
        if (!has_none || others.size() != 1)
            fail("only unions of the form T | None are supported");
        return canonical_type{type_kind::OPTIONAL, {others[0]}};
    }

    canonical_type parse_primary() {
        skip_spaces();
        size_t start = pos;
        while (pos < text.size() && (isalnum((unsigned char)text[pos]) || text[pos] == '_')) ++pos;
        if (start == pos) fail("type name expected at position " + std::to_string(start));

        string name = text.substr(start, pos - start);
        auto kind = lookup_type_name(name);
        if (!kind) fail("unknown type " + name);

        canonical_type type{*kind, {}};
        if (consume('[')) {
            if (!consume(']')) {
                do {
                    type.arguments.push_back(parse_union());
                } while (consume(','));
                if (!consume(']')) fail("unbalanced brackets");
            }
        }
        // 没有类型参数的容器视为元素类型任意
        if (type.arguments.empty() && *kind != type_kind::TUPLE) {
            if (*kind == type_kind::LIST || *kind == type_kind::SET)
                type.arguments = {canonical_type{type_kind::ANY, {}}};
            else if (*kind == type_kind::DICT)
                type.arguments = {canonical_type{type_kind::ANY, {}}, canonical_type{type_kind::ANY, {}}};
        }
        if (*kind == type_kind::TUPLE && type.arguments.empty())
            fail("tuple requires at least one element type");
        if (!check_arity(*kind, type.arguments.size()))
            fail("wrong number of type arguments for " + name);
        return type;
    }
};

}  // namespace

canonical_type parse_type(const string &text) {
    return type_parser(text).parse();
}

string to_string(const canonical_type &type) {
    string result = canonical_names.at(type.kind);
    if (type.arguments.empty()) return result;
    result += '[';
    for (size_t i = 0; i < type.arguments.size(); ++i) {
        if (i) result += ", ";
        result += to_string(type.arguments[i]);
    }
    result += ']';
    return result;
}

string render_type(const canonical_type &type, const type_table &table) {
    auto it = table.patterns.find(type.kind);
    if (it == table.patterns.end())
        throw internal_error("type table has no entry for " + canonical_names.at(type.kind));

    vector<string> rendered;
    for (auto &argument : type.arguments)
        rendered.push_back(render_type(argument, table));

    string result = it->second;
    string all;
    for (size_t i = 0; i < rendered.size(); ++i) {
        if (i) all += ", ";
        all += rendered[i];
    }
    boost::replace_all(result, "{*}", all);
    for (size_t i = 0; i < rendered.size(); ++i) {
        string index = std::to_string(i);
        string wrapped = rendered[i].find(' ') == string::npos ? rendered[i] : "(" + rendered[i] + ")";
        boost::replace_all(result, "{" + index + "?}", wrapped);
        boost::replace_all(result, "{" + index + "}", rendered[i]);
    }
    return result;
}

vector<type_kind> missing_types(const type_table &table) {
    vector<type_kind> missing;
    for (type_kind kind : all_type_kinds())
        if (!table.patterns.count(kind)) missing.push_back(kind);
    return missing;
}

}  // namespace grader::translate
