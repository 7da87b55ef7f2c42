#include "translate/expression.hpp"
#include <fmt/format.h>
#include <cctype>
#include "common/exceptions.hpp"
#include "translate/language.hpp"

namespace grader::translate {
using namespace std;

namespace {

enum class token_type { NUMBER, STRING, NAME, SYMBOL, END };

struct token {
    token_type type;
    string text;  // 对于字符串是解码后的值
    size_t offset;
};

[[noreturn]] void malformed(const string &source, const string &reason) {
    throw translation_error(translation_error::kind::MALFORMED_TEST,
                            "malformed test \"" + source + "\": " + reason);
}

void append_utf8(string &out, unsigned code) {
    if (code < 0x80) {
        out += (char)code;
    } else if (code < 0x800) {
        out += (char)(0xC0 | (code >> 6));
        out += (char)(0x80 | (code & 0x3F));
    } else if (code < 0x10000) {
        out += (char)(0xE0 | (code >> 12));
        out += (char)(0x80 | ((code >> 6) & 0x3F));
        out += (char)(0x80 | (code & 0x3F));
    } else {
        out += (char)(0xF0 | (code >> 18));
        out += (char)(0x80 | ((code >> 12) & 0x3F));
        out += (char)(0x80 | ((code >> 6) & 0x3F));
        out += (char)(0x80 | (code & 0x3F));
    }
}

vector<token> tokenize(const string &source) {
    static const vector<string> symbols = {"==", "!=", "<=", ">=", "<", ">", "(", ")", "[", "]",
                                           "{", "}", ",", ":", "-"};
    vector<token> tokens;
    size_t i = 0, n = source.size();
    while (i < n) {
        char c = source[i];
        if (isspace((unsigned char)c)) {
            ++i;
        } else if (c == '#') {
            break;  // 注释
        } else if (isdigit((unsigned char)c) || (c == '.' && i + 1 < n && isdigit((unsigned char)source[i + 1]))) {
            size_t start = i;
            while (i < n && isdigit((unsigned char)source[i])) ++i;
            if (i < n && source[i] == '.') {
                ++i;
                while (i < n && isdigit((unsigned char)source[i])) ++i;
            }
            if (i < n && (source[i] == 'e' || source[i] == 'E')) {
                size_t mark = i++;
                if (i < n && (source[i] == '+' || source[i] == '-')) ++i;
                if (i < n && isdigit((unsigned char)source[i])) {
                    while (i < n && isdigit((unsigned char)source[i])) ++i;
                } else {
                    i = mark;
                }
            }
            tokens.push_back({token_type::NUMBER, source.substr(start, i - start), start});
        } else if (isalpha((unsigned char)c) || c == '_') {
            size_t start = i;
            while (i < n && (isalnum((unsigned char)source[i]) || source[i] == '_')) ++i;
            tokens.push_back({token_type::NAME, source.substr(start, i - start), start});
        } else if (c == '"' || c == '\'') {
            size_t start = i++;
            string value;
            bool closed = false;
            while (i < n) {
                char d = source[i++];
                if (d == c) {
                    closed = true;
                    break;
                }
                if (d == '\n') break;
                if (d != '\\') {
                    value += d;
                    continue;
                }
                if (i >= n) break;
                char e = source[i++];
                switch (e) {
                    case 'n': value += '\n'; break;
                    case 't': value += '\t'; break;
                    case 'r': value += '\r'; break;
                    case '0': value += '\0'; break;
                    case 'b': value += '\b'; break;
                    case 'f': value += '\f'; break;
                    case 'x':
                    case 'u': {
                        size_t digits = e == 'x' ? 2 : 4;
                        if (i + digits > n) malformed(source, "truncated escape sequence");
                        string hex = source.substr(i, digits);
                        for (char h : hex)
                            if (!isxdigit((unsigned char)h)) malformed(source, "invalid escape sequence");
                        append_utf8(value, (unsigned)stoul(hex, nullptr, 16));
                        i += digits;
                        break;
                    }
                    default: value += e; break;
                }
            }
            if (!closed) malformed(source, "unterminated string literal");
            tokens.push_back({token_type::STRING, value, start});
        } else {
            bool matched = false;
            for (auto &symbol : symbols) {
                if (source.compare(i, symbol.size(), symbol) == 0) {
                    tokens.push_back({token_type::SYMBOL, symbol, i});
                    i += symbol.size();
                    matched = true;
                    break;
                }
            }
            if (!matched) malformed(source, fmt::format("unexpected character '{}' at position {}", c, i));
        }
    }
    tokens.push_back({token_type::END, "", n});
    return tokens;
}

struct expression_parser {
    expression_parser(const string &source) : source(source), tokens(tokenize(source)) {}

    expression parse_assertion() {
        accept_name("assert");
        expression expr = parse_or();
        // Python 风格的断言消息不参与判定
        if (accept_symbol(",")) {
            if (peek().type != token_type::STRING) fail("assertion message must be a string");
            ++pos;
        }
        expect_end();
        return expr;
    }

    expression parse_single() {
        expression expr = parse_or();
        expect_end();
        return expr;
    }

private:
    const string &source;
    vector<token> tokens;
    size_t pos = 0;

    [[noreturn]] void fail(const string &reason) const {
        malformed(source, reason);
    }

    const token &peek(size_t ahead = 0) const {
        return tokens[min(pos + ahead, tokens.size() - 1)];
    }

    bool accept_symbol(const string &symbol) {
        if (peek().type == token_type::SYMBOL && peek().text == symbol) {
            ++pos;
            return true;
        }
        return false;
    }

    bool accept_name(const string &name) {
        if (peek().type == token_type::NAME && peek().text == name) {
            ++pos;
            return true;
        }
        return false;
    }

    void expect_symbol(const string &symbol) {
        if (!accept_symbol(symbol))
            fail(fmt::format("expected '{}' at position {}", symbol, peek().offset));
    }

    void expect_end() {
        if (peek().type != token_type::END)
            fail(fmt::format("unexpected '{}' at position {}", peek().text, peek().offset));
    }

    expression parse_or() {
        expression lhs = parse_and();
        while (accept_name("or")) {
            expression rhs = parse_and();
            lhs = expression{logical{logical_operator::OR, make_shared<expression>(move(lhs)), make_shared<expression>(move(rhs))}};
        }
        return lhs;
    }

    expression parse_and() {
        expression lhs = parse_not();
        while (accept_name("and")) {
            expression rhs = parse_not();
            lhs = expression{logical{logical_operator::AND, make_shared<expression>(move(lhs)), make_shared<expression>(move(rhs))}};
        }
        return lhs;
    }

    expression parse_not() {
        if (accept_name("not")) return expression{negation{make_shared<expression>(parse_not())}};
        return parse_comparison();
    }

    bool accept_comparison_operator(comparison_operator &op) {
        static const vector<pair<string, comparison_operator>> ops = {
            {"==", comparison_operator::EQUAL},
            {"!=", comparison_operator::NOT_EQUAL},
            {"<=", comparison_operator::LESS_EQUAL},
            {">=", comparison_operator::GREATER_EQUAL},
            {"<", comparison_operator::LESS},
            {">", comparison_operator::GREATER}};
        for (auto &[symbol, value] : ops) {
            if (accept_symbol(symbol)) {
                op = value;
                return true;
            }
        }
        if (accept_name("is")) {
            op = accept_name("not") ? comparison_operator::IS_NOT : comparison_operator::IS;
            return true;
        }
        return false;
    }

    expression parse_comparison() {
        expression lhs = parse_primary();
        comparison_operator op;
        if (!accept_comparison_operator(op)) return lhs;
        expression rhs = parse_primary();
        comparison_operator chained;
        if (accept_comparison_operator(chained)) fail("chained comparisons are not supported");
        return make_comparison(op, move(lhs), move(rhs));
    }

    vector<expression> parse_sequence(const string &close) {
        vector<expression> elements;
        while (!accept_symbol(close)) {
            elements.push_back(parse_or());
            if (!accept_symbol(",")) {
                expect_symbol(close);
                break;
            }
        }
        return elements;
    }

    expression parse_primary() {
        const token &tok = peek();
        switch (tok.type) {
            case token_type::NUMBER:
                ++pos;
                return expression{number_literal{tok.text}};
            case token_type::STRING:
                ++pos;
                return expression{string_literal{tok.text}};
            case token_type::NAME:
                return parse_name();
            case token_type::SYMBOL:
                break;
            case token_type::END:
                fail("unexpected end of expression");
        }

        if (accept_symbol("-")) {
            if (peek().type != token_type::NUMBER) fail("unary minus is only supported on numbers");
            return expression{number_literal{"-" + tokens[pos++].text}};
        }
        if (accept_symbol("[")) return expression{list_literal{parse_sequence("]")}};
        if (accept_symbol("(")) {
            if (accept_symbol(")")) return expression{tuple_literal{}};
            expression first = parse_or();
            if (accept_symbol(")")) return first;
            expect_symbol(",");
            vector<expression> elements = {move(first)};
            auto rest = parse_sequence(")");
            for (auto &element : rest) elements.push_back(move(element));
            return expression{tuple_literal{move(elements)}};
        }
        if (accept_symbol("{")) {
            if (accept_symbol("}")) return expression{dict_literal{}};
            expression first = parse_or();
            if (accept_symbol(":")) {
                dict_literal dict;
                dict.entries.emplace_back(move(first), parse_or());
                while (accept_symbol(",")) {
                    if (accept_symbol("}")) return expression{move(dict)};
                    expression key = parse_or();
                    expect_symbol(":");
                    dict.entries.emplace_back(move(key), parse_or());
                }
                expect_symbol("}");
                return expression{move(dict)};
            }
            set_literal s;
            s.elements.push_back(move(first));
            if (accept_symbol(",")) {
                auto rest = parse_sequence("}");
                for (auto &element : rest) s.elements.push_back(move(element));
            } else {
                expect_symbol("}");
            }
            return expression{move(s)};
        }
        fail(fmt::format("unexpected '{}' at position {}", tok.text, tok.offset));
    }

    expression parse_name() {
        string name = tokens[pos++].text;
        if (name == "True" || name == "true") return expression{bool_literal{true}};
        if (name == "False" || name == "false") return expression{bool_literal{false}};
        if (name == "None" || name == "null") return expression{null_literal{}};
        if (name == "and" || name == "or" || name == "not" || name == "is" || name == "assert")
            fail("unexpected keyword " + name);
        if (accept_symbol("(")) {
            vector<expression> arguments = parse_sequence(")");
            // Python 中空容器的构造写法
            if (arguments.empty() && name == "set") return expression{set_literal{}};
            if (arguments.empty() && name == "list") return expression{list_literal{}};
            if (arguments.empty() && name == "dict") return expression{dict_literal{}};
            return expression{call{name, move(arguments)}};
        }
        return expression{identifier{name}};
    }
};

string escape_string(const string &value) {
    string result = "\"";
    for (char c : value) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            case '\r': result += "\\r"; break;
            default:
                if ((unsigned char)c < 0x20 || c == 0x7F)
                    result += fmt::format("\\u{:04x}", (unsigned)(unsigned char)c);
                else
                    result += c;
        }
    }
    result += "\"";
    return result;
}

bool is_compound(const expression &expr) {
    return holds_alternative<comparison>(expr.node) ||
           holds_alternative<logical>(expr.node) ||
           holds_alternative<negation>(expr.node);
}

struct expression_renderer {
    const literal_syntax &syntax;
    const map<string, string> &renames;

    string operator()(const expression &expr) const {
        return visit([this](auto &node) { return render(node); }, expr.node);
    }

    string operand(const expression &expr) const {
        string text = (*this)(expr);
        return is_compound(expr) ? "(" + text + ")" : text;
    }

    string join(const vector<expression> &elements) const {
        string result;
        for (size_t i = 0; i < elements.size(); ++i) {
            if (i) result += ", ";
            result += (*this)(elements[i]);
        }
        return result;
    }

    string render(const null_literal &) const { return syntax.null_literal; }
    string render(const bool_literal &node) const { return node.value ? syntax.true_literal : syntax.false_literal; }
    string render(const number_literal &node) const { return node.text; }
    string render(const string_literal &node) const { return escape_string(node.value); }
    string render(const identifier &node) const { return node.name; }

    string render(const list_literal &node) const {
        return "[" + join(node.elements) + "]";
    }

    string render(const tuple_literal &node) const {
        string items = join(node.elements);
        if (node.elements.size() == 1 && syntax.single_tuple_trailing_comma) items += ",";
        return syntax.tuple_open + items + syntax.tuple_close;
    }

    string render(const set_literal &node) const {
        if (node.elements.empty()) return syntax.empty_set;
        return syntax.set_open + join(node.elements) + syntax.set_close;
    }

    string render(const dict_literal &node) const {
        string result = "{";
        for (size_t i = 0; i < node.entries.size(); ++i) {
            if (i) result += ", ";
            result += (*this)(node.entries[i].first) + ": " + (*this)(node.entries[i].second);
        }
        return result + "}";
    }

    string render(const call &node) const {
        auto it = renames.find(node.callee);
        string callee = it == renames.end() ? node.callee : it->second;
        return callee + "(" + join(node.arguments) + ")";
    }

    string render(const comparison &node) const {
        string lhs = operand(*node.lhs), rhs = operand(*node.rhs);
        string pattern;
        switch (node.op) {
            case comparison_operator::EQUAL: pattern = syntax.equal_template; break;
            case comparison_operator::NOT_EQUAL: pattern = syntax.not_equal_template; break;
            case comparison_operator::IS: pattern = syntax.is_template; break;
            case comparison_operator::IS_NOT: pattern = syntax.is_not_template; break;
            case comparison_operator::LESS: return lhs + " < " + rhs;
            case comparison_operator::LESS_EQUAL: return lhs + " <= " + rhs;
            case comparison_operator::GREATER: return lhs + " > " + rhs;
            case comparison_operator::GREATER_EQUAL: return lhs + " >= " + rhs;
        }
        return expand_template(pattern, {{"lhs", lhs}, {"rhs", rhs}});
    }

    string render(const logical &node) const {
        const string &op = node.op == logical_operator::AND ? syntax.and_operator : syntax.or_operator;
        return operand(*node.lhs) + " " + op + " " + operand(*node.rhs);
    }

    string render(const negation &node) const {
        return expand_template(syntax.not_template, {{"operand", operand(*node.operand)}});
    }
};

}  // namespace

expression parse_assertion(const string &text) {
    return expression_parser(text).parse_assertion();
}

expression parse_expression(const string &text) {
    return expression_parser(text).parse_single();
}

string render_expression(const expression &expr, const literal_syntax &syntax,
                         const map<string, string> &renames) {
    return expression_renderer{syntax, renames}(expr);
}

expression make_comparison(comparison_operator op, expression lhs, expression rhs) {
    return expression{comparison{op, make_shared<expression>(move(lhs)), make_shared<expression>(move(rhs))}};
}

}  // namespace grader::translate
