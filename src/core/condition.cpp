#include "core/condition.hpp"
#include "core/template.hpp"

#include <cctype>
#include <vector>

using json = nlohmann::json;

// ── AST ─────────────────────────────────────────────────────────

struct Condition::Node {
    enum class Kind { Var, Const, Eq, Neq, And, Or, Not, In };

    Kind kind;
    std::string name;   // Var
    json value;         // Const
    std::unique_ptr<Node> lhs;
    std::unique_ptr<Node> rhs;  // unused by Not, Var, Const
};

using Node = Condition::Node;
using NodePtr = std::unique_ptr<Node>;

static NodePtr make_leaf_var(const std::string& name) {
    auto n = std::make_unique<Node>();
    n->kind = Node::Kind::Var;
    n->name = name;
    return n;
}

static NodePtr make_leaf_const(json value) {
    auto n = std::make_unique<Node>();
    n->kind = Node::Kind::Const;
    n->value = std::move(value);
    return n;
}

static NodePtr make_node(Node::Kind kind, NodePtr lhs, NodePtr rhs = nullptr) {
    auto n = std::make_unique<Node>();
    n->kind = kind;
    n->lhs = std::move(lhs);
    n->rhs = std::move(rhs);
    return n;
}

// ── Tokenizer ───────────────────────────────────────────────────

namespace {

enum class Tok { Ident, String, Number, LParen, RParen, Dot, Bang, AndAnd, OrOr, EqEq, NotEq, End };

struct Token {
    Tok type;
    std::string text;
    size_t pos;
};

std::vector<Token> tokenize(const std::string& src) {
    std::vector<Token> tokens;
    size_t i = 0;
    while (i < src.size()) {
        char c = src[i];
        if (std::isspace(static_cast<unsigned char>(c))) { ++i; continue; }

        size_t start = i;
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$') {
            while (i < src.size() &&
                   (std::isalnum(static_cast<unsigned char>(src[i])) || src[i] == '_' ||
                    src[i] == '$' || src[i] == '-')) {
                ++i;
            }
            tokens.push_back({Tok::Ident, src.substr(start, i - start), start});
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '-' && i + 1 < src.size() && std::isdigit(static_cast<unsigned char>(src[i + 1])))) {
            ++i;
            while (i < src.size() &&
                   (std::isdigit(static_cast<unsigned char>(src[i])) || src[i] == '.')) {
                ++i;
            }
            tokens.push_back({Tok::Number, src.substr(start, i - start), start});
            continue;
        }
        if (c == '\'' || c == '"') {
            char quote = c;
            std::string value;
            ++i;
            bool closed = false;
            while (i < src.size()) {
                if (src[i] == '\\' && i + 1 < src.size()) {
                    value += src[i + 1];
                    i += 2;
                    continue;
                }
                if (src[i] == quote) { closed = true; ++i; break; }
                value += src[i++];
            }
            if (!closed) {
                throw ConditionEvalError("Unterminated string at position " + std::to_string(start));
            }
            tokens.push_back({Tok::String, value, start});
            continue;
        }

        auto match = [&](const char* op) {
            return src.compare(i, std::char_traits<char>::length(op), op) == 0;
        };
        if (match("===") || match("!==")) {
            tokens.push_back({c == '=' ? Tok::EqEq : Tok::NotEq, src.substr(i, 3), start});
            i += 3;
        } else if (match("==")) {
            tokens.push_back({Tok::EqEq, "==", start});
            i += 2;
        } else if (match("!=")) {
            tokens.push_back({Tok::NotEq, "!=", start});
            i += 2;
        } else if (match("&&")) {
            tokens.push_back({Tok::AndAnd, "&&", start});
            i += 2;
        } else if (match("||")) {
            tokens.push_back({Tok::OrOr, "||", start});
            i += 2;
        } else if (c == '!') {
            tokens.push_back({Tok::Bang, "!", start}); ++i;
        } else if (c == '(') {
            tokens.push_back({Tok::LParen, "(", start}); ++i;
        } else if (c == ')') {
            tokens.push_back({Tok::RParen, ")", start}); ++i;
        } else if (c == '.') {
            tokens.push_back({Tok::Dot, ".", start}); ++i;
        } else {
            throw ConditionEvalError(std::string("Unexpected character '") + c +
                                     "' at position " + std::to_string(i));
        }
    }
    tokens.push_back({Tok::End, "", src.size()});
    return tokens;
}

// ── Parser ──────────────────────────────────────────────────────

class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    NodePtr parse() {
        if (peek().type == Tok::End) {
            throw ConditionEvalError("Empty condition");
        }
        auto node = parse_or();
        if (peek().type != Tok::End) {
            throw unexpected();
        }
        return node;
    }

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;

    const Token& peek() const { return tokens_[pos_]; }
    const Token& next() { return tokens_[pos_++]; }

    bool is_keyword(const char* word) const {
        return peek().type == Tok::Ident && peek().text == word;
    }

    ConditionEvalError unexpected() const {
        const auto& t = peek();
        if (t.type == Tok::End) {
            return ConditionEvalError("Unexpected end of condition");
        }
        return ConditionEvalError("Unexpected '" + t.text + "' at position " + std::to_string(t.pos));
    }

    void expect(Tok type) {
        if (peek().type != type) throw unexpected();
        ++pos_;
    }

    NodePtr parse_or() {
        auto lhs = parse_and();
        while (peek().type == Tok::OrOr || is_keyword("or")) {
            next();
            lhs = make_node(Node::Kind::Or, std::move(lhs), parse_and());
        }
        return lhs;
    }

    NodePtr parse_and() {
        auto lhs = parse_unary();
        while (peek().type == Tok::AndAnd || is_keyword("and")) {
            next();
            lhs = make_node(Node::Kind::And, std::move(lhs), parse_unary());
        }
        return lhs;
    }

    NodePtr parse_unary() {
        if (peek().type == Tok::Bang || is_keyword("not")) {
            next();
            return make_node(Node::Kind::Not, parse_unary());
        }
        return parse_compare();
    }

    NodePtr parse_compare() {
        auto lhs = parse_operand();
        if (peek().type == Tok::EqEq) {
            next();
            return make_node(Node::Kind::Eq, std::move(lhs), parse_operand());
        }
        if (peek().type == Tok::NotEq) {
            next();
            return make_node(Node::Kind::Neq, std::move(lhs), parse_operand());
        }
        if (is_keyword("in")) {
            next();
            return make_node(Node::Kind::In, std::move(lhs), parse_operand());
        }
        return lhs;
    }

    NodePtr parse_operand() {
        auto target = parse_primary();
        while (peek().type == Tok::Dot) {
            next();
            if (!is_keyword("includes")) throw unexpected();
            next();
            expect(Tok::LParen);
            auto needle = parse_or();
            expect(Tok::RParen);
            target = make_node(Node::Kind::In, std::move(needle), std::move(target));
        }
        return target;
    }

    NodePtr parse_primary() {
        const Token& t = peek();
        switch (t.type) {
            case Tok::LParen: {
                next();
                auto inner = parse_or();
                expect(Tok::RParen);
                return inner;
            }
            case Tok::String:
                return make_leaf_const(json(next().text));
            case Tok::Number: {
                std::string text = next().text;
                json value;
                size_t used = 0;
                try {
                    if (text.find('.') == std::string::npos) {
                        value = std::stoll(text, &used);
                    } else {
                        value = std::stod(text, &used);
                    }
                } catch (const std::logic_error&) {
                    used = 0;
                }
                // The whole token must be one number: "1.2.3" is rejected
                if (used == 0 || used != text.size()) {
                    throw ConditionEvalError("Invalid number '" + text + "'");
                }
                return make_leaf_const(std::move(value));
            }
            case Tok::Ident: {
                static const char* reserved[] = {"and", "or", "not", "in"};
                for (const char* r : reserved) {
                    if (t.text == r) throw unexpected();
                }
                std::string name = next().text;
                if (name == "true") return make_leaf_const(json(true));
                if (name == "false") return make_leaf_const(json(false));
                if (name == "null" || name == "undefined") return make_leaf_const(json());
                return make_leaf_var(name);
            }
            default:
                throw unexpected();
        }
    }
};

// ── Evaluation ──────────────────────────────────────────────────

bool loose_equals(const json& a, const json& b) {
    if (a.is_null() || b.is_null()) return a.is_null() && b.is_null();
    if (a.is_number() && b.is_number()) return a.get<double>() == b.get<double>();
    if (a.type() == b.type()) return a == b;
    if (a.is_structured() || b.is_structured()) return false;
    return format_value(a, TemplateMode::Command) == format_value(b, TemplateMode::Command);
}

bool contains_value(const json& haystack, const json& needle) {
    if (haystack.is_array()) {
        for (const auto& e : haystack) {
            if (loose_equals(e, needle)) return true;
        }
        return false;
    }
    if (haystack.is_string()) {
        if (needle.is_null() || needle.is_structured()) return false;
        return haystack.get_ref<const std::string&>().find(
                   format_value(needle, TemplateMode::Command)) != std::string::npos;
    }
    return false;
}

json eval_node(const Node& node, const VariableStore& vars) {
    switch (node.kind) {
        case Node::Kind::Var:
            return vars.get(node.name);
        case Node::Kind::Const:
            return node.value;
        case Node::Kind::Eq:
            return loose_equals(eval_node(*node.lhs, vars), eval_node(*node.rhs, vars));
        case Node::Kind::Neq:
            return !loose_equals(eval_node(*node.lhs, vars), eval_node(*node.rhs, vars));
        case Node::Kind::And:
            return VariableStore::is_truthy(eval_node(*node.lhs, vars)) &&
                   VariableStore::is_truthy(eval_node(*node.rhs, vars));
        case Node::Kind::Or:
            return VariableStore::is_truthy(eval_node(*node.lhs, vars)) ||
                   VariableStore::is_truthy(eval_node(*node.rhs, vars));
        case Node::Kind::Not:
            return !VariableStore::is_truthy(eval_node(*node.lhs, vars));
        case Node::Kind::In:
            return contains_value(eval_node(*node.rhs, vars), eval_node(*node.lhs, vars));
    }
    return json();
}

} // namespace

// ── Public API ──────────────────────────────────────────────────

Condition Condition::parse(const std::string& expr) {
    Parser parser(tokenize(expr));
    Condition c;
    c.source_ = expr;
    c.root_ = std::shared_ptr<const Node>(parser.parse().release());
    return c;
}

bool Condition::evaluate(const VariableStore& vars) const {
    if (!root_) return false;
    return VariableStore::is_truthy(eval_node(*root_, vars));
}

bool evaluate_condition(const std::string& expr, const VariableStore& vars) {
    return Condition::parse(expr).evaluate(vars);
}
