#pragma once

#include "core/variable_store.hpp"

#include <memory>
#include <stdexcept>
#include <string>

/// Thrown for malformed condition expressions
class ConditionEvalError : public std::runtime_error {
public:
    explicit ConditionEvalError(const std::string& msg) : std::runtime_error(msg) {}
};

/// A parsed boolean expression over variable names.
///
/// Grammar (closed; nothing in it can reach the host):
///   expr    := and (("||" | "or") and)*
///   and     := unary (("&&" | "and") unary)*
///   unary   := ("!" | "not") unary | compare
///   compare := operand (("==" | "===" | "!=" | "!==" | "in") operand)?
///   operand := primary ("." "includes" "(" expr ")")*
///   primary := name | 'string' | "string" | number | true | false | null | "(" expr ")"
///
/// Unknown names evaluate to null, which is falsy.
class Condition {
public:
    /// Parse an expression; throws ConditionEvalError on bad syntax
    static Condition parse(const std::string& expr);

    bool evaluate(const VariableStore& vars) const;

    const std::string& source() const { return source_; }

    struct Node;

private:
    Condition() = default;

    std::string source_;
    std::shared_ptr<const Node> root_;
};

/// Parse and evaluate in one go; throws ConditionEvalError
bool evaluate_condition(const std::string& expr, const VariableStore& vars);
