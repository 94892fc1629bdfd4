#pragma once

#include "flowdebug/core/value.hpp"
#include "flowdebug/utils/error.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace flowdebug {

// Variable name -> current value, captured once per evaluation
using Environment = std::unordered_map<std::string, Value>;

/**
 * @brief Arithmetic operand of a comparison
 *
 * Literals, variable references, list literals, unary sign and the
 * binary operators + - * / %. Nothing else can be expressed: there are
 * no calls, attribute lookups or subscripts.
 */
class Expression {
public:
    using Ptr = std::shared_ptr<const Expression>;

    struct Literal {
        Value value;
    };

    struct VariableRef {
        std::string name;
    };

    struct ListLiteral {
        std::vector<Ptr> items;
    };

    struct Unary {
        bool negate = true;  // false for unary plus
        Ptr operand;
    };

    struct Binary {
        ArithmeticOperator op = ArithmeticOperator::ADD;
        Ptr lhs;
        Ptr rhs;
    };

    using Node = std::variant<Literal, VariableRef, ListLiteral, Unary, Binary>;

    explicit Expression(Node node) : node_(std::move(node)) {}

    Result<Value> evaluate(const Environment& env) const;

    // True when no variable is referenced anywhere below this node
    bool is_constant() const;

    std::string to_string() const;

    const Node& node() const { return node_; }

private:
    Node node_;
};

class Condition;

enum class LogicalOperator {
    AND,
    OR,
    NOT
};

struct Comparison {
    Expression lhs;
    ComparisonOperator op;
    Expression rhs;
};

struct Logical {
    LogicalOperator op;
    std::vector<Condition> operands;  // exactly one for NOT
};

/**
 * @brief Breakpoint condition: a comparison or a logical combination
 *
 * Evaluation never throws. A reference to an unknown variable, a type
 * mismatch or a division by zero yields an error result, which callers
 * treat as "condition not met".
 */
class Condition {
public:
    using Node = std::variant<Comparison, Logical>;

    explicit Condition(Comparison comparison) : node_(std::move(comparison)) {}
    explicit Condition(Logical logical) : node_(std::move(logical)) {}

    Result<bool> evaluate(const Environment& env) const;

    std::string to_string() const;

    const Node& node() const { return node_; }

private:
    Node node_;
};

class ConditionParser {
public:
    // Upper bound on nesting depth of parentheses, lists and operators
    static constexpr int kMaxDepth = 64;

    static Result<Condition> parse(const std::string& text);
    static Result<Expression> parse_expression(const std::string& text);
};

/**
 * @brief Recover a typed value from its stringified form
 *
 * Numbers, True/False/None, quoted strings and list literals come back
 * typed; any other text is returned unchanged as a string.
 */
Value parse_literal(const std::string& text);

}  // namespace flowdebug
