#include "flowdebug/debug/condition.hpp"
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <optional>

namespace flowdebug {

namespace {

enum class TokenKind {
    INTEGER,
    FLOAT,
    STRING,
    IDENTIFIER,
    KEYWORD,
    OPERATOR,
    LPAREN,
    RPAREN,
    LBRACKET,
    RBRACKET,
    COMMA,
    END
};

struct Token {
    TokenKind kind = TokenKind::END;
    std::string text;
    Value value;
    size_t position = 0;
};

bool is_keyword(const std::string& word) {
    return word == "and" || word == "or" || word == "not" || word == "in" ||
           word == "True" || word == "False" || word == "None" ||
           word == "true" || word == "false" || word == "null";
}

Error parse_error(const std::string& message, size_t position) {
    return Error(ErrorCode::CONDITION_PARSE_ERROR,
                 message + " at position " + std::to_string(position));
}

class Lexer {
public:
    explicit Lexer(const std::string& text) : text_(text) {}

    Result<std::vector<Token>> tokenize() {
        std::vector<Token> tokens;
        while (true) {
            skip_whitespace();
            if (pos_ >= text_.size()) {
                tokens.push_back(Token{TokenKind::END, "", Value(), pos_});
                return tokens;
            }

            char c = text_[pos_];
            size_t start = pos_;

            if (std::isdigit(static_cast<unsigned char>(c)) ||
                (c == '.' && pos_ + 1 < text_.size() &&
                 std::isdigit(static_cast<unsigned char>(text_[pos_ + 1])))) {
                auto number = read_number();
                if (!number) {
                    return unexpected(number.error());
                }
                tokens.push_back(std::move(number.value()));
            } else if (c == '\'' || c == '"') {
                auto str = read_string();
                if (!str) {
                    return unexpected(str.error());
                }
                tokens.push_back(std::move(str.value()));
            } else if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
                while (pos_ < text_.size() &&
                       (std::isalnum(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '_')) {
                    ++pos_;
                }
                std::string word = text_.substr(start, pos_ - start);
                TokenKind kind = is_keyword(word) ? TokenKind::KEYWORD : TokenKind::IDENTIFIER;
                tokens.push_back(Token{kind, word, Value(), start});
            } else if (c == '(') {
                tokens.push_back(single(TokenKind::LPAREN));
            } else if (c == ')') {
                tokens.push_back(single(TokenKind::RPAREN));
            } else if (c == '[') {
                tokens.push_back(single(TokenKind::LBRACKET));
            } else if (c == ']') {
                tokens.push_back(single(TokenKind::RBRACKET));
            } else if (c == ',') {
                tokens.push_back(single(TokenKind::COMMA));
            } else if (c == '=' || c == '!' || c == '<' || c == '>') {
                bool followed_by_equal = pos_ + 1 < text_.size() && text_[pos_ + 1] == '=';
                if (followed_by_equal) {
                    pos_ += 2;
                    tokens.push_back(Token{TokenKind::OPERATOR, text_.substr(start, 2), Value(), start});
                } else if (c == '<' || c == '>') {
                    tokens.push_back(single(TokenKind::OPERATOR));
                } else {
                    return unexpected(parse_error(std::string("unsupported operator '") + c + "'", start));
                }
            } else if (c == '+' || c == '-' || c == '*' || c == '/' || c == '%') {
                tokens.push_back(single(TokenKind::OPERATOR));
            } else {
                return unexpected(parse_error(std::string("unexpected character '") + c + "'", start));
            }
        }
    }

private:
    void skip_whitespace() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    Token single(TokenKind kind) {
        Token token{kind, std::string(1, text_[pos_]), Value(), pos_};
        ++pos_;
        return token;
    }

    Result<Token> read_number() {
        size_t start = pos_;
        bool is_float = false;

        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
        if (pos_ < text_.size() && text_[pos_] == '.') {
            is_float = true;
            ++pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                ++pos_;
            }
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            size_t exponent = pos_ + 1;
            if (exponent < text_.size() && (text_[exponent] == '+' || text_[exponent] == '-')) {
                ++exponent;
            }
            if (exponent < text_.size() && std::isdigit(static_cast<unsigned char>(text_[exponent]))) {
                is_float = true;
                pos_ = exponent;
                while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
                    ++pos_;
                }
            }
        }
        if (pos_ < text_.size() &&
            (std::isalpha(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '_')) {
            return unexpected(parse_error("invalid numeric literal", start));
        }

        std::string literal = text_.substr(start, pos_ - start);
        if (is_float) {
            char* end = nullptr;
            double value = std::strtod(literal.c_str(), &end);
            if (end != literal.c_str() + literal.size()) {
                return unexpected(parse_error("invalid numeric literal '" + literal + "'", start));
            }
            return Token{TokenKind::FLOAT, literal, Value(value), start};
        }

        i64 value = 0;
        auto [ptr, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), value);
        if (ec != std::errc() || ptr != literal.data() + literal.size()) {
            return unexpected(parse_error("integer literal out of range '" + literal + "'", start));
        }
        return Token{TokenKind::INTEGER, literal, Value(value), start};
    }

    Result<Token> read_string() {
        size_t start = pos_;
        char quote = text_[pos_++];
        std::string decoded;

        while (pos_ < text_.size() && text_[pos_] != quote) {
            char c = text_[pos_++];
            if (c == '\\' && pos_ < text_.size()) {
                char escaped = text_[pos_++];
                switch (escaped) {
                    case 'n': decoded.push_back('\n'); break;
                    case 't': decoded.push_back('\t'); break;
                    case 'r': decoded.push_back('\r'); break;
                    case '\\': decoded.push_back('\\'); break;
                    case '\'': decoded.push_back('\''); break;
                    case '"': decoded.push_back('"'); break;
                    default:
                        decoded.push_back('\\');
                        decoded.push_back(escaped);
                        break;
                }
            } else {
                decoded.push_back(c);
            }
        }

        if (pos_ >= text_.size()) {
            return unexpected(parse_error("unterminated string literal", start));
        }
        ++pos_;  // closing quote
        return Token{TokenKind::STRING, text_.substr(start, pos_ - start), Value(decoded), start};
    }

    const std::string& text_;
    size_t pos_ = 0;
};

std::optional<ArithmeticOperator> additive_operator(const Token& token) {
    if (token.kind != TokenKind::OPERATOR) return std::nullopt;
    if (token.text == "+") return ArithmeticOperator::ADD;
    if (token.text == "-") return ArithmeticOperator::SUBTRACT;
    return std::nullopt;
}

std::optional<ArithmeticOperator> multiplicative_operator(const Token& token) {
    if (token.kind != TokenKind::OPERATOR) return std::nullopt;
    if (token.text == "*") return ArithmeticOperator::MULTIPLY;
    if (token.text == "/") return ArithmeticOperator::DIVIDE;
    if (token.text == "%") return ArithmeticOperator::MODULO;
    return std::nullopt;
}

class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    Result<Condition> parse_condition_text() {
        auto condition = parse_or(0);
        if (!condition) {
            return condition;
        }
        if (!at_end()) {
            return unexpected(parse_error("unexpected '" + current().text + "'", current().position));
        }
        return condition;
    }

    Result<Expression> parse_expression_text() {
        auto expression = parse_sum(0);
        if (!expression) {
            return expression;
        }
        if (!at_end()) {
            return unexpected(parse_error("unexpected '" + current().text + "'", current().position));
        }
        return expression;
    }

private:
    const Token& current() const { return tokens_[pos_]; }
    bool at_end() const { return current().kind == TokenKind::END; }

    bool is_keyword(const char* word) const {
        return current().kind == TokenKind::KEYWORD && current().text == word;
    }

    bool next_is_keyword(const char* word) const {
        return pos_ + 1 < tokens_.size() &&
               tokens_[pos_ + 1].kind == TokenKind::KEYWORD && tokens_[pos_ + 1].text == word;
    }

    Error too_deep() const {
        return parse_error("expression nested too deeply", current().position);
    }

    // Consumes a comparison operator if one is next
    std::optional<ComparisonOperator> take_comparison_operator() {
        const Token& token = current();
        if (token.kind == TokenKind::OPERATOR) {
            auto op = comparison_operator_from_string(token.text);
            if (op) {
                ++pos_;
                return op.value();
            }
            return std::nullopt;
        }
        if (is_keyword("in")) {
            ++pos_;
            return ComparisonOperator::IN;
        }
        if (is_keyword("not") && next_is_keyword("in")) {
            pos_ += 2;
            return ComparisonOperator::NOT_IN;
        }
        return std::nullopt;
    }

    bool continues_expression() const {
        const Token& token = current();
        if (token.kind == TokenKind::OPERATOR) {
            return true;
        }
        return is_keyword("in") || (is_keyword("not") && next_is_keyword("in"));
    }

    Result<Condition> parse_or(int depth) {
        if (depth > ConditionParser::kMaxDepth) {
            return unexpected(too_deep());
        }
        auto first = parse_and(depth + 1);
        if (!first) {
            return first;
        }
        if (!is_keyword("or")) {
            return first;
        }

        Logical logical{LogicalOperator::OR, {}};
        logical.operands.push_back(std::move(first.value()));
        while (is_keyword("or")) {
            ++pos_;
            auto next = parse_and(depth + 1);
            if (!next) {
                return next;
            }
            logical.operands.push_back(std::move(next.value()));
        }
        return Condition(std::move(logical));
    }

    Result<Condition> parse_and(int depth) {
        auto first = parse_not(depth + 1);
        if (!first) {
            return first;
        }
        if (!is_keyword("and")) {
            return first;
        }

        Logical logical{LogicalOperator::AND, {}};
        logical.operands.push_back(std::move(first.value()));
        while (is_keyword("and")) {
            ++pos_;
            auto next = parse_not(depth + 1);
            if (!next) {
                return next;
            }
            logical.operands.push_back(std::move(next.value()));
        }
        return Condition(std::move(logical));
    }

    Result<Condition> parse_not(int depth) {
        if (depth > ConditionParser::kMaxDepth) {
            return unexpected(too_deep());
        }
        if (is_keyword("not")) {
            ++pos_;
            auto operand = parse_not(depth + 1);
            if (!operand) {
                return operand;
            }
            Logical logical{LogicalOperator::NOT, {}};
            logical.operands.push_back(std::move(operand.value()));
            return Condition(std::move(logical));
        }
        return parse_comparison(depth + 1);
    }

    Result<Condition> parse_comparison(int depth) {
        // A parenthesised condition, unless the group turns out to be an arithmetic operand
        bool operand_is_condition = false;
        size_t group_position = current().position;
        if (current().kind == TokenKind::LPAREN) {
            size_t saved = pos_;
            ++pos_;
            auto grouped = parse_or(depth + 1);
            if (grouped && current().kind == TokenKind::RPAREN) {
                ++pos_;
                if (!continues_expression()) {
                    return grouped;
                }
                operand_is_condition = true;
            }
            pos_ = saved;
        }

        auto lhs = parse_sum(depth + 1);
        if (!lhs) {
            // Conditions have no value, so "(a == 1) == True" cannot be expressed
            if (operand_is_condition) {
                return unexpected(parse_error("a parenthesised condition cannot be an operand", group_position));
            }
            return unexpected(lhs.error());
        }

        std::vector<Comparison> comparisons;
        Expression left = std::move(lhs.value());
        while (auto op = take_comparison_operator()) {
            auto rhs = parse_sum(depth + 1);
            if (!rhs) {
                return unexpected(rhs.error());
            }
            Expression right = rhs.value();
            comparisons.push_back(Comparison{left, *op, right});
            left = std::move(right);
        }

        if (comparisons.empty()) {
            return unexpected(parse_error("expected a comparison operator", current().position));
        }
        if (comparisons.size() == 1) {
            return Condition(std::move(comparisons.front()));
        }

        // a < b < c  ->  (a < b) and (b < c)
        Logical chained{LogicalOperator::AND, {}};
        for (auto& comparison : comparisons) {
            chained.operands.emplace_back(std::move(comparison));
        }
        return Condition(std::move(chained));
    }

    Result<Expression> parse_sum(int depth) {
        if (depth > ConditionParser::kMaxDepth) {
            return unexpected(too_deep());
        }
        auto lhs = parse_term(depth + 1);
        if (!lhs) {
            return lhs;
        }
        Expression result = std::move(lhs.value());
        while (auto op = additive_operator(current())) {
            ++pos_;
            auto rhs = parse_term(depth + 1);
            if (!rhs) {
                return rhs;
            }
            result = Expression(Expression::Binary{
                *op,
                std::make_shared<const Expression>(std::move(result)),
                std::make_shared<const Expression>(std::move(rhs.value()))});
        }
        return result;
    }

    Result<Expression> parse_term(int depth) {
        auto lhs = parse_unary(depth + 1);
        if (!lhs) {
            return lhs;
        }
        Expression result = std::move(lhs.value());
        while (auto op = multiplicative_operator(current())) {
            ++pos_;
            auto rhs = parse_unary(depth + 1);
            if (!rhs) {
                return rhs;
            }
            result = Expression(Expression::Binary{
                *op,
                std::make_shared<const Expression>(std::move(result)),
                std::make_shared<const Expression>(std::move(rhs.value()))});
        }
        return result;
    }

    Result<Expression> parse_unary(int depth) {
        if (depth > ConditionParser::kMaxDepth) {
            return unexpected(too_deep());
        }
        const Token& token = current();
        if (token.kind == TokenKind::OPERATOR && (token.text == "-" || token.text == "+")) {
            bool negate = token.text == "-";
            ++pos_;
            auto operand = parse_unary(depth + 1);
            if (!operand) {
                return operand;
            }
            return Expression(Expression::Unary{
                negate, std::make_shared<const Expression>(std::move(operand.value()))});
        }
        return parse_primary(depth + 1);
    }

    Result<Expression> parse_primary(int depth) {
        const Token& token = current();
        switch (token.kind) {
            case TokenKind::INTEGER:
            case TokenKind::FLOAT:
            case TokenKind::STRING:
                ++pos_;
                return Expression(Expression::Literal{token.value});

            case TokenKind::KEYWORD:
                if (token.text == "True" || token.text == "true") {
                    ++pos_;
                    return Expression(Expression::Literal{Value(true)});
                }
                if (token.text == "False" || token.text == "false") {
                    ++pos_;
                    return Expression(Expression::Literal{Value(false)});
                }
                if (token.text == "None" || token.text == "null") {
                    ++pos_;
                    return Expression(Expression::Literal{Value()});
                }
                return unexpected(parse_error("unexpected keyword '" + token.text + "'", token.position));

            case TokenKind::IDENTIFIER: {
                ++pos_;
                if (current().kind == TokenKind::LPAREN) {
                    return unexpected(parse_error("function calls are not allowed", current().position));
                }
                if (current().kind == TokenKind::LBRACKET) {
                    return unexpected(parse_error("subscripts are not allowed", current().position));
                }
                return Expression(Expression::VariableRef{token.text});
            }

            case TokenKind::LPAREN: {
                ++pos_;
                auto inner = parse_sum(depth + 1);
                if (!inner) {
                    return inner;
                }
                if (current().kind != TokenKind::RPAREN) {
                    return unexpected(parse_error("expected ')'", current().position));
                }
                ++pos_;
                return inner;
            }

            case TokenKind::LBRACKET: {
                ++pos_;
                Expression::ListLiteral list;
                while (current().kind != TokenKind::RBRACKET) {
                    auto item = parse_sum(depth + 1);
                    if (!item) {
                        return item;
                    }
                    list.items.push_back(std::make_shared<const Expression>(std::move(item.value())));
                    if (current().kind == TokenKind::COMMA) {
                        ++pos_;
                    } else if (current().kind != TokenKind::RBRACKET) {
                        return unexpected(parse_error("expected ',' or ']'", current().position));
                    }
                }
                ++pos_;
                return Expression(std::move(list));
            }

            case TokenKind::END:
                return unexpected(parse_error("unexpected end of expression", token.position));

            default:
                return unexpected(parse_error("unexpected '" + token.text + "'", token.position));
        }
    }

    std::vector<Token> tokens_;
    size_t pos_ = 0;
};

const char* logical_keyword(LogicalOperator op) {
    switch (op) {
        case LogicalOperator::AND: return "and";
        case LogicalOperator::OR: return "or";
        case LogicalOperator::NOT: return "not";
    }
    return "and";
}

}  // namespace

Result<Value> Expression::evaluate(const Environment& env) const {
    return std::visit([&env](const auto& node) -> Result<Value> {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, Literal>) {
            return node.value;
        } else if constexpr (std::is_same_v<T, VariableRef>) {
            auto it = env.find(node.name);
            if (it == env.end()) {
                return unexpected(MAKE_ERROR(VARIABLE_NOT_FOUND, "name '" + node.name + "' is not defined"));
            }
            return it->second;
        } else if constexpr (std::is_same_v<T, ListLiteral>) {
            Value::List items;
            items.reserve(node.items.size());
            for (const auto& item : node.items) {
                auto value = item->evaluate(env);
                if (!value) {
                    return value;
                }
                items.push_back(std::move(value.value()));
            }
            return Value(std::move(items));
        } else if constexpr (std::is_same_v<T, Unary>) {
            auto operand = node.operand->evaluate(env);
            if (!operand) {
                return operand;
            }
            if (node.negate) {
                return negate(operand.value());
            }
            if (!operand.value().is_numeric()) {
                return unexpected(MAKE_ERROR(TYPE_MISMATCH,
                    std::string("bad operand type for unary +: '") + operand.value().type_name() + "'"));
            }
            return operand;
        } else {
            auto lhs = node.lhs->evaluate(env);
            if (!lhs) {
                return lhs;
            }
            auto rhs = node.rhs->evaluate(env);
            if (!rhs) {
                return rhs;
            }
            return apply_arithmetic(node.op, lhs.value(), rhs.value());
        }
    }, node_);
}

bool Expression::is_constant() const {
    return std::visit([](const auto& node) -> bool {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, Literal>) {
            return true;
        } else if constexpr (std::is_same_v<T, VariableRef>) {
            return false;
        } else if constexpr (std::is_same_v<T, ListLiteral>) {
            for (const auto& item : node.items) {
                if (!item->is_constant()) {
                    return false;
                }
            }
            return true;
        } else if constexpr (std::is_same_v<T, Unary>) {
            return node.operand->is_constant();
        } else {
            return node.lhs->is_constant() && node.rhs->is_constant();
        }
    }, node_);
}

std::string Expression::to_string() const {
    return std::visit([](const auto& node) -> std::string {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, Literal>) {
            return node.value.repr();
        } else if constexpr (std::is_same_v<T, VariableRef>) {
            return node.name;
        } else if constexpr (std::is_same_v<T, ListLiteral>) {
            std::string text = "[";
            for (size_t i = 0; i < node.items.size(); ++i) {
                if (i > 0) {
                    text += ", ";
                }
                text += node.items[i]->to_string();
            }
            return text + "]";
        } else if constexpr (std::is_same_v<T, Unary>) {
            return (node.negate ? "-" : "+") + node.operand->to_string();
        } else {
            return "(" + node.lhs->to_string() + " " + flowdebug::to_string(node.op) + " " +
                   node.rhs->to_string() + ")";
        }
    }, node_);
}

Result<bool> Condition::evaluate(const Environment& env) const {
    if (const auto* comparison = std::get_if<Comparison>(&node_)) {
        auto lhs = comparison->lhs.evaluate(env);
        if (!lhs) {
            return unexpected(lhs.error());
        }
        auto rhs = comparison->rhs.evaluate(env);
        if (!rhs) {
            return unexpected(rhs.error());
        }
        return compare_values(lhs.value(), comparison->op, rhs.value());
    }

    const auto& logical = std::get<Logical>(node_);
    switch (logical.op) {
        case LogicalOperator::NOT: {
            if (logical.operands.size() != 1) {
                return unexpected(MAKE_ERROR(CONDITION_EVALUATION_ERROR, "'not' takes exactly one operand"));
            }
            auto operand = logical.operands.front().evaluate(env);
            if (!operand) {
                return operand;
            }
            return !operand.value();
        }
        case LogicalOperator::AND:
            for (const auto& operand : logical.operands) {
                auto result = operand.evaluate(env);
                if (!result || !result.value()) {
                    return result;
                }
            }
            return true;
        case LogicalOperator::OR:
            for (const auto& operand : logical.operands) {
                auto result = operand.evaluate(env);
                if (!result || result.value()) {
                    return result;
                }
            }
            return false;
    }
    return unexpected(MAKE_ERROR(CONDITION_EVALUATION_ERROR, "unknown logical operator"));
}

std::string Condition::to_string() const {
    if (const auto* comparison = std::get_if<Comparison>(&node_)) {
        return comparison->lhs.to_string() + " " + flowdebug::to_string(comparison->op) + " " +
               comparison->rhs.to_string();
    }

    const auto& logical = std::get<Logical>(node_);
    if (logical.op == LogicalOperator::NOT) {
        return "not (" + (logical.operands.empty() ? std::string() : logical.operands.front().to_string()) + ")";
    }

    std::string text;
    for (size_t i = 0; i < logical.operands.size(); ++i) {
        if (i > 0) {
            text += std::string(" ") + logical_keyword(logical.op) + " ";
        }
        text += "(" + logical.operands[i].to_string() + ")";
    }
    return text;
}

Result<Condition> ConditionParser::parse(const std::string& text) {
    auto tokens = Lexer(text).tokenize();
    if (!tokens) {
        return unexpected(tokens.error());
    }
    return Parser(std::move(tokens.value())).parse_condition_text();
}

Result<Expression> ConditionParser::parse_expression(const std::string& text) {
    auto tokens = Lexer(text).tokenize();
    if (!tokens) {
        return unexpected(tokens.error());
    }
    return Parser(std::move(tokens.value())).parse_expression_text();
}

Value parse_literal(const std::string& text) {
    auto expression = ConditionParser::parse_expression(text);
    if (!expression || !expression.value().is_constant()) {
        return Value(text);
    }
    auto value = expression.value().evaluate(Environment{});
    if (!value) {
        return Value(text);
    }
    return value.value();
}

}  // namespace flowdebug
