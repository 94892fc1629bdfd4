#pragma once

#include "flowdebug/utils/types.hpp"
#include "flowdebug/utils/error.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace flowdebug {

enum class ComparisonOperator {
    EQUAL,
    NOT_EQUAL,
    GREATER,
    LESS,
    GREATER_EQUAL,
    LESS_EQUAL,
    IN,
    NOT_IN
};

enum class ArithmeticOperator {
    ADD,
    SUBTRACT,
    MULTIPLY,
    DIVIDE,
    MODULO
};

const char* to_string(ComparisonOperator op) noexcept;
Result<ComparisonOperator> comparison_operator_from_string(const std::string& text);

const char* to_string(ArithmeticOperator op) noexcept;

/**
 * @brief Dynamically typed variable value
 *
 * Holds the values a flow stores in its variables: None, booleans,
 * integers, floats, strings and lists of values. Comparison and
 * arithmetic follow the rules users of the flow editor expect from
 * script expressions: numbers compare across int/float/bool, strings
 * and lists compare lexicographically, mixed-type ordering is an error.
 */
class Value {
public:
    enum class Type {
        NONE,
        BOOL,
        INTEGER,
        FLOAT,
        STRING,
        LIST
    };

    using List = std::vector<Value>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool value) : data_(value) {}
    Value(double value) : data_(value) {}
    Value(const char* value) : data_(std::string(value)) {}
    Value(std::string value) : data_(std::move(value)) {}
    Value(List value) : data_(std::move(value)) {}

    template<typename T,
             std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Value(T value) : data_(static_cast<i64>(value)) {}

    Type type() const;
    const char* type_name() const;

    bool is_none() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_bool() const { return std::holds_alternative<bool>(data_); }
    bool is_integer() const { return std::holds_alternative<i64>(data_); }
    bool is_float() const { return std::holds_alternative<double>(data_); }
    bool is_string() const { return std::holds_alternative<std::string>(data_); }
    bool is_list() const { return std::holds_alternative<List>(data_); }

    // bool, integer and float all take part in numeric operations
    bool is_numeric() const { return is_bool() || is_integer() || is_float(); }

    bool as_bool() const { return std::get<bool>(data_); }
    i64 as_integer() const { return std::get<i64>(data_); }
    double as_float() const { return std::get<double>(data_); }
    const std::string& as_string() const { return std::get<std::string>(data_); }
    const List& as_list() const { return std::get<List>(data_); }

    // Numeric view of bool/integer/float values
    double to_number() const;

    // Display form: strings unquoted, list elements quoted
    std::string to_string() const;

    // Literal form: strings quoted
    std::string repr() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    bool is_integral() const { return is_bool() || is_integer(); }
    i64 to_integer() const;

    friend Result<Value> apply_arithmetic(ArithmeticOperator op, const Value& lhs, const Value& rhs);
    friend Result<Value> negate(const Value& operand);

    std::variant<std::monostate, bool, i64, double, std::string, List> data_;
};

Result<bool> compare_values(const Value& lhs, ComparisonOperator op, const Value& rhs);

// Ordering comparison: negative, zero or positive like strcmp
Result<int> order_values(const Value& lhs, const Value& rhs);

// Membership test of `item` inside `container` (list element or substring)
Result<bool> contains_value(const Value& container, const Value& item);

Result<Value> apply_arithmetic(ArithmeticOperator op, const Value& lhs, const Value& rhs);
Result<Value> negate(const Value& operand);

// nlohmann::json ADL hooks
void to_json(nlohmann::json& j, const Value& value);
void from_json(const nlohmann::json& j, Value& value);

}  // namespace flowdebug
