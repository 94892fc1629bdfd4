#include "flowdebug/core/value.hpp"
#include <nlohmann/json.hpp>
#include <charconv>
#include <cmath>
#include <limits>
#include <sstream>

namespace flowdebug {

namespace {

std::string format_float(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }

    char buffer[64];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc()) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }

    std::string text(buffer, end);
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    return text;
}

std::string quote(const std::string& text) {
    std::string quoted;
    quoted.reserve(text.size() + 2);
    quoted.push_back('\'');
    for (char c : text) {
        switch (c) {
            case '\\': quoted += "\\\\"; break;
            case '\'': quoted += "\\'"; break;
            case '\n': quoted += "\\n"; break;
            case '\t': quoted += "\\t"; break;
            default: quoted.push_back(c); break;
        }
    }
    quoted.push_back('\'');
    return quoted;
}

Error type_mismatch(const char* operation, const Value& lhs, const Value& rhs) {
    return Error(ErrorCode::TYPE_MISMATCH,
                 std::string("'") + operation + "' not supported between '" +
                 lhs.type_name() + "' and '" + rhs.type_name() + "'");
}

Error overflow(const char* operation) {
    return Error(ErrorCode::ARITHMETIC_OVERFLOW,
                 std::string("integer overflow in '") + operation + "'");
}

// Floored modulo: the result takes the sign of the divisor
i64 floor_mod(i64 lhs, i64 rhs) {
    // INT64_MIN % -1 traps on x86
    if (rhs == -1) {
        return 0;
    }
    i64 result = lhs % rhs;
    if (result != 0 && ((result < 0) != (rhs < 0))) {
        result += rhs;
    }
    return result;
}

double floor_mod(double lhs, double rhs) {
    double result = std::fmod(lhs, rhs);
    if (result != 0.0 && ((result < 0.0) != (rhs < 0.0))) {
        result += rhs;
    }
    return result;
}

}  // namespace

const char* to_string(ComparisonOperator op) noexcept {
    switch (op) {
        case ComparisonOperator::EQUAL: return "==";
        case ComparisonOperator::NOT_EQUAL: return "!=";
        case ComparisonOperator::GREATER: return ">";
        case ComparisonOperator::LESS: return "<";
        case ComparisonOperator::GREATER_EQUAL: return ">=";
        case ComparisonOperator::LESS_EQUAL: return "<=";
        case ComparisonOperator::IN: return "in";
        case ComparisonOperator::NOT_IN: return "not in";
    }
    return "==";
}

Result<ComparisonOperator> comparison_operator_from_string(const std::string& text) {
    if (text == "==") return ComparisonOperator::EQUAL;
    if (text == "!=") return ComparisonOperator::NOT_EQUAL;
    if (text == ">") return ComparisonOperator::GREATER;
    if (text == "<") return ComparisonOperator::LESS;
    if (text == ">=") return ComparisonOperator::GREATER_EQUAL;
    if (text == "<=") return ComparisonOperator::LESS_EQUAL;
    if (text == "in") return ComparisonOperator::IN;
    if (text == "not in") return ComparisonOperator::NOT_IN;
    return unexpected(MAKE_ERROR(INVALID_PARAMETER, "Unknown comparison operator: " + text));
}

const char* to_string(ArithmeticOperator op) noexcept {
    switch (op) {
        case ArithmeticOperator::ADD: return "+";
        case ArithmeticOperator::SUBTRACT: return "-";
        case ArithmeticOperator::MULTIPLY: return "*";
        case ArithmeticOperator::DIVIDE: return "/";
        case ArithmeticOperator::MODULO: return "%";
    }
    return "+";
}

Value::Type Value::type() const {
    switch (data_.index()) {
        case 1: return Type::BOOL;
        case 2: return Type::INTEGER;
        case 3: return Type::FLOAT;
        case 4: return Type::STRING;
        case 5: return Type::LIST;
        default: return Type::NONE;
    }
}

const char* Value::type_name() const {
    switch (type()) {
        case Type::NONE: return "none";
        case Type::BOOL: return "bool";
        case Type::INTEGER: return "int";
        case Type::FLOAT: return "float";
        case Type::STRING: return "str";
        case Type::LIST: return "list";
    }
    return "none";
}

double Value::to_number() const {
    if (is_bool()) return as_bool() ? 1.0 : 0.0;
    if (is_integer()) return static_cast<double>(as_integer());
    if (is_float()) return as_float();
    return 0.0;
}

i64 Value::to_integer() const {
    if (is_bool()) return as_bool() ? 1 : 0;
    if (is_integer()) return as_integer();
    return static_cast<i64>(to_number());
}

std::string Value::to_string() const {
    switch (type()) {
        case Type::NONE: return "None";
        case Type::BOOL: return as_bool() ? "True" : "False";
        case Type::INTEGER: return std::to_string(as_integer());
        case Type::FLOAT: return format_float(as_float());
        case Type::STRING: return as_string();
        case Type::LIST: {
            std::string text = "[";
            const auto& items = as_list();
            for (size_t i = 0; i < items.size(); ++i) {
                if (i > 0) {
                    text += ", ";
                }
                text += items[i].repr();
            }
            text += "]";
            return text;
        }
    }
    return "None";
}

std::string Value::repr() const {
    if (is_string()) {
        return quote(as_string());
    }
    return to_string();
}

bool Value::operator==(const Value& other) const {
    if (is_numeric() && other.is_numeric()) {
        if (is_integral() && other.is_integral()) {
            return to_integer() == other.to_integer();
        }
        return to_number() == other.to_number();
    }
    if (type() != other.type()) {
        return false;
    }
    switch (type()) {
        case Type::NONE: return true;
        case Type::STRING: return as_string() == other.as_string();
        case Type::LIST: {
            const auto& lhs = as_list();
            const auto& rhs = other.as_list();
            if (lhs.size() != rhs.size()) {
                return false;
            }
            for (size_t i = 0; i < lhs.size(); ++i) {
                if (lhs[i] != rhs[i]) {
                    return false;
                }
            }
            return true;
        }
        default: return false;
    }
}

Result<int> order_values(const Value& lhs, const Value& rhs) {
    if (lhs.is_numeric() && rhs.is_numeric()) {
        if (!lhs.is_float() && !rhs.is_float()) {
            i64 a = lhs.is_bool() ? (lhs.as_bool() ? 1 : 0) : lhs.as_integer();
            i64 b = rhs.is_bool() ? (rhs.as_bool() ? 1 : 0) : rhs.as_integer();
            return a < b ? -1 : (a > b ? 1 : 0);
        }
        double a = lhs.to_number();
        double b = rhs.to_number();
        if (std::isnan(a) || std::isnan(b)) {
            return unexpected(MAKE_ERROR(TYPE_MISMATCH, "NaN values are not ordered"));
        }
        return a < b ? -1 : (a > b ? 1 : 0);
    }
    if (lhs.is_string() && rhs.is_string()) {
        int cmp = lhs.as_string().compare(rhs.as_string());
        return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
    }
    if (lhs.is_list() && rhs.is_list()) {
        const auto& a = lhs.as_list();
        const auto& b = rhs.as_list();
        for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
            if (a[i] == b[i]) {
                continue;
            }
            return order_values(a[i], b[i]);
        }
        return a.size() < b.size() ? -1 : (a.size() > b.size() ? 1 : 0);
    }
    return unexpected(type_mismatch("<", lhs, rhs));
}

Result<bool> contains_value(const Value& container, const Value& item) {
    if (container.is_list()) {
        for (const auto& element : container.as_list()) {
            if (element == item) {
                return true;
            }
        }
        return false;
    }
    if (container.is_string()) {
        if (!item.is_string()) {
            return unexpected(MAKE_ERROR(TYPE_MISMATCH,
                std::string("'in <str>' requires str as left operand, not ") + item.type_name()));
        }
        return container.as_string().find(item.as_string()) != std::string::npos;
    }
    return unexpected(MAKE_ERROR(TYPE_MISMATCH,
        std::string("argument of type '") + container.type_name() + "' is not a container"));
}

Result<bool> compare_values(const Value& lhs, ComparisonOperator op, const Value& rhs) {
    switch (op) {
        case ComparisonOperator::EQUAL:
            return lhs == rhs;
        case ComparisonOperator::NOT_EQUAL:
            return lhs != rhs;
        case ComparisonOperator::IN:
            return contains_value(rhs, lhs);
        case ComparisonOperator::NOT_IN: {
            auto contained = contains_value(rhs, lhs);
            if (!contained) {
                return unexpected(contained.error());
            }
            return !contained.value();
        }
        default:
            break;
    }

    auto order = order_values(lhs, rhs);
    if (!order) {
        return unexpected(type_mismatch(to_string(op), lhs, rhs));
    }
    int cmp = order.value();

    switch (op) {
        case ComparisonOperator::GREATER: return cmp > 0;
        case ComparisonOperator::LESS: return cmp < 0;
        case ComparisonOperator::GREATER_EQUAL: return cmp >= 0;
        case ComparisonOperator::LESS_EQUAL: return cmp <= 0;
        default: return false;
    }
}

Result<Value> apply_arithmetic(ArithmeticOperator op, const Value& lhs, const Value& rhs) {
    if (op == ArithmeticOperator::ADD) {
        if (lhs.is_string() && rhs.is_string()) {
            return Value(lhs.as_string() + rhs.as_string());
        }
        if (lhs.is_list() && rhs.is_list()) {
            Value::List joined = lhs.as_list();
            joined.insert(joined.end(), rhs.as_list().begin(), rhs.as_list().end());
            return Value(std::move(joined));
        }
    }

    if (!lhs.is_numeric() || !rhs.is_numeric()) {
        return unexpected(type_mismatch(to_string(op), lhs, rhs));
    }

    const bool integral = lhs.is_integral() && rhs.is_integral();

    i64 integer_result = 0;
    switch (op) {
        case ArithmeticOperator::ADD:
            if (integral) {
                if (__builtin_add_overflow(lhs.to_integer(), rhs.to_integer(), &integer_result)) {
                    return unexpected(overflow("+"));
                }
                return Value(integer_result);
            }
            return Value(lhs.to_number() + rhs.to_number());
        case ArithmeticOperator::SUBTRACT:
            if (integral) {
                if (__builtin_sub_overflow(lhs.to_integer(), rhs.to_integer(), &integer_result)) {
                    return unexpected(overflow("-"));
                }
                return Value(integer_result);
            }
            return Value(lhs.to_number() - rhs.to_number());
        case ArithmeticOperator::MULTIPLY:
            if (integral) {
                if (__builtin_mul_overflow(lhs.to_integer(), rhs.to_integer(), &integer_result)) {
                    return unexpected(overflow("*"));
                }
                return Value(integer_result);
            }
            return Value(lhs.to_number() * rhs.to_number());
        case ArithmeticOperator::DIVIDE:
            if (rhs.to_number() == 0.0) {
                return unexpected(MAKE_ERROR(DIVISION_BY_ZERO, "division by zero"));
            }
            return Value(lhs.to_number() / rhs.to_number());
        case ArithmeticOperator::MODULO:
            if (rhs.to_number() == 0.0) {
                return unexpected(MAKE_ERROR(DIVISION_BY_ZERO, "modulo by zero"));
            }
            if (integral) return Value(floor_mod(lhs.to_integer(), rhs.to_integer()));
            return Value(floor_mod(lhs.to_number(), rhs.to_number()));
    }
    return unexpected(type_mismatch(to_string(op), lhs, rhs));
}

Result<Value> negate(const Value& operand) {
    if (operand.is_integral()) {
        i64 value = operand.to_integer();
        if (value == std::numeric_limits<i64>::min()) {
            return unexpected(overflow("unary -"));
        }
        return Value(-value);
    }
    if (operand.is_float()) {
        return Value(-operand.as_float());
    }
    return unexpected(MAKE_ERROR(TYPE_MISMATCH,
        std::string("bad operand type for unary -: '") + operand.type_name() + "'"));
}

void to_json(nlohmann::json& j, const Value& value) {
    switch (value.type()) {
        case Value::Type::NONE: j = nullptr; break;
        case Value::Type::BOOL: j = value.as_bool(); break;
        case Value::Type::INTEGER: j = value.as_integer(); break;
        case Value::Type::FLOAT: j = value.as_float(); break;
        case Value::Type::STRING: j = value.as_string(); break;
        case Value::Type::LIST: {
            j = nlohmann::json::array();
            for (const auto& item : value.as_list()) {
                nlohmann::json element;
                to_json(element, item);
                j.push_back(std::move(element));
            }
            break;
        }
    }
}

void from_json(const nlohmann::json& j, Value& value) {
    if (j.is_null()) {
        value = Value();
    } else if (j.is_boolean()) {
        value = Value(j.get<bool>());
    } else if (j.is_number_unsigned() && j.get<u64>() > static_cast<u64>(std::numeric_limits<i64>::max())) {
        value = Value(j.get<double>());
    } else if (j.is_number_integer()) {
        value = Value(j.get<i64>());
    } else if (j.is_number_float()) {
        value = Value(j.get<double>());
    } else if (j.is_string()) {
        value = Value(j.get<std::string>());
    } else if (j.is_array()) {
        Value::List items;
        items.reserve(j.size());
        for (const auto& element : j) {
            Value item;
            from_json(element, item);
            items.push_back(std::move(item));
        }
        value = Value(std::move(items));
    } else {
        // Objects have no counterpart; keep their serialized text
        value = Value(j.dump());
    }
}

}  // namespace flowdebug
