#include <gtest/gtest.h>
#include "flowdebug/core/variable_manager.hpp"
#include "flowdebug/debug/condition.hpp"
#include "flowdebug/debug/condition_evaluator.hpp"
#include <limits>
#include <string>

namespace flowdebug::test {

class ConditionTest : public ::testing::Test {
protected:
    void SetUp() override {
        env["counter"] = Value(7);
        env["ratio"] = Value(0.5);
        env["status"] = Value("ready");
        env["items"] = Value(Value::List{"a", "b"});
        env["flag"] = Value(true);
    }

    Result<bool> eval(const std::string& text) {
        auto condition = ConditionParser::parse(text);
        if (!condition) {
            return unexpected(condition.error());
        }
        return condition.value().evaluate(env);
    }

    bool holds(const std::string& text) {
        auto result = eval(text);
        EXPECT_TRUE(result.has_value()) << text << ": " << (result ? "" : result.error().message());
        return result.has_value() && result.value();
    }

    Environment env;
};

TEST_F(ConditionTest, SimpleComparisons) {
    EXPECT_TRUE(holds("counter > 5"));
    EXPECT_FALSE(holds("counter < 5"));
    EXPECT_TRUE(holds("counter == 7"));
    EXPECT_TRUE(holds("counter != 8"));
    EXPECT_TRUE(holds("counter >= 7.0"));
    EXPECT_TRUE(holds("status == 'ready'"));
    EXPECT_TRUE(holds("status == \"ready\""));
    EXPECT_TRUE(holds("flag == True"));
    EXPECT_TRUE(holds("ratio <= 0.5"));
}

TEST_F(ConditionTest, ArithmeticOperands) {
    EXPECT_TRUE(holds("counter * 2 == 14"));
    EXPECT_TRUE(holds("counter % 4 == 3"));
    EXPECT_TRUE(holds("(counter + 1) * 2 > 15"));
    EXPECT_TRUE(holds("-counter < 0"));
    EXPECT_TRUE(holds("counter / 2 == 3.5"));
    EXPECT_TRUE(holds("1e1 > counter"));
}

TEST_F(ConditionTest, LogicalOperators) {
    EXPECT_TRUE(holds("counter > 5 and status == 'ready'"));
    EXPECT_FALSE(holds("counter > 10 and status == 'ready'"));
    EXPECT_TRUE(holds("counter > 10 or status == 'ready'"));
    EXPECT_TRUE(holds("not counter > 10"));
    EXPECT_TRUE(holds("(counter > 10 or ratio < 1) and not (status == 'done')"));
}

TEST_F(ConditionTest, MembershipOperators) {
    EXPECT_TRUE(holds("'a' in items"));
    EXPECT_TRUE(holds("'z' not in items"));
    EXPECT_TRUE(holds("status in ['ready', 'done']"));
    EXPECT_TRUE(holds("'ead' in status"));
}

TEST_F(ConditionTest, ChainedComparisonBecomesConjunction) {
    auto condition = ConditionParser::parse("1 < counter <= 7");
    ASSERT_TRUE(condition.has_value());

    const auto* logical = std::get_if<Logical>(&condition.value().node());
    ASSERT_NE(logical, nullptr);
    EXPECT_EQ(logical->op, LogicalOperator::AND);
    EXPECT_EQ(logical->operands.size(), 2u);

    EXPECT_TRUE(holds("1 < counter <= 7"));
    EXPECT_FALSE(holds("1 < counter < 7"));
}

TEST_F(ConditionTest, ShortCircuitSkipsFailingOperands) {
    // The right-hand side would be an unknown variable
    EXPECT_FALSE(holds("counter > 10 and missing == 1"));
    EXPECT_TRUE(holds("counter > 5 or missing == 1"));
}

TEST_F(ConditionTest, EvaluationErrors) {
    auto unknown = eval("missing > 1");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code(), ErrorCode::VARIABLE_NOT_FOUND);

    auto mismatch = eval("status > 5");
    ASSERT_FALSE(mismatch.has_value());
    EXPECT_EQ(mismatch.error().code(), ErrorCode::TYPE_MISMATCH);

    auto division = eval("counter / 0 > 1");
    ASSERT_FALSE(division.has_value());
    EXPECT_EQ(division.error().code(), ErrorCode::DIVISION_BY_ZERO);
}

TEST_F(ConditionTest, IntegerEdgeCasesDoNotTrap) {
    env["big"] = Value(std::numeric_limits<i64>::max());
    env["low"] = Value(std::numeric_limits<i64>::min());

    EXPECT_TRUE(holds("low % -1 == 0"));

    auto sum = eval("big + 1 < 0");
    ASSERT_FALSE(sum.has_value());
    EXPECT_EQ(sum.error().code(), ErrorCode::ARITHMETIC_OVERFLOW);

    auto product = eval("big * 2 < 0");
    ASSERT_FALSE(product.has_value());
    EXPECT_EQ(product.error().code(), ErrorCode::ARITHMETIC_OVERFLOW);

    auto negated = eval("-low < 0");
    ASSERT_FALSE(negated.has_value());
    EXPECT_EQ(negated.error().code(), ErrorCode::ARITHMETIC_OVERFLOW);
}

TEST_F(ConditionTest, RejectedSyntax) {
    const char* rejected[] = {
        "counter",                 // bare truthiness
        "counter = 5",             // assignment
        "len(items) > 1",          // call
        "items[0] == 'a'",         // subscript
        "status.upper == 'X'",     // attribute
        "counter > ",              // incomplete
        "'unterminated == 1",
        "counter > 5 and",
        "!counter",
        "12abc > 1",
        "",
    };
    for (const char* text : rejected) {
        auto result = ConditionParser::parse(text);
        ASSERT_FALSE(result.has_value()) << "accepted: " << text;
        EXPECT_EQ(result.error().code(), ErrorCode::CONDITION_PARSE_ERROR) << text;
    }
}

TEST_F(ConditionTest, ComparedConditionIsRejected) {
    auto result = ConditionParser::parse("(counter == 7) == True");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::CONDITION_PARSE_ERROR);
    EXPECT_NE(result.error().message().find("parenthesised condition cannot be an operand at position 0"),
              std::string::npos) << result.error().message();

    // Parenthesised arithmetic is still an operand
    EXPECT_TRUE(holds("(counter - 2) == 5"));
}

TEST_F(ConditionTest, NestingDepthIsBounded) {
    std::string deep(200, '(');
    deep += "counter > 1";
    deep += std::string(200, ')');
    auto result = ConditionParser::parse(deep);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::CONDITION_PARSE_ERROR);
}

TEST_F(ConditionTest, ToStringIsReparseable) {
    auto condition = ConditionParser::parse("counter + 1 > 2 and status in ['x', 'ready']");
    ASSERT_TRUE(condition.has_value());

    auto text = condition.value().to_string();
    auto reparsed = ConditionParser::parse(text);
    ASSERT_TRUE(reparsed.has_value()) << text;
    EXPECT_EQ(reparsed.value().to_string(), text);
    EXPECT_TRUE(reparsed.value().evaluate(env).value());
}

TEST(ParseLiteralTest, RecoversTypedValues) {
    EXPECT_EQ(parse_literal("42"), Value(42));
    EXPECT_TRUE(parse_literal("42").is_integer());
    EXPECT_TRUE(parse_literal("2.5").is_float());
    EXPECT_EQ(parse_literal("-3"), Value(-3));
    EXPECT_EQ(parse_literal("True"), Value(true));
    EXPECT_TRUE(parse_literal("None").is_none());
    EXPECT_EQ(parse_literal("'quoted'"), Value("quoted"));
    EXPECT_EQ(parse_literal("[1, 'a']"), Value(Value::List{1, "a"}));
}

TEST(ParseLiteralTest, OtherTextStaysRaw) {
    EXPECT_EQ(parse_literal("done"), Value("done"));
    EXPECT_EQ(parse_literal("two words"), Value("two words"));
    EXPECT_EQ(parse_literal(""), Value(""));
}

TEST(ConditionEvaluatorTest, EvaluatesAgainstStore) {
    VariableManager variables;
    ASSERT_TRUE(variables.create_variable("x", Value(10)).has_value());
    ConditionEvaluator evaluator;

    EXPECT_TRUE(evaluator.evaluate_condition("x > 5", variables).value());

    ASSERT_TRUE(variables.set_variable("x", Value(1)).has_value());
    EXPECT_FALSE(evaluator.evaluate_condition("x > 5", variables).value());

    auto invalid = evaluator.evaluate_condition("x >", variables);
    ASSERT_FALSE(invalid.has_value());
    EXPECT_EQ(invalid.error().code(), ErrorCode::CONDITION_PARSE_ERROR);
}

TEST(ConditionEvaluatorTest, Validate) {
    EXPECT_TRUE(ConditionEvaluator::validate("a == 1 or b != 2").has_value());
    EXPECT_FALSE(ConditionEvaluator::validate("import os").has_value());
}

TEST(ConditionEvaluatorTest, VariableBreakpoints) {
    VariableManager variables;
    ASSERT_TRUE(variables.create_variable("status", Value("done")).has_value());
    ASSERT_TRUE(variables.create_variable("count", Value(3)).has_value());
    ConditionEvaluator evaluator;

    auto equal = Breakpoint::variable("status", ComparisonOperator::EQUAL, Value("done"));
    EXPECT_TRUE(evaluator.evaluate_variable(equal, variables).value());

    auto greater = Breakpoint::variable("count", ComparisonOperator::GREATER, Value(5));
    EXPECT_FALSE(evaluator.evaluate_variable(greater, variables).value());

    auto member = Breakpoint::variable("count", ComparisonOperator::IN, Value(Value::List{1, 2, 3}));
    EXPECT_TRUE(evaluator.evaluate_variable(member, variables).value());

    auto missing = Breakpoint::variable("ghost", ComparisonOperator::EQUAL, Value(1));
    auto result = evaluator.evaluate_variable(missing, variables);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::VARIABLE_NOT_FOUND);
}

}  // namespace flowdebug::test
