#include <gtest/gtest.h>
#include <cellexpr/ast.hpp>
#include <cellexpr/error.hpp>
#include <cellexpr/parser.hpp>

#include <string>

namespace {

std::string sexpr(const std::string& text) {
    return cellexpr::to_string(*cellexpr::parse(text));
}

TEST(Parser, MultiplicationBindsTighterThanAddition) {
    EXPECT_EQ(sexpr("1+2*3"), "(+ 1 (* 2 3))");
    EXPECT_EQ(sexpr("(1+2)*3"), "(* (+ 1 2) 3)");
}

TEST(Parser, PowerIsRightAssociative) {
    EXPECT_EQ(sexpr("2^3^2"), "(^ 2 (^ 3 2))");
}

TEST(Parser, SubtractionIsLeftAssociative) {
    EXPECT_EQ(sexpr("10 - 4 - 3"), "(- (- 10 4) 3)");
}

TEST(Parser, ConcatenationSharesAdditivePrecedence) {
    EXPECT_EQ(sexpr("\"a\"&1+2"), "(+ (& \"a\" 1) 2)");
}

TEST(Parser, ComparatorsChainLeftToRight) {
    EXPECT_EQ(sexpr("{{a}}={{b}}={{c}}"), "(= (= {{a}} {{b}}) {{c}})");
    EXPECT_EQ(sexpr("1+1>=2"), "(>= (+ 1 1) 2)");
}

TEST(Parser, UnaryBindsAtPowerLevel) {
    EXPECT_EQ(sexpr("-{{x}}^2"), "(- (^ {{x}} 2))");
    EXPECT_EQ(sexpr("+{{x}}*2"), "(* (+ {{x}}) 2)");
}

TEST(Parser, CallNamesAreUpperCased) {
    EXPECT_EQ(sexpr("sum(1; {{a}}, if(TRUE;\"y\";NULL))"), "(SUM 1 {{a}} (IF TRUE \"y\" NULL))");
    EXPECT_EQ(sexpr("now()"), "(NOW)");
}

TEST(Parser, BareIdentifierIsRejected) {
    try {
        cellexpr::parse("price * 2");
        FAIL() << "expected a syntax error";
    } catch (const cellexpr::FormulaError& e) {
        EXPECT_EQ(e.kind(), cellexpr::FormulaError::Kind::Syntax);
        EXPECT_NE(std::string(e.what()).find("{{name}}"), std::string::npos) << e.what();
    }
}

TEST(Parser, MalformedInputThrows) {
    EXPECT_THROW(cellexpr::parse("1 2"), cellexpr::FormulaError);
    EXPECT_THROW(cellexpr::parse("(1+2"), cellexpr::FormulaError);
    EXPECT_THROW(cellexpr::parse("SUM(1;2"), cellexpr::FormulaError);
    EXPECT_THROW(cellexpr::parse("SUM(1 2)"), cellexpr::FormulaError);
    EXPECT_THROW(cellexpr::parse("1+"), cellexpr::FormulaError);
    EXPECT_THROW(cellexpr::parse(")"), cellexpr::FormulaError);
}

TEST(Parser, NestingDepthIsBounded) {
    const std::string deep = std::string(50, '(') + "1" + std::string(50, ')');
    EXPECT_EQ(sexpr(deep), "1");
    EXPECT_THROW(cellexpr::parse(deep, 20), cellexpr::FormulaError);
}

TEST(Parser, OperatorChainsCountTowardsDepth) {
    EXPECT_NO_THROW(cellexpr::parse("1+1+1+1", 4));
    EXPECT_THROW(cellexpr::parse("1+1+1+1+1", 4), cellexpr::FormulaError);
    EXPECT_THROW(cellexpr::parse("1&1&1&1&1", 4), cellexpr::FormulaError);
    EXPECT_THROW(cellexpr::parse("1=1=1=1=1", 4), cellexpr::FormulaError);
    EXPECT_THROW(cellexpr::parse("SUM(1+1+1+1)", 4), cellexpr::FormulaError);

    std::string chain = "1";
    for (int i = 0; i < 100000; ++i) chain += "+1";
    try {
        cellexpr::parse(chain);
        FAIL() << "expected an error";
    } catch (const cellexpr::FormulaError& e) {
        EXPECT_EQ(e.kind(), cellexpr::FormulaError::Kind::Syntax);
        EXPECT_STREQ(e.what(), "expression nesting exceeds 256 levels");
    }
}

} // namespace
