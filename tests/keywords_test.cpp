#include <gtest/gtest.h>
#include "lexer/keywords.h"

TEST(KeywordsTest, KnownKeywords) {
    EXPECT_EQ(lookupIdentifier("abs"), TokenType::ABS);
    EXPECT_EQ(lookupIdentifier("cos"), TokenType::COS);
    EXPECT_EQ(lookupIdentifier("dup"), TokenType::DUP);
    EXPECT_EQ(lookupIdentifier("e"), TokenType::E);
    EXPECT_EQ(lookupIdentifier("factorial"), TokenType::FACTORIAL);
    EXPECT_EQ(lookupIdentifier("pi"), TokenType::PI);
    EXPECT_EQ(lookupIdentifier("sin"), TokenType::SIN);
    EXPECT_EQ(lookupIdentifier("sqrt"), TokenType::SQRT);
    EXPECT_EQ(lookupIdentifier("swap"), TokenType::SWAP);
    EXPECT_EQ(lookupIdentifier("tan"), TokenType::TAN);
}

TEST(KeywordsTest, UnknownIdentifiers) {
    EXPECT_FALSE(lookupIdentifier("").has_value());
    EXPECT_FALSE(lookupIdentifier("$").has_value());
    EXPECT_FALSE(lookupIdentifier("Sin").has_value());
    EXPECT_FALSE(lookupIdentifier("sine").has_value());
    EXPECT_FALSE(lookupIdentifier("+").has_value());
}

TEST(KeywordsTest, TokenTypeNames) {
    EXPECT_STREQ(tokenTypeToString(TokenType::NUMBER), "NUMBER");
    EXPECT_STREQ(tokenTypeToString(TokenType::SWAP), "SWAP");
    EXPECT_STREQ(tokenTypeToString(TokenType::END_OF_FILE), "END_OF_FILE");
    EXPECT_STREQ(tokenTypeToString(TokenType::ERROR), "ERROR");
}
