/**
 * @file token.h
 * @brief Token definitions and utilities for lexical analysis.
 */

#ifndef TOKEN_H
#define TOKEN_H

#include <cstddef>
#include <ostream>
#include <string>
#include <utility>

/**
 * @enum TokenType
 * @brief Enumeration of token types produced by the lexer.
 */
enum class TokenType {
    // Literals
    NUMBER,

    // Single-character operators
    PLUS,       // +
    MINUS,      // -
    ASTERISK,   // *
    SLASH,      // /
    MOD,        // %
    POWER,      // ^
    FACTORIAL,  // !

    // Keywords
    ABS,
    COS,
    SIN,
    SQRT,
    TAN,
    DUP,
    SWAP,
    E,
    PI,

    // Special tokens
    END_OF_FILE,
    ERROR
};

/**
 * @brief Returns a string representation of a token type.
 * @param type TokenType enum.
 * @return Constant string describing the token type.
 */
const char *tokenTypeToString(TokenType type);

/**
 * @class Token
 * @brief A lexical token: its kind, the text it was read from and where.
 *
 * For TokenType::ERROR the literal holds a description of what was found.
 */
class Token {
public:
    TokenType type;
    std::string literal;
    size_t column;   ///< 1-based column of the first character, 0 if synthetic.

    explicit Token(TokenType type, std::string literal = "", size_t column = 0)
            : type(type), literal(std::move(literal)), column(column) {}

    bool operator==(const Token &other) const {
        return type == other.type && literal == other.literal;
    }

    bool operator!=(const Token &other) const { return !(*this == other); }

    friend std::ostream &operator<<(std::ostream &os, const Token &token) {
        os << "Token(" << tokenTypeToString(token.type) << ", \"" << token.literal << "\"";
        if (token.column) os << ", column " << token.column;
        return os << ")";
    }
};

#endif // TOKEN_H
