#ifndef LEXER_H
#define LEXER_H

#include <ostream>
#include <string>
#include <vector>
#include "../../include/token.h"

class Lexer {
private:
    std::string input;
    size_t current = 0;

    char peek(size_t offset = 0) const;
    Token readDecimal(size_t start);
    Token readIdentifier();
    void skipWhitespace();

public:
    explicit Lexer(std::string input);

    // Returns END_OF_FILE once the input is exhausted, and on every call after that.
    Token nextToken();

    // Reads every token of the input; the last entry is always END_OF_FILE.
    static std::vector<Token> lex(const std::string &input);

    static void printTokens(std::ostream &os, const std::vector<Token> &tokens);
};

#endif
