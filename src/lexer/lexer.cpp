#include "lexer.h"
#include "keywords.h"
#include <utility>

using namespace std;

static bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

static bool isWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

Lexer::Lexer(string input) : input(std::move(input)) {}

char Lexer::peek(size_t offset) const {
    if (current + offset >= input.length()) {
        return '\0';
    }
    return input[current + offset];
}

void Lexer::skipWhitespace() {
    while (current < input.length() && isWhitespace(input[current])) {
        current++;
    }
}

// Reads digits, optionally followed by '.' and more digits. `start` is where the
// literal began, which is before `current` when a sign has been consumed.
Token Lexer::readDecimal(size_t start) {
    while (isDigit(peek())) {
        current++;
    }

    if (peek() == '.' && isDigit(peek(1))) {
        current++; // Skip '.'
        while (isDigit(peek())) {
            current++;
        }
    }

    return Token(TokenType::NUMBER, input.substr(start, current - start), start + 1);
}

Token Lexer::readIdentifier() {
    size_t start = current;
    while (current < input.length() && !isDigit(input[current]) && !isWhitespace(input[current])) {
        current++;
    }

    string identifier = input.substr(start, current - start);
    auto type = lookupIdentifier(identifier);
    if (!type) {
        return Token(TokenType::ERROR,
                     "Unknown token '" + identifier + "' at column " + to_string(start + 1), start + 1);
    }
    return Token(*type, identifier, start + 1);
}

Token Lexer::nextToken() {
    skipWhitespace();

    if (current >= input.length()) {
        return Token(TokenType::END_OF_FILE, "", current + 1);
    }

    size_t start = current;
    char c = input[current];

    switch (c) {
        case '+':
            current++;
            return Token(TokenType::PLUS, "+", start + 1);
        case '*':
            current++;
            return Token(TokenType::ASTERISK, "*", start + 1);
        case '/':
            current++;
            return Token(TokenType::SLASH, "/", start + 1);
        case '%':
            current++;
            return Token(TokenType::MOD, "%", start + 1);
        case '^':
            current++;
            return Token(TokenType::POWER, "^", start + 1);
        case '!':
            current++;
            return Token(TokenType::FACTORIAL, "!", start + 1);
        case '-':
            current++;
            // "-3" is a negative literal, "3 - 4" has a separate operator.
            if (isDigit(peek())) {
                return readDecimal(start);
            }
            return Token(TokenType::MINUS, "-", start + 1);
        default:
            break;
    }

    if (isDigit(c)) {
        return readDecimal(start);
    }
    return readIdentifier();
}

vector<Token> Lexer::lex(const string &input) {
    Lexer lexer(input);
    vector<Token> tokens;

    while (true) {
        Token token = lexer.nextToken();
        bool done = token.type == TokenType::END_OF_FILE;
        tokens.push_back(std::move(token));
        if (done) break;
    }

    return tokens;
}

void Lexer::printTokens(ostream &os, const vector<Token> &tokens) {
    for (const auto &token: tokens) {
        os << token << "\n";
    }
}
