#include "ir_builder.h"
#include "../lexer/lexer.h"
#include "../../include/compile_error.h"
#include <cstdio>

using namespace std;

static const double PI_CONSTANT = 3.141592653589793;
static const double EULER_CONSTANT = 2.718281828459045;

// Constants are written the way a user would type them, with six decimals.
static string formatConstant(double value) {
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%f", value);
    return buffer;
}

vector<Token> IRBuilder::tokenize(const string &expression) {
    Lexer lexer(expression);
    vector<Token> tokens;

    for (Token token = lexer.nextToken(); token.type != TokenType::END_OF_FILE; token = lexer.nextToken()) {
        if (token.type == TokenType::ERROR) {
            throw CompileError("Error parsing input: " + token.literal);
        }

        if (token.type == TokenType::PI) {
            token.type = TokenType::NUMBER;
            token.literal = formatConstant(PI_CONSTANT);
        } else if (token.type == TokenType::E) {
            token.type = TokenType::NUMBER;
            token.literal = formatConstant(EULER_CONSTANT);
        }

        tokens.push_back(token);
    }

    if (tokens.empty()) {
        throw CompileError("The input expression was empty");
    }

    if (tokens.front().type != TokenType::NUMBER) {
        throw CompileError("Error (column " + to_string(tokens.front().column) +
                           "): the program must begin with a number, found '" + tokens.front().literal + "'");
    }

    if (tokens.size() > 1 && tokens.back().type == TokenType::NUMBER) {
        throw CompileError("Error (column " + to_string(tokens.back().column) +
                           "): the program ends with the number '" + tokens.back().literal +
                           "', which no operator consumes");
    }

    return tokens;
}

Program IRBuilder::build(const vector<Token> &tokens) {
    Program program;

    for (const auto &token: tokens) {
        switch (token.type) {
            case TokenType::NUMBER:
                program.constants.insert(token.literal);
                program.instructions.emplace_back(InstructionType::PUSH, token.literal);
                break;
            case TokenType::PLUS:
                program.instructions.emplace_back(InstructionType::PLUS);
                break;
            case TokenType::MINUS:
                program.instructions.emplace_back(InstructionType::MINUS);
                break;
            case TokenType::ASTERISK:
                program.instructions.emplace_back(InstructionType::MULTIPLY);
                break;
            case TokenType::SLASH:
                program.instructions.emplace_back(InstructionType::DIVIDE);
                break;
            case TokenType::MOD:
                program.instructions.emplace_back(InstructionType::MODULUS);
                break;
            case TokenType::POWER:
                program.instructions.emplace_back(InstructionType::POWER);
                break;
            case TokenType::FACTORIAL:
                program.instructions.emplace_back(InstructionType::FACTORIAL);
                break;
            case TokenType::ABS:
                program.instructions.emplace_back(InstructionType::ABS);
                break;
            case TokenType::SIN:
                program.instructions.emplace_back(InstructionType::SIN);
                break;
            case TokenType::COS:
                program.instructions.emplace_back(InstructionType::COS);
                break;
            case TokenType::TAN:
                program.instructions.emplace_back(InstructionType::TAN);
                break;
            case TokenType::SQRT:
                program.instructions.emplace_back(InstructionType::SQRT);
                break;
            case TokenType::DUP:
                program.instructions.emplace_back(InstructionType::DUP);
                break;
            case TokenType::SWAP:
                program.instructions.emplace_back(InstructionType::SWAP);
                break;
            default:
                throw CompileError("Error (column " + to_string(token.column) + "): unexpected " +
                                   tokenTypeToString(token.type) + " token '" + token.literal + "'");
        }
    }

    return program;
}

void IRBuilder::printInstructions(ostream &os, const vector<Instruction> &instructions) {
    for (size_t i = 0; i < instructions.size(); i++) {
        os << i << "\t" << instructions[i] << "\n";
    }
}
