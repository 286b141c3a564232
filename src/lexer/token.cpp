#include "../../include/token.h"

const char *tokenTypeToString(TokenType type) {
    switch (type) {
        case TokenType::NUMBER:
            return "NUMBER";
        case TokenType::PLUS:
            return "PLUS";
        case TokenType::MINUS:
            return "MINUS";
        case TokenType::ASTERISK:
            return "ASTERISK";
        case TokenType::SLASH:
            return "SLASH";
        case TokenType::MOD:
            return "MOD";
        case TokenType::POWER:
            return "POWER";
        case TokenType::FACTORIAL:
            return "FACTORIAL";
        case TokenType::ABS:
            return "ABS";
        case TokenType::COS:
            return "COS";
        case TokenType::SIN:
            return "SIN";
        case TokenType::SQRT:
            return "SQRT";
        case TokenType::TAN:
            return "TAN";
        case TokenType::DUP:
            return "DUP";
        case TokenType::SWAP:
            return "SWAP";
        case TokenType::E:
            return "E";
        case TokenType::PI:
            return "PI";
        case TokenType::END_OF_FILE:
            return "END_OF_FILE";
        case TokenType::ERROR:
            return "ERROR";
    }
    return "UNKNOWN";
}
