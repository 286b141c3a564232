#include "keywords.h"
#include <map>

static const std::map<std::string, TokenType> keywords = {
    {"abs", TokenType::ABS},
    {"cos", TokenType::COS},
    {"dup", TokenType::DUP},
    {"e", TokenType::E},
    {"factorial", TokenType::FACTORIAL},
    {"pi", TokenType::PI},
    {"sin", TokenType::SIN},
    {"sqrt", TokenType::SQRT},
    {"swap", TokenType::SWAP},
    {"tan", TokenType::TAN}
};

std::optional<TokenType> lookupIdentifier(const std::string &identifier) {
    auto it = keywords.find(identifier);
    if (it == keywords.end()) {
        return std::nullopt;
    }
    return it->second;
}
