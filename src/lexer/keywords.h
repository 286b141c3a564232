#ifndef KEYWORDS_H
#define KEYWORDS_H

#include <optional>
#include <string>
#include "../../include/token.h"

// Maps an identifier to its reserved token type; empty if it is not a keyword.
std::optional<TokenType> lookupIdentifier(const std::string &identifier);

#endif
