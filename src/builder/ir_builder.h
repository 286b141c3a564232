#ifndef IR_BUILDER_H
#define IR_BUILDER_H

#include <ostream>
#include <string>
#include <vector>
#include "../../include/instruction.h"
#include "../../include/token.h"

class IRBuilder {
public:
    /**
     * Lexes an expression and checks that it has the shape of a program:
     * non-empty, starting with a number and not ending with an unconsumed one.
     * `e` and `pi` come back as NUMBER tokens; END_OF_FILE is dropped.
     * Throws CompileError otherwise.
     */
    static std::vector<Token> tokenize(const std::string &expression);

    // Translates validated tokens into instructions, collecting constants as it goes.
    static Program build(const std::vector<Token> &tokens);

    static void printInstructions(std::ostream &os, const std::vector<Instruction> &instructions);
};

#endif
