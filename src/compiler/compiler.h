#ifndef COMPILER_H
#define COMPILER_H

#include <string>
#include <vector>
#include "../../include/instruction.h"
#include "../../include/token.h"

/**
 * Compiles one RPN expression into an assembly program.
 *
 * An instance belongs to a single compilation; separate instances share
 * nothing and may be used from different threads.
 */
class Compiler {
private:
    std::string expression;
    bool debug = false;
    std::vector<Token> lexed;
    Program program;

public:
    explicit Compiler(std::string expression);

    // Adds a debug breakpoint after the program's entry sequence.
    void setDebug(bool value) { debug = value; }

    /**
     * Runs lexing, validation, IR construction and code generation.
     * @return The complete assembly text.
     * @throws CompileError if the expression is not a valid program; nothing is produced.
     */
    std::string compile();

    // Intermediate results of the last successful compile().
    const std::vector<Token> &tokens() const { return lexed; }
    const std::vector<Instruction> &instructions() const { return program.instructions; }
};

#endif
