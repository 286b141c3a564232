#ifndef GENERATE_H
#define GENERATE_H

#include "../../include/instruction.h"
#include <string>

/**
 * Emits x86-64 assembly (GNU as, Intel syntax) for a program.
 *
 * Values live on the machine stack and the [depth] cell counts them, so each
 * block can check for its operands before popping. Blocks only touch
 * caller-saved registers and leave the x87 stack empty.
 */
class CodeGenerator {
private:
    bool debug;

    std::string header(const ConstantPool &constants) const;
    std::string footer() const;
    std::string genInstruction(const Instruction &instruction, size_t index) const;

    std::string genPush(const std::string &value) const;
    std::string genArithmetic(const std::string &name, const std::string &operation, bool checkZero) const;
    std::string genModulus() const;
    std::string genPower(size_t index) const;
    std::string genFactorial(size_t index) const;
    std::string genUnary(const std::string &name, const std::string &operation, bool trig) const;
    std::string genTan() const;
    std::string genDup() const;
    std::string genSwap() const;

public:
    explicit CodeGenerator(bool debug = false) : debug(debug) {}

    std::string generate(const Program &program) const;

    // "3.5" -> "const_3_5", "-3.5" -> "const_neg_3_5".
    static std::string constantSymbol(const std::string &literal);

    // Label local to the instruction at `index`, e.g. label("power", "loop", 4) -> "power_loop_4".
    static std::string label(const std::string &operation, const std::string &role, size_t index);
};

#endif
