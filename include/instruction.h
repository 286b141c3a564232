#ifndef INSTRUCTION_H
#define INSTRUCTION_H

#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

enum class InstructionType {
    PUSH,       // Push a constant onto the evaluation stack
    PLUS,
    MINUS,
    MULTIPLY,
    DIVIDE,
    MODULUS,    // Integer remainder
    POWER,      // Integer power by repeated multiplication
    FACTORIAL,
    ABS,
    SIN,
    COS,
    TAN,
    SQRT,
    DUP,        // Duplicate the top entry
    SWAP        // Exchange the top two entries
};

class Instruction {
public:
    InstructionType type;
    std::optional<std::string> value;   // Literal to push, PUSH only

    explicit Instruction(InstructionType type, const std::optional<std::string> &value = {})
            : type(type), value(value) {}

    static std::string typeToString(InstructionType type) {
        switch (type) {
            case InstructionType::PUSH:
                return "PUSH";
            case InstructionType::PLUS:
                return "PLUS";
            case InstructionType::MINUS:
                return "MINUS";
            case InstructionType::MULTIPLY:
                return "MULTIPLY";
            case InstructionType::DIVIDE:
                return "DIVIDE";
            case InstructionType::MODULUS:
                return "MODULUS";
            case InstructionType::POWER:
                return "POWER";
            case InstructionType::FACTORIAL:
                return "FACTORIAL";
            case InstructionType::ABS:
                return "ABS";
            case InstructionType::SIN:
                return "SIN";
            case InstructionType::COS:
                return "COS";
            case InstructionType::TAN:
                return "TAN";
            case InstructionType::SQRT:
                return "SQRT";
            case InstructionType::DUP:
                return "DUP";
            case InstructionType::SWAP:
                return "SWAP";
        }
        return "UNKNOWN";
    }

    bool operator==(const Instruction &other) const {
        return type == other.type && value == other.value;
    }

    friend std::ostream &operator<<(std::ostream &os, const Instruction &instruction) {
        os << typeToString(instruction.type);
        if (instruction.value) os << " " << *instruction.value;
        return os;
    }
};

/**
 * Distinct numeric literals referenced by a program, keyed by their text.
 * Ordered so that the data section is emitted the same way every time.
 */
using ConstantPool = std::set<std::string>;

/**
 * Output of the IR builder: the instructions in program order and the
 * constants they push.
 */
struct Program {
    std::vector<Instruction> instructions;
    ConstantPool constants;
};

#endif
