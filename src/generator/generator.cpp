#include "generator.h"
#include "../../include/compile_error.h"

using namespace std;

string CodeGenerator::constantSymbol(const string &literal) {
    string symbol = "const_";
    string digits = literal;

    if (!digits.empty() && digits[0] == '-') {
        symbol += "neg_";
        digits.erase(0, 1);
    }

    for (char c: digits) {
        if (c == '.') {
            symbol += '_';
        } else if (c != '-') {
            symbol += c;
        }
    }
    return symbol;
}

string CodeGenerator::label(const string &operation, const string &role, size_t index) {
    return operation + "_" + role + "_" + to_string(index);
}

// Jumps to stack_error unless at least `count` entries are on the stack.
static string requireEntries(int count) {
    string code;
    code += "\tcmp qword ptr [rip + depth], " + to_string(count) + "\n";
    code += "\tjb stack_error\n";
    return code;
}

static string popInto(const string &cell) {
    string code;
    code += "\tpop rax\n";
    code += "\tmov qword ptr [rip + " + cell + "], rax\n";
    return code;
}

static string pushFrom(const string &cell) {
    string code;
    code += "\tmov rax, qword ptr [rip + " + cell + "]\n";
    code += "\tpush rax\n";
    return code;
}

// Truncates the double stored in `cell` towards zero. cvttsd2si yields
// INT64_MIN for NaN and for values outside (-2^63, 2^63); that is an overflow.
// Clobbers rsi.
static string truncateInto(const string &reg, const string &cell) {
    string code;
    code += "\tcvttsd2si " + reg + ", qword ptr [rip + " + cell + "]\n";
    code += "\tmov rsi, " + reg + "\n";
    code += "\tneg rsi\n";
    code += "\tjo register_overflow\n";
    return code;
}

// fsin, fcos and fsincos set C2 and leave the operand alone when |x| >= 2^63.
static string requireTrigRange() {
    string code;
    code += "\tfnstsw ax\n";
    code += "\ttest ah, 4\n";
    code += "\tjnz register_overflow\n";
    return code;
}

// Pushes the integer in rax as a double.
static string pushInteger() {
    string code;
    code += "\tmov qword ptr [rip + int_cell], rax\n";
    code += "\tfild qword ptr [rip + int_cell]\n";
    code += "\tfstp qword ptr [rip + int_cell]\n";
    code += pushFrom("int_cell");
    return code;
}

string CodeGenerator::header(const ConstantPool &constants) const {
    string text;

    text += "#\n";
    text += "# Generated by math-compiler.\n";
    text += "#\n";
    text += ".intel_syntax noprefix\n";
    text += ".globl main\n\n";

    // arg_a and arg_b hold operands, int_cell converts integers back to doubles,
    // depth counts the entries on the evaluation stack.
    text += ".data\n";
    text += "arg_a: .double 0.0\n";
    text += "arg_b: .double 0.0\n";
    text += "int_cell: .quad 0\n";
    text += "depth: .quad 0\n\n";

    for (const auto &constant: constants) {
        text += constantSymbol(constant) + ": .double " + constant + "\n";
    }
    if (!constants.empty()) text += "\n";

    text += "fmt: .asciz \"Result %g\\n\"\n";
    text += "div_zero: .asciz \"Attempted division by zero.  Aborting\\n\"\n";
    text += "overflow: .asciz \"Overflow - value out of range.  Aborting\\n\"\n";
    text += "stack_err: .asciz \"Insufficient entries on the stack.  Aborting\\n\"\n";
    text += "stack_full: .asciz \"Too many entries remaining on the stack.  Aborting\\n\"\n\n";

    text += ".text\n";
    text += "main:\n";
    text += "\tpush rbp\n";
    text += "\tmov qword ptr [rip + depth], 0\n";

    if (debug) {
        text += "\n\t# Debug-break\n";
        text += "\tint3\n";
    }

    return text;
}

string CodeGenerator::footer() const {
    string text;

    text += "\n\t# [PRINT]\n";
    text += "\tcmp qword ptr [rip + depth], 1\n";
    text += "\tja stack_too_full\n";
    text += "\tjb stack_error\n";
    text += popInto("arg_a");
    text += "\tlea rdi, [rip + fmt]\n";
    text += "\tmovq xmm0, qword ptr [rip + arg_a]\n";
    text += "\tmov eax, 1\n";
    text += "\tcall printf@PLT\n";
    text += "\tpop rbp\n";
    text += "\txor eax, eax\n";
    text += "\tret\n\n";

    text += "division_by_zero:\n";
    text += "\tlea rdi, [rip + div_zero]\n";
    text += "\tjmp print_msg_and_exit\n\n";

    text += "register_overflow:\n";
    text += "\tlea rdi, [rip + overflow]\n";
    text += "\tjmp print_msg_and_exit\n\n";

    text += "stack_too_full:\n";
    text += "\tlea rdi, [rip + stack_full]\n";
    text += "\tjmp print_msg_and_exit\n\n";

    text += "stack_error:\n";
    text += "\tlea rdi, [rip + stack_err]\n\n";

    // The evaluation stack may hold any number of entries here.
    text += "print_msg_and_exit:\n";
    text += "\tand rsp, -16\n";
    text += "\txor eax, eax\n";
    text += "\tcall printf@PLT\n";
    text += "\tmov edi, 1\n";
    text += "\tcall exit@PLT\n\n";

    text += ".section .note.GNU-stack,\"\",@progbits\n";
    return text;
}

string CodeGenerator::genPush(const string &value) const {
    string code;
    code += "\n\t# [PUSH] " + value + "\n";
    code += pushFrom(constantSymbol(value));
    code += "\tinc qword ptr [rip + depth]\n";
    return code;
}

// Pops a (top) and b, pushes b <operation> a.
string CodeGenerator::genArithmetic(const string &name, const string &operation, bool checkZero) const {
    string code;
    code += "\n\t# [" + name + "]\n";
    code += requireEntries(2);
    code += "\tpop rax\n";
    if (checkZero) {
        // Dropping the sign bit leaves zero for both +0.0 and -0.0.
        code += "\tmov rcx, rax\n";
        code += "\tshl rcx, 1\n";
        code += "\tjz division_by_zero\n";
    }
    code += "\tmov qword ptr [rip + arg_a], rax\n";
    code += popInto("arg_b");
    code += "\tfld qword ptr [rip + arg_b]\n";
    code += "\t" + operation + " qword ptr [rip + arg_a]\n";
    code += "\tfstp qword ptr [rip + arg_a]\n";
    code += pushFrom("arg_a");
    code += "\tdec qword ptr [rip + depth]\n";
    return code;
}

string CodeGenerator::genModulus() const {
    string code;
    code += "\n\t# [MODULUS]\n";
    code += requireEntries(2);
    code += popInto("arg_a");
    code += popInto("arg_b");
    code += truncateInto("rcx", "arg_a");
    code += truncateInto("rax", "arg_b");
    code += "\ttest rcx, rcx\n";
    code += "\tjz division_by_zero\n";
    // n % -1 == n % 1 == 0; INT64_MIN / -1 would trap.
    code += "\tmov rsi, 1\n";
    code += "\tcmp rcx, -1\n";
    code += "\tcmove rcx, rsi\n";
    code += "\txor rdx, rdx\n";
    code += "\tcqo\n";
    code += "\tidiv rcx\n";
    code += "\tmov rax, rdx\n";
    code += pushInteger();
    code += "\tdec qword ptr [rip + depth]\n";
    return code;
}

// Integer power: exponent <= 0 gives 0, exponent 1 gives the base.
string CodeGenerator::genPower(size_t index) const {
    const string positive = label("power", "positive", index);
    const string loop = label("power", "loop", index);
    const string store = label("power", "store", index);

    string code;
    code += "\n\t# [POWER]\n";
    code += requireEntries(2);
    code += popInto("arg_a");
    code += popInto("arg_b");
    code += truncateInto("rdx", "arg_a");
    code += truncateInto("rax", "arg_b");
    code += "\tcmp rdx, 0\n";
    code += "\tjg " + positive + "\n";
    code += "\txor eax, eax\n";
    code += "\tjmp " + store + "\n";
    code += positive + ":\n";
    code += "\tmov rcx, rax\n";
    code += "\tdec rdx\n";
    code += "\tjz " + store + "\n";
    code += loop + ":\n";
    code += "\timul rax, rcx\n";
    code += "\tjo register_overflow\n";
    code += "\tdec rdx\n";
    code += "\tjnz " + loop + "\n";
    code += store + ":\n";
    code += pushInteger();
    code += "\tdec qword ptr [rip + depth]\n";
    return code;
}

string CodeGenerator::genFactorial(size_t index) const {
    const string loop = label("factorial", "loop", index);
    const string store = label("factorial", "store", index);

    string code;
    code += "\n\t# [FACTORIAL]\n";
    code += requireEntries(1);
    code += popInto("arg_a");
    code += truncateInto("rcx", "arg_a");
    code += "\txor eax, eax\n";
    code += "\tcmp rcx, 0\n";
    code += "\tjle " + store + "\n";
    code += "\tmov eax, 1\n";
    code += loop + ":\n";
    code += "\timul rax, rcx\n";
    code += "\tjo register_overflow\n";
    code += "\tdec rcx\n";
    code += "\tjnz " + loop + "\n";
    code += store + ":\n";
    code += pushInteger();
    return code;
}

string CodeGenerator::genUnary(const string &name, const string &operation, bool trig) const {
    string code;
    code += "\n\t# [" + name + "]\n";
    code += requireEntries(1);
    code += popInto("arg_a");
    code += "\tfld qword ptr [rip + arg_a]\n";
    code += "\t" + operation + "\n";
    if (trig) code += requireTrigRange();
    code += "\tfstp qword ptr [rip + arg_a]\n";
    code += pushFrom("arg_a");
    return code;
}

string CodeGenerator::genTan() const {
    string code;
    code += "\n\t# [TAN]\n";
    code += requireEntries(1);
    code += popInto("arg_a");
    code += "\tfld qword ptr [rip + arg_a]\n";
    code += "\tfsincos\n";
    code += requireTrigRange();
    // st(0) = cos, st(1) = sin
    code += "\tfstp qword ptr [rip + arg_b]\n";
    code += "\tfdiv qword ptr [rip + arg_b]\n";
    code += "\tfstp qword ptr [rip + arg_a]\n";
    code += pushFrom("arg_a");
    return code;
}

string CodeGenerator::genDup() const {
    string code;
    code += "\n\t# [DUP]\n";
    code += requireEntries(1);
    code += "\tpop rax\n";
    code += "\tpush rax\n";
    code += "\tpush rax\n";
    code += "\tinc qword ptr [rip + depth]\n";
    return code;
}

string CodeGenerator::genSwap() const {
    string code;
    code += "\n\t# [SWAP]\n";
    code += requireEntries(2);
    code += "\tpop rax\n";
    code += "\tpop rcx\n";
    code += "\tpush rax\n";
    code += "\tpush rcx\n";
    return code;
}

string CodeGenerator::genInstruction(const Instruction &instruction, size_t index) const {
    switch (instruction.type) {
        case InstructionType::PUSH:
            if (!instruction.value || instruction.value->empty()) {
                throw CompileError("PUSH instruction " + to_string(index) + " has no value");
            }
            return genPush(*instruction.value);
        case InstructionType::PLUS:
            return genArithmetic("PLUS", "fadd", false);
        case InstructionType::MINUS:
            return genArithmetic("MINUS", "fsub", false);
        case InstructionType::MULTIPLY:
            return genArithmetic("MULTIPLY", "fmul", false);
        case InstructionType::DIVIDE:
            return genArithmetic("DIVIDE", "fdiv", true);
        case InstructionType::MODULUS:
            return genModulus();
        case InstructionType::POWER:
            return genPower(index);
        case InstructionType::FACTORIAL:
            return genFactorial(index);
        case InstructionType::ABS:
            return genUnary("ABS", "fabs", false);
        case InstructionType::SIN:
            return genUnary("SIN", "fsin", true);
        case InstructionType::COS:
            return genUnary("COS", "fcos", true);
        case InstructionType::TAN:
            return genTan();
        case InstructionType::SQRT:
            return genUnary("SQRT", "fsqrt", false);
        case InstructionType::DUP:
            return genDup();
        case InstructionType::SWAP:
            return genSwap();
    }
    throw CompileError("Unknown instruction at index " + to_string(index));
}

string CodeGenerator::generate(const Program &program) const {
    string body;

    for (size_t i = 0; i < program.instructions.size(); i++) {
        body += genInstruction(program.instructions[i], i);
    }

    return header(program.constants) + body + footer();
}
