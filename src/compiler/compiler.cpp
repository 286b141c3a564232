#include "compiler.h"
#include "../builder/ir_builder.h"
#include "../generator/generator.h"
#include <utility>

using namespace std;

Compiler::Compiler(string expression) : expression(std::move(expression)) {}

string Compiler::compile() {
    auto tokens = IRBuilder::tokenize(expression);
    auto built = IRBuilder::build(tokens);
    string output = CodeGenerator(debug).generate(built);

    lexed = std::move(tokens);
    program = std::move(built);
    return output;
}
