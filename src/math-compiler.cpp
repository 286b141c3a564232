#include <iostream>
#include "../include/compile.h"

using namespace std;

int main(int argc, char* argv[]) {
    CompilerOptions opts;

    ErrorCode code = parse_options(argc, argv, &opts);
    if (code != ERR_OK) {
        cerr << "Usage: math-compiler [--debug] [--show-tokens] [--show-ir] [--compile] [--run]\n"
                "                     [--save-asm] [--filename NAME] 'expression'\n";
        return code;
    }

    return compile_expression(opts);
}
