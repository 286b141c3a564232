#include "../include/compile.h"
#include "../include/compile_error.h"
#include "../include/shell_command_runner.h"
#include "builder/ir_builder.h"
#include "compiler/compiler.h"
#include "lexer/lexer.h"
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>

using namespace std;

ErrorCode parse_options(int argc, char *argv[], CompilerOptions *opts) {
    for (int i = 1; i < argc; i++) {
        const char *arg = argv[i];

        if (strcmp(arg, "--debug") == 0) {
            opts->debug = true;
        } else if (strcmp(arg, "--show-tokens") == 0) {
            opts->show_tokens = true;
        } else if (strcmp(arg, "--show-ir") == 0) {
            opts->show_ir = true;
        } else if (strcmp(arg, "--compile") == 0) {
            opts->compile = true;
        } else if (strcmp(arg, "--run") == 0) {
            opts->run = true;
        } else if (strcmp(arg, "--save-asm") == 0) {
            opts->save_asm = true;
        } else if (strcmp(arg, "--filename") == 0) {
            if (i + 1 >= argc) {
                cerr << "Error: --filename needs a value\n";
                return ERR_USAGE;
            }
            opts->output_name = argv[++i];
        } else if (strncmp(arg, "--", 2) == 0) { // "-3" is an expression, not a flag
            cerr << "Error: unknown option " << arg << "\n";
            return ERR_UNKNOWN_OPTION;
        } else if (!opts->expression.empty()) {
            cerr << "Error: expected a single expression, got a second one: " << arg << "\n";
            return ERR_USAGE;
        } else {
            opts->expression = arg;
        }
    }

    if (opts->expression.empty()) {
        return ERR_NO_EXPRESSION;
    }

    if (opts->run) {
        opts->compile = true;
    }
    return ERR_OK;
}

ErrorCode compile_expression(const CompilerOptions &opts) {
    Compiler compiler(opts.expression);
    compiler.setDebug(opts.debug);

    string assembly;
    try {
        assembly = compiler.compile();
    } catch (const CompileError &err) {
        cerr << "Error compiling: " << err.what() << "\n";
        return ERR_COMPILE;
    }

    if (opts.show_tokens) {
        Lexer::printTokens(cerr, compiler.tokens());
    }
    if (opts.show_ir) {
        IRBuilder::printInstructions(cerr, compiler.instructions());
    }

    if (!opts.compile) {
        cout << assembly;
        return ERR_OK;
    }

    string asmFile = opts.output_name + ".s";
    ofstream out(asmFile);
    if (!out.is_open()) {
        cerr << "Error: Could not open file " << asmFile << "\n";
        return ERR_FILE_OPEN;
    }
    out << assembly;
    out.close();
    if (!out) {
        cerr << "Error: Could not write " << asmFile << "\n";
        return ERR_FILE_OPEN;
    }

    int status = run_command("gcc -static -o " + shell_quote(opts.output_name) + " " + shell_quote(asmFile));

    if (!opts.save_asm && remove(asmFile.c_str()) != 0) {
        cerr << "Error: Could not remove " << asmFile << "\n";
    }
    if (status != 0) {
        return ERR_ASSEMBLE;
    }

    if (opts.save_asm) {
        cout << "Generated assembly in " << asmFile << "\n";
    }
    cout << "Generated executable " << opts.output_name << endl;

    if (opts.run) {
        string path = opts.output_name.find('/') == string::npos ? "./" + opts.output_name : opts.output_name;
        // The program's own diagnostics exit with status 1; only a failed launch is an error here.
        if (run_command(shell_quote(path)) < 0) {
            return ERR_RUN;
        }
    }

    return ERR_OK;
}
