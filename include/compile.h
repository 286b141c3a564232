#ifndef COMPILE_H
#define COMPILE_H

#include <string>

/**
 * @enum ErrorCode
 * @brief Possible error codes returned by compile_expression().
 */
typedef enum {
    ERR_OK = 0, /**< Compilation succeeded */
    ERR_USAGE, /**< Wrong number of arguments */
    ERR_UNKNOWN_OPTION, /**< Unrecognised command-line flag */
    ERR_NO_EXPRESSION, /**< No expression was given */
    ERR_COMPILE, /**< The expression was rejected by the compiler */
    ERR_FILE_OPEN, /**< Failed to write the assembly file */
    ERR_ASSEMBLE, /**< The assembler/linker failed */
    ERR_RUN /**< The compiled program could not be run */
} ErrorCode;

/**
 * @struct CompilerOptions
 * @brief Command‑line options and settings for the compiler.
 */
struct CompilerOptions {
    bool show_tokens = false; /**< If true, dump the token stream to stderr */
    bool show_ir = false; /**< If true, dump the instruction list to stderr */
    bool debug = false; /**< If true, insert a breakpoint into the program */
    bool compile = false; /**< If true, assemble and link instead of printing the assembly */
    bool run = false; /**< If true, run the binary after linking (implies compile) */
    bool save_asm = false; /**< If true, keep the .s file after linking */
    std::string expression; /**< The RPN expression to compile */
    std::string output_name = "a.out"; /**< Executable name; the assembly goes to <name>.s */
};

/**
 * @brief Parse command-line arguments into @p opts.
 * @return ERR_OK, ERR_USAGE, ERR_UNKNOWN_OPTION or ERR_NO_EXPRESSION.
 */
ErrorCode parse_options(int argc, char *argv[], CompilerOptions *opts);

/**
 * @brief Perform full compilation of a single expression.
 *
 * This function will:
 *  - Run the lexer, the IR builder and the code generator
 *  - Print the assembly, or write it to <output_name>.s
 *  - Invoke gcc to produce the final binary when requested
 *  - Run the binary when requested
 *
 * @param opts  Options describing the input and the flags.
 * @return      ErrorCode (ERR_OK on success, non-zero on failure).
 */
ErrorCode compile_expression(const CompilerOptions &opts);

#endif /* COMPILE_H */
