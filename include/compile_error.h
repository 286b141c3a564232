/**
 * @file compile_error.h
 * @brief Exception type for expressions that cannot be compiled.
 */

#ifndef COMPILE_ERROR_H
#define COMPILE_ERROR_H

#include <stdexcept>
#include <string>

/**
 * @brief Raised when an expression is lexically or structurally invalid.
 *
 * Values that only fail at run time (for example a zero divisor) never
 * raise this; the generated program reports those itself.
 */
class CompileError : public std::runtime_error {
public:
    explicit CompileError(const std::string &message) : std::runtime_error(message) {}
};

#endif // COMPILE_ERROR_H
