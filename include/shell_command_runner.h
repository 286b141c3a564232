#ifndef SHELL_COMMAND_RUNNER_H
#define SHELL_COMMAND_RUNNER_H

#include <string>

/**
 * @brief Execute a shell command, reporting failures on stderr.
 *
 * @param cmd  Command line, passed to the shell as is.
 * @return     Exit status of the command, or -1 if it could not be started.
 */
int run_command(const std::string &cmd);

/**
 * @brief Quote a single argument for the POSIX shell.
 */
std::string shell_quote(const std::string &argument);

#endif //SHELL_COMMAND_RUNNER_H
