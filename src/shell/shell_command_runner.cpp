#include "../../include/shell_command_runner.h"
#include <cstdlib>
#include <iostream>
#include <sys/wait.h>

using namespace std;

int run_command(const string &cmd) {
    int status = system(cmd.c_str());
    if (status == -1) {
        cerr << "Error: could not start " << cmd << "\n";
        return -1;
    }

    if (!WIFEXITED(status)) {
        cerr << "Error: " << cmd << " terminated abnormally\n";
        return -1;
    }

    int code = WEXITSTATUS(status);
    if (code != 0) {
        cerr << "Error: " << cmd << " exited with status " << code << "\n";
    }
    return code;
}

string shell_quote(const string &argument) {
    string quoted = "'";
    for (char c: argument) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}
