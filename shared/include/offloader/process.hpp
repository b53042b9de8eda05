#pragma once

#include <string>
#include <vector>

struct CommandResult {
    int exit_code = -1;
    std::string out;
    std::string err;
};

// runs argv[0] from PATH without a shell and collects its output
CommandResult run_command(const std::vector<std::string> &argv);
