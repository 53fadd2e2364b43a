#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include <string>
#include <vector>

struct ParsedArguments {
    bool dry_run{false};
    bool reverse{false};
    bool show_help{false};
};

// @throws ErrorCodes::AppException USAGE_UNKNOWN_ARGUMENT
ParsedArguments parse_command_line(const std::vector<std::string>& args);
ParsedArguments parse_command_line(int argc, char** argv);

std::string usage_text(const std::string& program_name);

#endif
