//
//  dispatch.hpp
//  asegnc
//
//  Sub-command routing. "asegnc <input.dat> <output.nc>" runs convert with
//  every argument forwarded unchanged.
//

#ifndef ASEGNC_DISPATCH_HPP
#define ASEGNC_DISPATCH_HPP

#include <functional>
#include <map>
#include <string>
#include <vector>

// argv[0] of a command is the command name
using CommandFn    = std::function<int(int argc, char* argv[])>;
using CommandTable = std::map<std::string, CommandFn>;

struct CommandCall {
    std::string command;
    std::vector<std::string> args;  // arguments after the command name
    bool implicit = false;          // command name not given on the command line
};

int cmd_convert(int argc, char* argv[]);
int cmd_export(int argc, char* argv[]);
int cmd_info(int argc, char* argv[]);

const CommandTable& default_commands();

// argv[0] is the program name
CommandCall resolve_command(int argc, char* argv[],
                            const CommandTable& table,
                            const std::string& default_command = "convert");

// exit code of the command, 1 for an unknown command
int dispatch(const CommandCall& call, const CommandTable& table);

#endif
