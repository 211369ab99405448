//
//  dispatch.cpp
//  asegnc
//

#include "cmds/dispatch.hpp"
#include "utils/log.hpp"

using namespace std;

const CommandTable& default_commands()
{
    static const CommandTable table = {
        {"convert", cmd_convert},
        {"export",  cmd_export},
        {"info",    cmd_info},
    };
    return table;
}

CommandCall resolve_command(int argc, char* argv[], const CommandTable& table,
                            const string& default_command)
{
    CommandCall call;
    if (argc < 2) {
        call.command  = default_command;
        call.implicit = true;
        return call;
    }

    string first = argv[1];
    int from = 2;
    if (table.count(first)) {
        call.command = first;
    } else {
        // no command name: everything goes to the default command as is
        call.command  = default_command;
        call.implicit = true;
        from = 1;
    }

    call.args.reserve((size_t)(argc - from));
    for (int i = from; i < argc; ++i) {
        call.args.emplace_back(argv[i]);
    }
    return call;
}

int dispatch(const CommandCall& call, const CommandTable& table)
{
    auto it = table.find(call.command);
    if (it == table.end()) {
        LOG_ERROR("Unknown command: " + call.command);
        return 1;
    }

    // own copies so that commands may not alter the caller's strings
    vector<string> storage;
    storage.reserve(call.args.size() + 1);
    storage.push_back(call.command);
    storage.insert(storage.end(), call.args.begin(), call.args.end());

    vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& s : storage) argv.push_back(&s[0]);
    argv.push_back(nullptr);

    return it->second((int)storage.size(), argv.data());
}
