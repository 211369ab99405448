#include "cmds/dispatch.hpp"
#include "utils/args.hpp"
#include "utils/log.hpp"
#include "utils/gadgets.hpp"

#include <iostream>
#include <fstream>
#include <exception>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

using namespace std;

void print_main_help() {
    cerr << "Usage:\n"
        << "  asegnc <input.dat> <output.nc> [options]\n"
        << "  asegnc <command> [options]\n\n"
        << "Available commands:\n"
        << "   convert        Convert ASEG-GDF (.dat + .dfn) to NetCDF (default)\n"
        << "   export         Export NetCDF point data to ASEG-GDF\n"
        << "   info           Show the field table of a .dfn file\n\n"
        << "Use asegnc <command> --help for command options.\n\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2 ||
        std::string(argv[1]) == "--help" ||
        std::string(argv[1]) == "-h") {
        print_main_help();
        return argc < 2 ? 1 : 0;
    }

    int threads = 1;
    // read --threads before any command parses its args
    if (!scan_threads(argc, argv, threads)) {
        LOG_ERROR("--threads must be an integer between 1 and 1024");
        return 1;
    }

#ifdef _OPENMP
    if (threads > 0){
        omp_set_num_threads(threads);
        LOG_DEBUG("Using threads = " + std::to_string(threads));
    }
#else
    (void)threads;
#endif

    for (int i=1; i<argc; i++){
        std::string x = argv[i];
        if (x == "--log" && i+1 < argc) {
            static std::ofstream log_ofs(argv[i+1]);
            if (!log_ofs){
                LOG_ERROR("ERROR: cannot open log file");
                return 1;
            }
            g_log = &log_ofs;
        }
        if (x == "--verbose") g_log_debug = true;
    }
    g_log_to_console = true;

    // Timer
    Gadget::Timer timer;
    timer.setTime();

    LOG_INFO(string("Analysis started: ") + timer.getDate());

    const CommandTable& table = default_commands();
    CommandCall call = resolve_command(argc, argv, table);

    int ret = 0;
    try {
        ret = dispatch(call, table);
    } catch (const std::exception& e) {
        LOG_ERROR(e.what());
        return 1;
    }

    timer.getTime();
    LOG_INFO(string("Analysis finished: ") + timer.getDate());
    LOG_INFO(string("Total runtime: ") + timer.format(timer.getElapse()));
    return ret;
}
