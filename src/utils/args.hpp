//
//  args.hpp
//  asegnc
//

#ifndef ASEGNC_ARGS_HPP
#define ASEGNC_ARGS_HPP

#include <cstddef>
#include <optional>
#include <string>

// ----------------------[ common ]-------------------------
struct CommonArgs {
    int threads          = 1;
    bool log_enabled     = false;
    std::string log_file;
    bool verbose         = false;
};

// ----------------------[ convert ]-------------------------
struct Args_Convert : public CommonArgs {
    std::string dat_file;
    std::string dfn_file;       // empty: <dat basename>.dfn
    std::string out_file;

    std::string title;          // empty: dat file stem
    std::string keywords;
    std::string crs        = "GDA94";

    std::string line_field = "line";
    std::string lon_field;      // empty: auto detect
    std::string lat_field;

    int deflate            = 4;
    size_t chunk_size      = 1024;
    bool reduce_precision  = true;
};

// ----------------------[ export ]-------------------------
struct Args_Export : public CommonArgs {
    std::string nc_file;
    std::string out_file;       // .dat or .dat.gz
    std::string dfn_file;       // empty: <out basename>.dfn
    std::optional<int> decimal_places;
};

// ----------------------[ info ]-------------------------
struct Args_Info : public CommonArgs {
    std::string dfn_file;
};

// --threads anywhere on the command line, checked like parse_args_*;
// false with threads unchanged when the value is not a valid count
bool scan_threads(int argc, char* argv[], int& threads);

void print_convert_help();
void print_export_help();
void print_info_help();

Args_Convert parse_args_convert(int argc, char* argv[]);
Args_Export  parse_args_export(int argc, char* argv[]);
Args_Info    parse_args_info(int argc, char* argv[]);

#endif
