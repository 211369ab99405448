//
//  args.cpp
//  asegnc
//

#include "utils/args.hpp"
#include "utils/util.hpp"
#include "utils/log.hpp"

#include <iostream>
#include <cstdlib>
#include <map>
#include <set>
#include <vector>

using namespace std;

// all legal parameter names (flags and valued options)
static const set<string> common_params = {
    "--threads", "--log", "--verbose"
};

static const set<string> convert_params = {
    "--dat", "--dfn", "--out",
    "--title", "--keywords", "--crs",
    "--line-field", "--lon-field", "--lat-field",
    "--deflate", "--chunk-size", "--no-reduce"
};
static const set<string> export_params = {
    "--nc", "--out", "--dfn", "--decimal-places"
};
static const set<string> info_params = {
    "--dfn"
};

static const set<string> flags = {
    "--verbose", "--no-reduce"
};

static bool valid_threads(const string& text, int64_t& v)
{
    return parse_int64_strict(text, v) && v >= 1 && v <= 1024;
}

static int parse_int_arg(const map<string,string>& args, const string& key, long lo, long hi)
{
    int64_t v = 0;
    const string& text = args.at(key);
    require(parse_int64_strict(text, v), "Invalid integer for " + key + ": " + text);
    require(v >= lo && v <= hi,
            key + " must be between " + to_string(lo) + " and " + to_string(hi));
    return (int)v;
}

// Collect --key value pairs and positional arguments.
// Unknown parameters, missing values and surplus positionals are fatal.
static void collect_args(int argc, char* argv[],
                         const set<string>& cmd_params,
                         size_t max_positional,
                         void (*print_help)(),
                         map<string,string>& args,
                         vector<string>& positional)
{
    for (int i=1; i<argc; ) {
        string key = argv[i];

        if (key == "--help" || key == "-h") {
            print_help();
            exit(0);
        }

        if (!starts_with(key, "--")) {
            require(positional.size() < max_positional, "Unexpected argument: " + key);
            positional.push_back(key);
            i++;
            continue;
        }

        // unknown parameter check
        if (!common_params.count(key) && !cmd_params.count(key)) {
            LOG_ERROR("Unknown parameter: " + key);
            exit(1);
        }

        if (flags.count(key)) {
            args[key] = "1"; i++; continue;
        }

        if (i+1 >= argc) {
            LOG_ERROR("Missing value for " + key);
            exit(1);
        }

        args[key] = argv[i+1];
        i += 2;
    }
}

// ------------------------- common parsing ---------------------
static void parse_common(CommonArgs& C, const map<string,string>& args)
{
    if (args.count("--threads")) {
        int64_t v = 0;
        require(valid_threads(args.at("--threads"), v),
                "--threads must be an integer between 1 and 1024: " + args.at("--threads"));
        C.threads = (int)v;
    }

    if (args.count("--log")) {
        C.log_enabled = true;
        C.log_file    = args.at("--log");
    }

    C.verbose = args.count("--verbose") > 0;
}

bool scan_threads(int argc, char* argv[], int& threads)
{
    for (int i=1; i<argc; i++) {
        if (string(argv[i]) != "--threads" || i+1 >= argc) continue;
        int64_t v = 0;
        if (!valid_threads(argv[i+1], v)) return false;
        threads = (int)v;
    }
    return true;
}

// ======================================================
//                     HELP
// ======================================================
void print_convert_help()
{
    cerr <<
    "Usage:\n"
    "  asegnc <input.dat> <output.nc> [options]\n"
    "  asegnc convert --dat FILE --out FILE [options]\n\n"

    "Description:\n"
    "  Convert an ASEG-GDF data file and its definition file into NetCDF-4.\n\n"

    "Required arguments:\n"
    "  --dat FILE              ASEG-GDF data file (txt / gz)\n"
    "  --out FILE              Output NetCDF file\n\n"

    "Optional arguments:\n"
    "  --dfn FILE              Definition file (default: <dat basename>.dfn)\n"
    "  --title TEXT            Dataset title (default: dat file name)\n"
    "  --keywords TEXT         Comma separated ACDD keywords\n"
    "  --crs NAME|WKT          GDA94, GDA2020, WGS84 or WKT (default: GDA94)\n"
    "  --line-field NAME       Line number field (default: line)\n"
    "  --lon-field NAME        Longitude field (default: auto detect)\n"
    "  --lat-field NAME        Latitude field (default: auto detect)\n"
    "  --deflate 0-9           Compression level (default: 4)\n"
    "  --chunk-size N          Chunk length along point (default: 1024)\n"
    "  --no-reduce             Keep datatypes implied by the formats\n\n"

    "Other options:\n"
    "  --threads N             Number of threads (default: 1)\n"
    "  --log FILE              Write log output to FILE\n"
    "  --verbose               Debug output\n";
}

void print_export_help()
{
    cerr <<
    "Usage:\n"
    "  asegnc export --nc FILE --out FILE [options]\n\n"

    "Description:\n"
    "  Export the point variables of a NetCDF file to ASEG-GDF.\n\n"

    "Required arguments:\n"
    "  --nc FILE               Input NetCDF file\n"
    "  --out FILE              Output data file (txt or .gz)\n\n"

    "Optional arguments:\n"
    "  --dfn FILE              Definition file (default: <out basename>.dfn)\n"
    "  --decimal-places N      Fractional digits for floating point fields\n\n"

    "Other options:\n"
    "  --threads N\n"
    "  --log FILE\n"
    "  --verbose\n";
}

void print_info_help()
{
    cerr <<
    "Usage:\n"
    "  asegnc info --dfn FILE\n\n"

    "Description:\n"
    "  Print the decoded field table of an ASEG-GDF definition file.\n\n"

    "Other options:\n"
    "  --log FILE\n"
    "  --verbose\n";
}

// ------------------------- convert ------------------------------
Args_Convert parse_args_convert(int argc, char* argv[])
{
    map<string,string> args;
    vector<string> positional;
    collect_args(argc, argv, convert_params, 2, print_convert_help, args, positional);

    Args_Convert P;
    parse_common(P, args);

    // <input.dat> <output.nc> or --dat/--out
    if (positional.size() > 0) P.dat_file = positional[0];
    if (positional.size() > 1) P.out_file = positional[1];
    if (args.count("--dat")) P.dat_file = args["--dat"];
    if (args.count("--out")) P.out_file = args["--out"];

    require(!P.dat_file.empty(), "Missing required: input data file (--dat)");
    require(!P.out_file.empty(), "Missing required: output NetCDF file (--out)");

    if (args.count("--dfn"))        P.dfn_file   = args["--dfn"];
    if (args.count("--title"))      P.title      = args["--title"];
    if (args.count("--keywords"))   P.keywords   = args["--keywords"];
    if (args.count("--crs"))        P.crs        = args["--crs"];
    if (args.count("--line-field")) P.line_field = args["--line-field"];
    if (args.count("--lon-field"))  P.lon_field  = args["--lon-field"];
    if (args.count("--lat-field"))  P.lat_field  = args["--lat-field"];

    if (args.count("--deflate"))
        P.deflate = parse_int_arg(args, "--deflate", 0, 9);
    if (args.count("--chunk-size"))
        P.chunk_size = (size_t)parse_int_arg(args, "--chunk-size", 1, 1 << 24);

    P.reduce_precision = !args.count("--no-reduce");

    require(P.dat_file != P.out_file, "Input and output files must differ.");
    return P;
}

// ------------------------- export ------------------------------
Args_Export parse_args_export(int argc, char* argv[])
{
    map<string,string> args;
    vector<string> positional;
    collect_args(argc, argv, export_params, 2, print_export_help, args, positional);

    Args_Export P;
    parse_common(P, args);

    if (positional.size() > 0) P.nc_file  = positional[0];
    if (positional.size() > 1) P.out_file = positional[1];
    if (args.count("--nc"))  P.nc_file  = args["--nc"];
    if (args.count("--out")) P.out_file = args["--out"];
    if (args.count("--dfn")) P.dfn_file = args["--dfn"];

    require(!P.nc_file.empty(),  "Missing required: --nc");
    require(!P.out_file.empty(), "Missing required: --out");

    if (args.count("--decimal-places"))
        P.decimal_places = parse_int_arg(args, "--decimal-places", 0, 20);

    return P;
}

// ------------------------- info ------------------------------
Args_Info parse_args_info(int argc, char* argv[])
{
    map<string,string> args;
    vector<string> positional;
    collect_args(argc, argv, info_params, 1, print_info_help, args, positional);

    Args_Info P;
    parse_common(P, args);

    if (!positional.empty()) P.dfn_file = positional[0];
    if (args.count("--dfn")) P.dfn_file = args["--dfn"];

    require(!P.dfn_file.empty(), "Missing required: --dfn");
    return P;
}
