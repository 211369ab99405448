//
//  convert.hpp
//  asegnc
//

#ifndef ASEGNC_CONVERT_HPP
#define ASEGNC_CONVERT_HPP

#include "utils/args.hpp"
#include "aseg/datreader.hpp"

#include <cstdint>
#include <string>
#include <vector>

struct CrsInfo {
    std::string wkt;
    std::string grid_mapping_name;      // empty for projected or unknown WKT
    double semi_major_axis    = 0.0;
    double inverse_flattening = 0.0;
    int epsg = 0;
};

// GDA94, GDA2020, WGS84 (any case) or literal WKT
CrsInfo resolve_crs(const std::string& crs);

// explicit dfn path, else the data path with a .dfn extension
std::string resolve_dfn_path(const std::string& dat_file, const std::string& dfn_file);

// unique line numbers in order of first appearance, and per-point index
struct LineIndex {
    std::vector<double>  lines;
    std::vector<int32_t> index;
};
LineIndex build_line_index(const Column& line_column);

// datatype reduction over all numeric columns, see aseg/precision
void reduce_precision(Dataset& ds);

void write_netcdf(const Dataset& ds, const Args_Convert& P, const std::string& dfn_path);

void run_convert(const Args_Convert& P);

#endif
