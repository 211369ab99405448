//
//  export.hpp
//  asegnc
//

#ifndef ASEGNC_EXPORT_HPP
#define ASEGNC_EXPORT_HPP

#include "utils/args.hpp"
#include "aseg/AsegFormat.hpp"

#include <optional>
#include <string>
#include <vector>

// one output field gathered from a NetCDF point variable
struct ExportField {
    std::string name;           // ASEG-GDF field name
    std::string short_name;     // NetCDF variable name
    std::string long_name;
    std::string units;
    std::optional<double> fill_value;

    FieldFormat format;
    std::vector<double>      values;    // numeric data, row-major [point][column]
    std::vector<std::string> strings;
};

// DEFN lines for the fields, including the COMM record and END DEFN
std::vector<std::string> make_dfn_lines(const std::vector<ExportField>& fields);

// one fixed-width data record
std::string make_dat_record(const std::vector<ExportField>& fields, size_t point);

void run_export(const Args_Export& P);

#endif
