//
//  datreader.hpp
//  asegnc
//
//  Fixed-width ASEG-GDF data (.dat / .dat.gz) reader. Values are held
//  column-wise; multi-column fields are stored row-major [point][column].
//

#ifndef ASEGNC_DATREADER_HPP
#define ASEGNC_DATREADER_HPP

#include "aseg/dfn.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct Column {
    FieldDef def;
    DataType dtype = DataType::FLOAT64;
    int columns = 1;

    std::vector<double>      values;    // floating point fields
    std::vector<int64_t>     ints;      // integer fields
    std::vector<std::string> strings;   // text fields

    std::optional<double> fill_value;   // NULL value, or default fill if blanks were read
    size_t missing = 0;                 // blank or truncated values

    size_t size() const;
    // value i as double regardless of storage (not for strings)
    double at(size_t i) const;
};

struct Dataset {
    size_t points = 0;
    std::vector<Column> columns;
    std::vector<std::string> comments;

    // values of other record types: (record type, [(field, value)])
    std::vector<std::pair<std::string, std::vector<std::pair<std::string, std::string>>>> records;

    Column* find(const std::string& name);
    const Column* find(const std::string& name) const;
};

Dataset read_dat(const std::string& path, const DfnDefinition& dfn);
Dataset read_dat_lines(const std::vector<std::string>& lines,
                       const DfnDefinition& dfn,
                       const std::string& source = "<memory>");

#endif
