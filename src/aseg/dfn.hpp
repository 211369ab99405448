//
//  dfn.hpp
//  asegnc
//
//  ASEG-GDF definition (.dfn) file parser. A definition line looks like
//
//      DEFN 3 ST=RECD,RT=;EASTING:F12.2:UNITS=m,NULL=-99999.99,Easting
//
//  Fields of RT= (or RT=DATA) make up the data record. Other record types
//  (COMM, PROJ, ...) describe non-data lines of the .dat file.
//

#ifndef ASEGNC_DFN_HPP
#define ASEGNC_DFN_HPP

#include "aseg/AsegFormat.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

struct FieldDef {
    std::string name;           // ASEG-GDF field name as declared
    std::string format;         // format string as declared
    AsegFormat  decoded;

    std::string short_name;     // NetCDF variable name
    std::string long_name;
    std::string units;
    std::string description;    // free text items of the definition

    std::optional<std::string> null_text;
    std::optional<double> null_value;

    // remaining KEY=VALUE items, keys lower-cased
    std::vector<std::pair<std::string, std::string>> attributes;

    int  offset = 0;            // character offset within the record
    bool is_record_type = false;    // the RT marker field

    int width() const { return decoded.total_width(); }
};

struct RecordDef {
    std::string record_type;    // "" for plain data records
    std::vector<FieldDef> fields;
    int width = 0;

    // value of the RT marker expected at the start of each line, "" if none
    std::string marker() const;
};

struct DfnDefinition {
    std::string path;
    RecordDef data;
    std::vector<RecordDef> others;

    const RecordDef* find_record(const std::string& record_type) const;

    // by ASEG-GDF name or variable name, case-insensitive
    const FieldDef* find_field(const std::string& name) const;
};

DfnDefinition parse_dfn(const std::string& path);
DfnDefinition parse_dfn_lines(const std::vector<std::string>& lines,
                              const std::string& source = "<memory>");

// valid NetCDF identifier: [A-Za-z_][A-Za-z0-9_]*
std::string sanitize_name(const std::string& name);

#endif
