//
//  AsegFormat.hpp
//  asegnc
//
//  ASEG-GDF format strings, e.g. "I10", "F12.3", "30E12.4", "A4".
//  Refer to ASEG-GDF2 Rev 4 for the full format description.
//

#ifndef ASEGNC_ASEGFORMAT_HPP
#define ASEGNC_ASEGFORMAT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class DataType : uint8_t {
    INT8, INT16, INT32, INT64, FLOAT32, FLOAT64, STRING
};

const char* dtype_name(DataType t);
bool is_integer(DataType t);
bool is_float(DataType t);

// approximate maximum number of significant decimal figures
int sig_figs(DataType t);

// ASEG-GDF dtype character used when writing: I, F, D or A
char aseg_dtype_code(DataType t);

// NetCDF default fill values for each type
double default_fill(DataType t);

struct AsegFormat {
    int  columns           = 1;     // >1 for 2D fields, e.g. 30 in "30E12.4"
    char code              = 'F';   // I, F, E, D or A (upper case)
    int  integer_digits    = 0;     // width figure, 12 in "F12.3"
    int  fractional_digits = 0;     // 3 in "F12.3"

    int width() const { return integer_digits; }
    int total_width() const { return columns * integer_digits; }
};

// throws std::runtime_error on empty or invalid strings
AsegFormat decode_aseg_format(const std::string& aseg_gdf_format);

// smallest type that can hold the declared significant figures
DataType aseg_format_to_dtype(const AsegFormat& fmt);
DataType aseg_format_to_dtype(const std::string& aseg_gdf_format);

// Output layout derived from data. width counts every character of one
// value including one leading separator space, and is also the width
// figure in aseg_format.
struct FieldFormat {
    std::string aseg_format;
    DataType dtype = DataType::FLOAT64;
    int columns = 1;
    int integer_digits = 0;
    int fractional_digits = 0;
    int sign_width = 0;
    int width = 0;
    std::optional<double> fill_value;

    // the fill value is written blank when it does not fit the width
    std::string format_value(double v) const;
    std::string format_value(int64_t v) const;
    std::string format_string(const std::string& s) const;

    // NULL text for the definition file, never clipped
    std::string null_text(double fill) const;
};

// Derive an ASEG-GDF format from values of a 1D (columns == 1) or 2D
// array. Values equal to fill_value do not count towards the width.
//   decimal_places: number of decimal places to respect, overrides all
//   stored_format : aseg_gdf_format attribute of a NetCDF variable, or ""
FieldFormat variable_to_aseg_format(const std::vector<double>& values,
                                    DataType dtype,
                                    int columns,
                                    std::optional<int> decimal_places = std::nullopt,
                                    const std::string& stored_format = "",
                                    std::optional<double> fill_value = std::nullopt);

FieldFormat string_variable_to_aseg_format(int columns,
                                           const std::string& stored_format = "");

// dims: shape of the source array; more than two dimensions is an error
int columns_from_shape(const std::vector<size_t>& dims);

#endif
