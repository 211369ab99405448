//
//  AsegFormat.cpp
//  asegnc
//

#include "aseg/AsegFormat.hpp"
#include "utils/log.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <regex>
#include <stdexcept>

using namespace std;

// Types tried in order when choosing the smallest fit
static const DataType INT_TYPES[]   = {DataType::INT8, DataType::INT16, DataType::INT32, DataType::INT64};
static const DataType FLOAT_TYPES[] = {DataType::FLOAT32, DataType::FLOAT64};

const char* dtype_name(DataType t)
{
    switch (t) {
        case DataType::INT8:    return "int8";
        case DataType::INT16:   return "int16";
        case DataType::INT32:   return "int32";
        case DataType::INT64:   return "int64";
        case DataType::FLOAT32: return "float32";
        case DataType::FLOAT64: return "float64";
        case DataType::STRING:  return "str";
    }
    return "unknown";
}

bool is_integer(DataType t)
{
    return t == DataType::INT8 || t == DataType::INT16 ||
           t == DataType::INT32 || t == DataType::INT64;
}

bool is_float(DataType t)
{
    return t == DataType::FLOAT32 || t == DataType::FLOAT64;
}

int sig_figs(DataType t)
{
    switch (t) {
        case DataType::INT8:    return 2;    // 128
        case DataType::INT16:   return 4;    // 32768
        case DataType::INT32:   return 10;   // 2147483648, one more than safe so I10 still fits int32
        case DataType::INT64:   return 19;   // 9223372036854775808
        case DataType::FLOAT32: return 7;    // 7.2
        case DataType::FLOAT64: return 20;   // 15.9, raised to accept over-specified formats
        case DataType::STRING:  return 0;
    }
    return 0;
}

char aseg_dtype_code(DataType t)
{
    if (is_integer(t)) return 'I';
    if (t == DataType::FLOAT32) return 'F';
    if (t == DataType::FLOAT64) return 'D';
    return 'A';
}

double default_fill(DataType t)
{
    switch (t) {
        case DataType::INT8:    return -127.0;
        case DataType::INT16:   return -32767.0;
        case DataType::INT32:   return -2147483647.0;
        case DataType::INT64:   return -9223372036854775806.0;
        case DataType::FLOAT32: return 9.9692099683868690e+36;
        case DataType::FLOAT64: return 9.9692099683868690e+36;
        case DataType::STRING:  return 0.0;
    }
    return 0.0;
}

AsegFormat decode_aseg_format(const string& aseg_gdf_format)
{
    if (aseg_gdf_format.empty()) {
        throw runtime_error("No ASEG-GDF format string to decode");
    }

    static const regex re(R"((\d+)*(\w)(\d+)\.*(\d+)*)");
    smatch m;
    if (!regex_search(aseg_gdf_format, m, re, regex_constants::match_continuous)) {
        throw runtime_error("Invalid ASEG-GDF format string " + aseg_gdf_format);
    }

    AsegFormat fmt;
    fmt.columns           = m[1].matched ? stoi(m[1].str()) : 1;
    fmt.code              = (char)toupper((unsigned char)m[2].str()[0]);
    fmt.integer_digits    = stoi(m[3].str());
    fmt.fractional_digits = m[4].matched ? stoi(m[4].str()) : 0;

    if (fmt.columns < 1) {
        throw runtime_error("Invalid column count in ASEG-GDF format string " + aseg_gdf_format);
    }

    LOG_DEBUG("aseg_gdf_format: " + aseg_gdf_format +
              ", columns: " + to_string(fmt.columns) +
              ", aseg_dtype_code: " + string(1, fmt.code) +
              ", integer_digits: " + to_string(fmt.integer_digits) +
              ", fractional_digits: " + to_string(fmt.fractional_digits));
    return fmt;
}

DataType aseg_format_to_dtype(const AsegFormat& fmt)
{
    if (fmt.code == 'I') {
        if (fmt.fractional_digits) {
            throw runtime_error("Integer format cannot be defined with fractional digits");
        }
        for (DataType t : INT_TYPES) {
            if (sig_figs(t) >= fmt.integer_digits) return t;
        }
        throw runtime_error("Invalid integer length of " + to_string(fmt.integer_digits));
    }

    if (fmt.code == 'D' || fmt.code == 'E' || fmt.code == 'F') {
        for (DataType t : FLOAT_TYPES) {
            if (sig_figs(t) >= fmt.integer_digits + fmt.fractional_digits) return t;
        }
        throw runtime_error("Invalid floating point format of " +
                            to_string(fmt.integer_digits) + "." +
                            to_string(fmt.fractional_digits));
    }

    if (fmt.code == 'A') {
        if (fmt.fractional_digits) {
            throw runtime_error("String format cannot be defined with fractional digits");
        }
        return DataType::STRING;
    }

    throw runtime_error(string("Unhandled ASEG-GDF dtype code ") + fmt.code);
}

DataType aseg_format_to_dtype(const string& aseg_gdf_format)
{
    return aseg_format_to_dtype(decode_aseg_format(aseg_gdf_format));
}

int columns_from_shape(const vector<size_t>& dims)
{
    if (dims.size() == 1) return 1;
    if (dims.size() == 2) return (int)dims[1];
    throw runtime_error("Unable to handle arrays with dimensionality > 2");
}

// ---------------------------------------------------------------
// output formatting
// ---------------------------------------------------------------

static string format_number(const FieldFormat& ff, double v, int width)
{
    char buf[512];
    if (is_integer(ff.dtype)) {
        snprintf(buf, sizeof(buf), "%*lld", width, (long long)llround(v));
    } else {
        snprintf(buf, sizeof(buf), "%*.*f", width, ff.fractional_digits, v);
    }
    return buf;
}

string FieldFormat::format_value(double v) const
{
    string out = format_number(*this, v, width);
    if (fill_value && v == *fill_value && out.size() > (size_t)width) {
        return string((size_t)width, ' ');
    }
    return out;
}

string FieldFormat::format_value(int64_t v) const
{
    if (!is_integer(dtype)) return format_value((double)v);

    char buf[64];
    snprintf(buf, sizeof(buf), "%*lld", width, (long long)v);
    string out = buf;
    if (fill_value && (double)v == *fill_value && out.size() > (size_t)width) {
        return string((size_t)width, ' ');
    }
    return out;
}

string FieldFormat::null_text(double fill) const
{
    return format_number(*this, fill, 0);
}

string FieldFormat::format_string(const string& s) const
{
    string out = s.substr(0, (size_t)width);
    out.resize((size_t)width, ' ');
    return out;
}

FieldFormat variable_to_aseg_format(const vector<double>& values,
                                    DataType dtype,
                                    int columns,
                                    optional<int> decimal_places,
                                    const string& stored_format,
                                    optional<double> fill_value)
{
    if (dtype == DataType::STRING) {
        return string_variable_to_aseg_format(columns, stored_format);
    }

    FieldFormat ff;
    ff.dtype   = dtype;
    ff.columns = columns;
    ff.fill_value = fill_value;

    double vmin = numeric_limits<double>::infinity();
    double vmax_abs = 0.0;
    for (double v : values) {
        if (std::isnan(v)) continue;
        if (fill_value && v == *fill_value) continue;
        vmin = min(vmin, v);
        vmax_abs = max(vmax_abs, fabs(v));
    }

    int figs = sig_figs(dtype) + 1;
    ff.sign_width = (vmin < 0) ? 1 : 0;
    ff.integer_digits = max(1, (int)ceil(log10(vmax_abs + 1.0)));

    if (is_integer(dtype)) {
        ff.fractional_digits = 0;
        ff.width = ff.sign_width + ff.integer_digits + 1;
        ff.aseg_format = "I" + to_string(ff.width);
    } else {
        if (decimal_places) {
            ff.fractional_digits = min(*decimal_places, figs - ff.integer_digits);
            LOG_DEBUG("fractional_digits set to " + to_string(ff.fractional_digits) +
                      " from decimal_places " + to_string(*decimal_places));
        } else if (!stored_format.empty()) {
            AsegFormat stored = decode_aseg_format(stored_format);
            ff.fractional_digits = min(stored.fractional_digits, figs - ff.integer_digits + 1);
            LOG_DEBUG("fractional_digits set to " + to_string(ff.fractional_digits) +
                      " from variable attribute aseg_gdf_format " + stored_format);
        } else {
            ff.fractional_digits = figs - ff.integer_digits + 1;
            LOG_DEBUG("fractional_digits set to " + to_string(ff.fractional_digits) +
                      " from sig_figs " + to_string(figs) +
                      " and integer_digits " + to_string(ff.integer_digits));
        }
        ff.fractional_digits = max(0, ff.fractional_digits);

        // sign + integer part + decimal point + fraction + separator
        ff.width = ff.sign_width + ff.integer_digits + 1 + ff.fractional_digits + 1;
        ff.aseg_format = string(1, aseg_dtype_code(dtype)) + to_string(ff.width) +
                         "." + to_string(ff.fractional_digits);
    }

    if (columns > 1) {
        ff.aseg_format = to_string(columns) + ff.aseg_format;
    }
    return ff;
}

FieldFormat string_variable_to_aseg_format(int columns, const string& stored_format)
{
    FieldFormat ff;
    ff.dtype   = DataType::STRING;
    ff.columns = columns;

    if (!stored_format.empty()) {
        AsegFormat stored = decode_aseg_format(stored_format);
        ff.integer_digits = stored.integer_digits;
    } else {
        ff.integer_digits = 40;
    }
    ff.fractional_digits = 0;
    ff.width = ff.integer_digits;
    ff.aseg_format = "A" + to_string(ff.width);
    if (columns > 1) {
        ff.aseg_format = to_string(columns) + ff.aseg_format;
    }
    return ff;
}
