//
//  precision.cpp
//  asegnc
//

#include "aseg/precision.hpp"
#include "utils/log.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

using namespace std;

// Reduction lists, largest type first
static const vector<DataType> INT_REDUCTION   = {DataType::INT64, DataType::INT32, DataType::INT16, DataType::INT8};
static const vector<DataType> FLOAT_REDUCTION = {DataType::FLOAT64, DataType::FLOAT32};

// candidates strictly smaller than current, smallest first
static vector<DataType> smaller_types(const vector<DataType>& list, DataType current)
{
    vector<DataType> out;
    auto it = find(list.begin(), list.end(), current);
    if (it == list.end()) return out;
    for (auto r = list.rbegin(); r != list.rend() && *r != current; ++r) {
        out.push_back(*r);
    }
    return out;
}

static void int_range(DataType t, int64_t& lo, int64_t& hi)
{
    switch (t) {
        case DataType::INT8:  lo = numeric_limits<int8_t>::min();  hi = numeric_limits<int8_t>::max();  break;
        case DataType::INT16: lo = numeric_limits<int16_t>::min(); hi = numeric_limits<int16_t>::max(); break;
        case DataType::INT32: lo = numeric_limits<int32_t>::min(); hi = numeric_limits<int32_t>::max(); break;
        default:              lo = numeric_limits<int64_t>::min(); hi = numeric_limits<int64_t>::max(); break;
    }
}

static double to_float32(double v)
{
    return (double)(float)v;
}

optional<PrecisionFix> fix_field_precision(const vector<double>& values,
                                           DataType current_dtype,
                                           int fractional_digits,
                                           int columns,
                                           optional<double> fill_value)
{
    LOG_DEBUG(string("current_dtype: ") + dtype_name(current_dtype) +
              ", fractional_digits: " + to_string(fractional_digits));

    const double tolerance = pow(10.0, -fractional_digits);
    const double float32_max = (double)numeric_limits<float>::max();

    for (DataType smaller : smaller_types(FLOAT_REDUCTION, current_dtype)) {
        // only float32 is below float64
        vector<double> reduced(values.size());
        size_t differences = 0;
        for (size_t i = 0; i < values.size(); ++i) {
            double v = values[i];
            if (fabs(v) > float32_max) { ++differences; break; }
            reduced[i] = to_float32(v);
            if (fabs(v - reduced[i]) >= tolerance) { ++differences; break; }
        }
        if (differences) {
            LOG_DEBUG(string("differences found for ") + dtype_name(smaller) + ", trying larger datatype");
            continue;
        }

        PrecisionFix fix;

        if (fill_value) {
            const double fill = *fill_value;
            if (fabs(fill) > float32_max) {
                LOG_DEBUG("Fill value " + to_string(fill) + " out of float32 range");
                continue;
            }
            bool any_fill = false;
            for (double v : values) {
                if (v == fill) { any_fill = true; break; }
            }

            // reduced fill value must stay distinguishable from data
            double reduced_fill = to_float32(fill);
            if (any_fill) {
                bool ambiguous = false;
                for (size_t i = 0; i < values.size(); ++i) {
                    if (values[i] != fill && reduced[i] == reduced_fill) { ambiguous = true; break; }
                }
                if (ambiguous) {
                    LOG_DEBUG("Reduced precision fill value of " + to_string(reduced_fill) + " is ambiguous");
                    continue;
                }
            }
            fix.fill_value = reduced_fill;

            // truncate rather than round for neater output
            if (fabs(fill) < 1e15) {
                double scale = pow(10.0, fractional_digits);
                double truncated = to_float32(trunc(fill * scale) / scale);
                bool ambiguous = false;
                for (size_t i = 0; i < values.size(); ++i) {
                    if (values[i] != fill && reduced[i] == truncated) { ambiguous = true; break; }
                }
                if (ambiguous) {
                    LOG_INFO("Unable to truncate fill value to " + to_string(fractional_digits) +
                             " decimal places: truncated fill value of " + to_string(truncated) +
                             " is ambiguous");
                } else {
                    fix.fill_value = truncated;
                }
            }
        }
        if (fix.fill_value) {
            for (size_t i = 0; i < values.size(); ++i) {
                if (values[i] == *fill_value) reduced[i] = *fix.fill_value;
            }
        }
        fix.format = variable_to_aseg_format(reduced, smaller, columns, fractional_digits, "",
                                             fix.fill_value);
        return fix;
    }
    return nullopt;
}

optional<PrecisionFix> fix_exponent_precision(const vector<double>& values,
                                              DataType current_dtype,
                                              int fractional_digits,
                                              int columns,
                                              optional<double> fill_value)
{
    LOG_DEBUG(string("current_dtype: ") + dtype_name(current_dtype) +
              ", significant digits: " + to_string(fractional_digits + 1));

    // mantissa digit plus the fractional digits
    const int significant = fractional_digits + 1;
    if (current_dtype != DataType::FLOAT64 || significant > sig_figs(DataType::FLOAT32)) {
        return nullopt;
    }

    const double tolerance = pow(10.0, -significant);
    const double float32_max = (double)numeric_limits<float>::max();

    vector<double> reduced(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        const double v = values[i];
        if (fill_value && v == *fill_value) {
            reduced[i] = v;
            continue;
        }
        if (!std::isfinite(v) || fabs(v) > float32_max) {
            LOG_DEBUG("Value " + to_string(v) + " out of float32 range");
            return nullopt;
        }
        reduced[i] = to_float32(v);
        if (v != 0.0 && fabs(v - reduced[i]) >= tolerance * fabs(v)) {
            LOG_DEBUG("Value " + to_string(v) + " loses significant digits in float32");
            return nullopt;
        }
    }

    PrecisionFix fix;
    if (fill_value) {
        const double fill = *fill_value;
        if (!std::isfinite(fill) || fabs(fill) > float32_max) {
            LOG_DEBUG("Fill value " + to_string(fill) + " out of float32 range");
            return nullopt;
        }
        const double reduced_fill = to_float32(fill);
        for (size_t i = 0; i < values.size(); ++i) {
            if (values[i] != fill && reduced[i] == reduced_fill) {
                LOG_DEBUG("Reduced precision fill value of " + to_string(reduced_fill) + " is ambiguous");
                return nullopt;
            }
        }
        for (size_t i = 0; i < values.size(); ++i) {
            if (values[i] == fill) reduced[i] = reduced_fill;
        }
        fix.fill_value = reduced_fill;
    }

    fix.format = variable_to_aseg_format(reduced, DataType::FLOAT32, columns, nullopt, "", fix.fill_value);
    return fix;
}

optional<PrecisionFix> fix_field_precision(const vector<int64_t>& values,
                                           DataType current_dtype,
                                           int columns,
                                           optional<int64_t> fill_value)
{
    LOG_DEBUG(string("current_dtype: ") + dtype_name(current_dtype));

    if (values.empty() && !fill_value) return nullopt;

    int64_t vmin = numeric_limits<int64_t>::max();
    int64_t vmax = numeric_limits<int64_t>::min();
    for (int64_t v : values) {
        vmin = min(vmin, v);
        vmax = max(vmax, v);
    }
    if (fill_value) {
        vmin = min(vmin, *fill_value);
        vmax = max(vmax, *fill_value);
    }

    for (DataType smaller : smaller_types(INT_REDUCTION, current_dtype)) {
        int64_t lo, hi;
        int_range(smaller, lo, hi);
        if (vmin < lo || vmax > hi) continue;

        vector<double> as_double(values.begin(), values.end());
        PrecisionFix fix;
        if (fill_value) fix.fill_value = (double)*fill_value;
        fix.format = variable_to_aseg_format(as_double, smaller, columns, nullopt, "", fix.fill_value);
        return fix;
    }
    return nullopt;
}
