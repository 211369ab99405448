//
//  precision.hpp
//  asegnc
//
//  Datatype reduction for over-specified ASEG-GDF formats. Values are
//  copied to smaller representations and the difference with the
//  source value is checked against the precision of the declared number of
//  fractional digits.
//

#ifndef ASEGNC_PRECISION_HPP
#define ASEGNC_PRECISION_HPP

#include "aseg/AsegFormat.hpp"

#include <cstdint>
#include <optional>
#include <vector>

struct PrecisionFix {
    FieldFormat format;                 // format.dtype is the reduced type
    std::optional<double> fill_value;   // possibly modified fill value
};

// Floating point values (float64 or float32 current_dtype).
// Returns nullopt when no smaller type keeps the precision, or when the
// reduced fill value would be ambiguous with valid data.
std::optional<PrecisionFix> fix_field_precision(const std::vector<double>& values,
                                                DataType current_dtype,
                                                int fractional_digits,
                                                int columns = 1,
                                                std::optional<double> fill_value = std::nullopt);

// Floating point values of an exponent (E) format, where the fractional
// digits count significant figures after the first one. float32 is taken
// when every value is in range and keeps fractional_digits + 1 figures.
std::optional<PrecisionFix> fix_exponent_precision(const std::vector<double>& values,
                                                   DataType current_dtype,
                                                   int fractional_digits,
                                                   int columns = 1,
                                                   std::optional<double> fill_value = std::nullopt);

// Integer values: smallest type whose range holds every value and the fill.
std::optional<PrecisionFix> fix_field_precision(const std::vector<int64_t>& values,
                                                DataType current_dtype,
                                                int columns = 1,
                                                std::optional<int64_t> fill_value = std::nullopt);

#endif
