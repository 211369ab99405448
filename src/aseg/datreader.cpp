//
//  datreader.cpp
//  asegnc
//

#include "aseg/datreader.hpp"
#include "utils/linereader.hpp"
#include "utils/util.hpp"
#include "utils/log.hpp"

#include <cmath>
#include <stdexcept>
#include <string_view>

#ifdef _OPENMP
#include <omp.h>
#endif

using namespace std;

size_t Column::size() const
{
    if (dtype == DataType::STRING) return strings.size();
    if (is_integer(dtype)) return ints.size();
    return values.size();
}

double Column::at(size_t i) const
{
    if (is_integer(dtype)) return (double)ints[i];
    return values[i];
}

static size_t column_index(const vector<Column>& columns, const string& name)
{
    for (size_t i = 0; i < columns.size(); ++i) {
        const FieldDef& def = columns[i].def;
        if (iequals(def.short_name, name) || iequals(def.name, name)) return i;
    }
    return columns.size();
}

Column* Dataset::find(const string& name)
{
    size_t i = column_index(columns, name);
    return i < columns.size() ? &columns[i] : nullptr;
}

const Column* Dataset::find(const string& name) const
{
    size_t i = column_index(columns, name);
    return i < columns.size() ? &columns[i] : nullptr;
}

// substring of a fixed-width line, clipped at the line end
static inline string_view field_text(string_view line, int offset, int width, bool& truncated)
{
    truncated = false;
    if ((size_t)offset >= line.size()) { truncated = true; return {}; }
    size_t len = (size_t)width;
    if ((size_t)offset + len > line.size()) {
        len = line.size() - (size_t)offset;
        truncated = true;
    }
    return line.substr((size_t)offset, len);
}

static bool line_has_prefix(const string& line, const string& prefix)
{
    return !prefix.empty() && line.size() >= prefix.size() &&
           iequals(string_view(line).substr(0, prefix.size()), prefix);
}

Dataset read_dat_lines(const vector<string>& lines, const DfnDefinition& dfn, const string& source)
{
    Dataset ds;
    const RecordDef& rec = dfn.data;
    const string marker = rec.marker();

    // ---- classify lines: data, comments, other records ----
    vector<size_t> data_idx;
    data_idx.reserve(lines.size());
    size_t skipped = 0;

    for (size_t i = 0; i < lines.size(); ++i) {
        const string& line = lines[i];
        if (trim_ws(line).empty()) continue;

        if (marker != "COMM" && line_has_prefix(line, "COMM")) {
            ds.comments.push_back(trim(line.substr(4)));
            continue;
        }

        const RecordDef* other = nullptr;
        for (const auto& r : dfn.others) {
            if (r.record_type != "COMM" && line_has_prefix(line, r.record_type)) { other = &r; break; }
        }
        if (other && !line_has_prefix(line, marker)) {
            vector<pair<string, string>> vals;
            for (const auto& f : other->fields) {
                if (f.is_record_type) continue;
                bool truncated;
                vals.emplace_back(f.name, trim(string(field_text(line, f.offset, f.width(), truncated))));
            }
            ds.records.emplace_back(other->record_type, std::move(vals));
            continue;
        }

        if (!marker.empty() && !line_has_prefix(line, marker)) {
            ++skipped;
            continue;
        }
        data_idx.push_back(i);
    }

    if (skipped) {
        LOG_WARN("Skipped " + to_string(skipped) + " lines without record type " + marker + " in " + source);
    }

    const size_t n = data_idx.size();
    ds.points = n;

    // ---- allocate columns ----
    for (const auto& f : rec.fields) {
        if (f.is_record_type) continue;

        Column c;
        c.def     = f;
        c.dtype   = aseg_format_to_dtype(f.decoded);
        c.columns = f.decoded.columns;

        const size_t total = n * (size_t)c.columns;
        if (c.dtype == DataType::STRING)  c.strings.resize(total);
        else if (is_integer(c.dtype))     c.ints.resize(total);
        else                              c.values.resize(total);

        ds.columns.push_back(std::move(c));
    }

    // ---- parse records ----
    long first_bad = -1;
    string bad_msg;

#ifdef _OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (long i = 0; i < (long)n; ++i) {
        string_view line(lines[data_idx[i]]);

        for (auto& c : ds.columns) {
            const FieldDef& f = c.def;
            const int w = f.decoded.width();
            const double fill = f.null_value ? *f.null_value : default_fill(c.dtype);

            for (int k = 0; k < c.columns; ++k) {
                const size_t slot = (size_t)i * (size_t)c.columns + (size_t)k;
                bool truncated;
                string_view txt = trim_ws(field_text(line, f.offset + k * w, w, truncated));

                if (c.dtype == DataType::STRING) {
                    c.strings[slot].assign(txt.data(), txt.size());
                    continue;
                }

                if (txt.empty()) {
                    if (is_integer(c.dtype)) c.ints[slot] = (int64_t)llround(fill);
                    else                     c.values[slot] = fill;
#ifdef _OPENMP
                    #pragma omp atomic
#endif
                    ++c.missing;
                    continue;
                }

                bool ok;
                if (is_integer(c.dtype)) ok = parse_int64_strict(txt, c.ints[slot]);
                else                     ok = parse_double_strict(txt, c.values[slot]);

                if (!ok) {
#ifdef _OPENMP
                    #pragma omp critical(asegnc_bad_value)
#endif
                    {
                        if (first_bad < 0 || i < first_bad) {
                            first_bad = i;
                            bad_msg = "Invalid value '" + string(txt) + "' for field " + f.name +
                                      " (" + source + ":" + to_string(data_idx[i] + 1) + ")";
                        }
                    }
                }
            }
        }
    }

    if (first_bad >= 0) {
        throw runtime_error(bad_msg);
    }

    for (auto& c : ds.columns) {
        if (c.def.null_value) {
            c.fill_value = *c.def.null_value;
        } else if (c.missing && c.dtype != DataType::STRING) {
            c.fill_value = default_fill(c.dtype);
            LOG_WARN("Field " + c.def.name + " has " + to_string(c.missing) +
                     " blank values and no NULL definition, using default fill value");
        }
    }

    LOG_INFO("Read " + to_string(n) + " data records from " + source);
    return ds;
}

Dataset read_dat(const string& path, const DfnDefinition& dfn)
{
    LineReader lr(path);
    vector<string> lines;
    string line;
    while (lr.getline(line)) lines.push_back(line);
    return read_dat_lines(lines, dfn, path);
}
