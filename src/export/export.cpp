//
//  export.cpp
//  asegnc
//

#include "export/export.hpp"

#include "netcdf/ncfile.hpp"
#include "utils/writer.hpp"
#include "utils/util.hpp"
#include "utils/log.hpp"

#include <stdexcept>

using namespace std;

// ',' and ';' separate items in a DEFN line
static string dfn_safe(const string& s)
{
    string out = s;
    for (auto& c : out) {
        if (c == ',' || c == ';' || c == '\n' || c == '\r') c = ' ';
    }
    return trim(out);
}

vector<string> make_dfn_lines(const vector<ExportField>& fields)
{
    vector<string> lines;
    lines.push_back("DEFN   ST=RECD,RT=COMM;RT:A4;COMMENTS:A76");

    int seq = 1;
    for (const auto& f : fields) {
        string line = "DEFN " + to_string(seq++) + " ST=RECD,RT=;" +
                      to_upper(f.name) + ":" + f.format.aseg_format;

        vector<string> attrs;
        attrs.push_back("NAME=" + f.short_name);
        if (!f.units.empty())     attrs.push_back("UNITS=" + dfn_safe(f.units));
        if (f.fill_value && f.format.dtype != DataType::STRING)
            attrs.push_back("NULL=" + f.format.null_text(*f.fill_value));
        if (!f.long_name.empty()) attrs.push_back("LONG_NAME=" + dfn_safe(f.long_name));

        line += ":";
        for (size_t i = 0; i < attrs.size(); ++i) {
            if (i) line += ",";
            line += attrs[i];
        }
        lines.push_back(line);
    }

    lines.push_back("DEFN " + to_string(seq) + " ST=RECD,RT=;END DEFN");
    return lines;
}

string make_dat_record(const vector<ExportField>& fields, size_t point)
{
    string rec;
    rec.reserve(256);
    for (const auto& f : fields) {
        const size_t base = point * (size_t)f.format.columns;
        for (int k = 0; k < f.format.columns; ++k) {
            if (f.format.dtype == DataType::STRING) rec += f.format.format_string(f.strings[base + k]);
            else                                    rec += f.format.format_value(f.values[base + k]);
        }
    }
    return rec;
}

// ---------------------------------------------------------------
// NetCDF -> fields
// ---------------------------------------------------------------

static ExportField gather_field(const NcFile& nc, const NcVarInfo& v, const Args_Export& P)
{
    ExportField f;
    f.short_name = v.name;
    f.name       = nc.get_att_text(v.id, "aseg_gdf_name").value_or(to_upper(v.name));
    f.long_name  = nc.get_att_text(v.id, "long_name").value_or("");
    f.units      = nc.get_att_text(v.id, "units").value_or("");
    f.fill_value = nc.get_att_double(v.id, "_FillValue");

    const string stored = nc.get_att_text(v.id, "aseg_gdf_format").value_or("");
    const DataType dtype = from_nc_type(v.type);

    if (dtype == DataType::STRING) {
        // NC_CHAR keeps its string length in the last dimension
        vector<size_t> shape = v.shape;
        if (v.type == NC_CHAR) shape.pop_back();
        const int columns = columns_from_shape(shape);
        f.strings = nc.get_var_strings(v.id);
        f.format  = string_variable_to_aseg_format(columns, stored);
        return f;
    }

    const int columns = columns_from_shape(v.shape);
    if (is_integer(dtype)) {
        vector<int64_t> ints = nc.get_var_int64(v.id);
        f.values.assign(ints.begin(), ints.end());
    } else {
        f.values = nc.get_var_double(v.id);
    }
    f.format = variable_to_aseg_format(f.values, dtype, columns, P.decimal_places, stored, f.fill_value);
    return f;
}

// line[line_index] for every point
static ExportField gather_line_field(const NcFile& nc, int line_varid, int index_varid, const Args_Export& P)
{
    NcVarInfo lv = nc.var_info(line_varid);
    ExportField f = gather_field(nc, lv, P);

    vector<int64_t> index = nc.get_var_int64(index_varid);
    vector<double> per_point(index.size());
    for (size_t i = 0; i < index.size(); ++i) {
        if (index[i] < 0 || (size_t)index[i] >= f.values.size()) {
            throw runtime_error("line_index out of range at point " + to_string(i));
        }
        per_point[i] = f.values[(size_t)index[i]];
    }
    f.values = std::move(per_point);
    f.format = variable_to_aseg_format(f.values, from_nc_type(lv.type), 1, P.decimal_places,
                                       nc.get_att_text(line_varid, "aseg_gdf_format").value_or(""),
                                       f.fill_value);
    return f;
}

void run_export(const Args_Export& P)
{
    NcFile nc = NcFile::open(P.nc_file);

    auto point_dim = nc.dim_id("point");
    if (!point_dim) {
        throw runtime_error("No point dimension in " + P.nc_file);
    }
    const size_t points = nc.dim_len(*point_dim);

    vector<ExportField> fields;

    auto line_varid  = nc.var_id("line");
    auto index_varid = nc.var_id("line_index");
    if (line_varid && index_varid) {
        fields.push_back(gather_line_field(nc, *line_varid, *index_varid, P));
    }

    for (const auto& v : nc.variables()) {
        if (v.dimids.empty() || v.dimids[0] != *point_dim) continue;
        if (v.name == "line_index" && line_varid) continue;

        const size_t max_dims = (v.type == NC_CHAR) ? 3 : 2;
        if (v.dimids.size() > max_dims) {
            LOG_WARN("Skipping variable " + v.name + " with more than two dimensions");
            continue;
        }
        fields.push_back(gather_field(nc, v, P));
        LOG_DEBUG("Exporting " + v.name + " as " + fields.back().format.aseg_format);
    }

    if (fields.empty()) {
        throw runtime_error("No point variables to export in " + P.nc_file);
    }

    // ---- .dfn ----
    const string dfn_path = P.dfn_file.empty() ? replace_extension(P.out_file, ".dfn") : P.dfn_file;
    {
        Writer dfn(dfn_path);
        if (!dfn.good()) throw runtime_error("Cannot open output file: " + dfn_path);
        for (const auto& line : make_dfn_lines(fields)) dfn.write_line(line);
        if (!dfn.close()) throw runtime_error("Error writing " + dfn_path);
    }

    // ---- .dat ----
    Writer dat(P.out_file);
    if (!dat.good()) throw runtime_error("Cannot open output file: " + P.out_file);

    if (auto comment = nc.get_att_text(NC_GLOBAL, "comment")) {
        for (const auto& c : split(*comment, '\n')) dat.write_line("COMM " + c);
    }
    for (size_t i = 0; i < points; ++i) {
        dat.write_line(make_dat_record(fields, i));
    }
    if (!dat.close()) throw runtime_error("Error writing " + P.out_file);

    LOG_INFO("Exported " + to_string(points) + " points, " + to_string(fields.size()) +
             " fields to " + P.out_file + " (definitions " + dfn_path + ")");
}
