//
//  convert.cpp
//  asegnc
//

#include "convert/convert.hpp"

#include "aseg/dfn.hpp"
#include "aseg/precision.hpp"
#include "netcdf/ncfile.hpp"
#include "utils/gadgets.hpp"
#include "utils/util.hpp"
#include "utils/log.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <regex>
#include <stdexcept>

using namespace std;

// =======================================================
// CRS
// =======================================================

static const char* GDA94_WKT =
    "GEOGCS[\"GDA94\","
        "DATUM[\"Geocentric_Datum_of_Australia_1994\","
            "SPHEROID[\"GRS 1980\",6378137,298.257222101,AUTHORITY[\"EPSG\",\"7019\"]],"
            "TOWGS84[0,0,0,0,0,0,0],"
            "AUTHORITY[\"EPSG\",\"6283\"]],"
        "PRIMEM[\"Greenwich\",0,AUTHORITY[\"EPSG\",\"8901\"]],"
        "UNIT[\"degree\",0.0174532925199433,AUTHORITY[\"EPSG\",\"9122\"]],"
        "AUTHORITY[\"EPSG\",\"4283\"]]";

static const char* GDA2020_WKT =
    "GEOGCS[\"GDA2020\","
        "DATUM[\"Geocentric_Datum_of_Australia_2020\","
            "SPHEROID[\"GRS 1980\",6378137,298.257222101,AUTHORITY[\"EPSG\",\"7019\"]],"
            "AUTHORITY[\"EPSG\",\"1168\"]],"
        "PRIMEM[\"Greenwich\",0,AUTHORITY[\"EPSG\",\"8901\"]],"
        "UNIT[\"degree\",0.0174532925199433,AUTHORITY[\"EPSG\",\"9122\"]],"
        "AUTHORITY[\"EPSG\",\"7844\"]]";

static const char* WGS84_WKT =
    "GEOGCS[\"WGS 84\","
        "DATUM[\"WGS_1984\","
            "SPHEROID[\"WGS 84\",6378137,298.257223563,AUTHORITY[\"EPSG\",\"7030\"]],"
            "AUTHORITY[\"EPSG\",\"6326\"]],"
        "PRIMEM[\"Greenwich\",0,AUTHORITY[\"EPSG\",\"8901\"]],"
        "UNIT[\"degree\",0.0174532925199433,AUTHORITY[\"EPSG\",\"9122\"]],"
        "AUTHORITY[\"EPSG\",\"4326\"]]";

CrsInfo resolve_crs(const string& crs)
{
    const string name = to_upper(trim(crs));

    if (name == "GDA94" || name == "EPSG:4283")
        return CrsInfo{GDA94_WKT, "latitude_longitude", 6378137.0, 298.257222101, 4283};
    if (name == "GDA2020" || name == "EPSG:7844")
        return CrsInfo{GDA2020_WKT, "latitude_longitude", 6378137.0, 298.257222101, 7844};
    if (name == "WGS84" || name == "EPSG:4326")
        return CrsInfo{WGS84_WKT, "latitude_longitude", 6378137.0, 298.257223563, 4326};

    if (!starts_with(name, "GEOGCS[") && !starts_with(name, "PROJCS[")) {
        throw runtime_error("Unknown CRS: " + crs + " (expected GDA94, GDA2020, WGS84 or WKT)");
    }

    CrsInfo info;
    info.wkt = trim(crs);
    if (starts_with(name, "GEOGCS[")) info.grid_mapping_name = "latitude_longitude";

    static const regex spheroid_re(R"(SPHEROID\s*\[\s*"[^"]*"\s*,\s*([0-9.eE+-]+)\s*,\s*([0-9.eE+-]+))",
                                   regex::icase);
    smatch m;
    if (regex_search(info.wkt, m, spheroid_re)) {
        parse_double_strict(m[1].str(), info.semi_major_axis);
        parse_double_strict(m[2].str(), info.inverse_flattening);
    }

    // outermost AUTHORITY is the last one
    static const regex epsg_re(R"re(AUTHORITY\s*\[\s*"EPSG"\s*,\s*"(\d+)"\s*\]\s*\]\s*$)re", regex::icase);
    if (regex_search(info.wkt, m, epsg_re)) {
        info.epsg = stoi(m[1].str());
    }
    return info;
}

string resolve_dfn_path(const string& dat_file, const string& dfn_file)
{
    if (!dfn_file.empty()) return dfn_file;
    return replace_extension(dat_file, ".dfn");
}

// =======================================================
// line index
// =======================================================

LineIndex build_line_index(const Column& line_column)
{
    if (line_column.dtype == DataType::STRING || line_column.columns != 1) {
        throw runtime_error("Line field " + line_column.def.name + " must be a 1D numeric field");
    }

    LineIndex li;
    const size_t n = line_column.size();
    li.index.resize(n);

    map<double, int32_t> seen;
    for (size_t i = 0; i < n; ++i) {
        double v = line_column.at(i);
        auto it = seen.find(v);
        if (it == seen.end()) {
            it = seen.emplace(v, (int32_t)li.lines.size()).first;
            li.lines.push_back(v);
        }
        li.index[i] = it->second;
    }
    return li;
}

// =======================================================
// precision
// =======================================================

// replace old fill values after the fill value itself was changed
static void refill(vector<double>& values, double old_fill, double new_fill)
{
    if (old_fill == new_fill) return;
    for (auto& v : values) {
        if (v == old_fill) v = new_fill;
    }
}

void reduce_precision(Dataset& ds)
{
    for (auto& c : ds.columns) {
        if (c.dtype == DataType::STRING) continue;

        const DataType before = c.dtype;

        if (is_integer(c.dtype)) {
            optional<int64_t> fill;
            if (c.fill_value) fill = (int64_t)llround(*c.fill_value);
            auto fix = fix_field_precision(c.ints, c.dtype, c.columns, fill);
            if (fix) {
                c.dtype = fix->format.dtype;
            }
        } else {
            // exponent formats carry significant digits, not decimal places
            const int frac = c.def.decoded.fractional_digits;
            auto fix = (c.def.decoded.code == 'E')
                ? fix_exponent_precision(c.values, c.dtype, frac, c.columns, c.fill_value)
                : fix_field_precision(c.values, c.dtype, frac, c.columns, c.fill_value);
            if (fix) {
                c.dtype = fix->format.dtype;
                if (c.fill_value && fix->fill_value) {
                    refill(c.values, *c.fill_value, *fix->fill_value);
                    c.fill_value = fix->fill_value;
                }
            }
        }

        if (c.dtype != before) {
            LOG_INFO("Field " + c.def.name + " (" + c.def.format + "): " +
                     dtype_name(before) + " -> " + dtype_name(c.dtype));
        } else {
            LOG_DEBUG("Field " + c.def.name + " kept as " + dtype_name(c.dtype));
        }
    }
}

// =======================================================
// NetCDF output
// =======================================================

static const Column* find_coordinate(const Dataset& ds, const string& explicit_name,
                                     const vector<string>& candidates, const char* what)
{
    if (!explicit_name.empty()) {
        const Column* c = ds.find(explicit_name);
        if (!c) throw runtime_error(string(what) + " field not found: " + explicit_name);
        return c;
    }
    for (const auto& name : candidates) {
        const Column* c = ds.find(name);
        if (c && c->dtype != DataType::STRING && c->columns == 1) return c;
    }
    return nullptr;
}

// min/max over values that are not the fill value
static bool valid_range(const Column& c, double& vmin, double& vmax)
{
    vmin = numeric_limits<double>::infinity();
    vmax = -numeric_limits<double>::infinity();
    for (size_t i = 0; i < c.size(); ++i) {
        double v = c.at(i);
        if (c.fill_value && v == *c.fill_value) continue;
        vmin = min(vmin, v);
        vmax = max(vmax, v);
    }
    return vmin <= vmax;
}

static void put_fill(NcFile& nc, int varid, DataType dtype, double fill)
{
    if (is_integer(dtype)) nc.put_att(varid, "_FillValue", to_nc_type(dtype), (int64_t)llround(fill));
    else                   nc.put_att(varid, "_FillValue", to_nc_type(dtype), fill);
}

// attributes that the converter sets itself
static bool reserved_attribute(const string& name)
{
    static const char* names[] = {
        "_fillvalue", "long_name", "units", "aseg_gdf_format", "aseg_gdf_name", "grid_mapping"
    };
    for (auto n : names) {
        if (iequals(name, n)) return true;
    }
    return false;
}

static void define_field_attributes(NcFile& nc, int varid, const Column& c, bool grid_mapping)
{
    if (!c.def.long_name.empty()) nc.put_att(varid, "long_name", c.def.long_name);
    if (!c.def.units.empty())     nc.put_att(varid, "units", c.def.units);
    nc.put_att(varid, "aseg_gdf_format", c.def.format);
    nc.put_att(varid, "aseg_gdf_name", c.def.name);

    if (c.fill_value && c.dtype != DataType::STRING) {
        put_fill(nc, varid, c.dtype, *c.fill_value);
    }

    for (const auto& kv : c.def.attributes) {
        string key = sanitize_name(kv.first);
        if (reserved_attribute(key)) continue;
        nc.put_att(varid, key, kv.second);
    }

    if (grid_mapping) nc.put_att(varid, "grid_mapping", "crs");
}

static void define_crs(NcFile& nc, int varid, const CrsInfo& crs)
{
    if (!crs.grid_mapping_name.empty()) nc.put_att(varid, "grid_mapping_name", crs.grid_mapping_name);
    if (crs.semi_major_axis > 0)        nc.put_att(varid, "semi_major_axis", NC_DOUBLE, crs.semi_major_axis);
    if (crs.inverse_flattening > 0)     nc.put_att(varid, "inverse_flattening", NC_DOUBLE, crs.inverse_flattening);
    if (crs.grid_mapping_name == "latitude_longitude")
        nc.put_att(varid, "longitude_of_prime_meridian", NC_DOUBLE, 0.0);
    nc.put_att(varid, "spatial_ref", crs.wkt);
    nc.put_att(varid, "crs_wkt", crs.wkt);
    if (crs.epsg) nc.put_att(varid, "epsg_code", "EPSG:" + to_string(crs.epsg));
}

static void define_global_attributes(NcFile& nc, const Dataset& ds, const Args_Convert& P,
                                     const string& dfn_path)
{
    const int G = NC_GLOBAL;

    nc.put_att(G, "title", P.title.empty() ? path_stem(P.dat_file) : P.title);
    nc.put_att(G, "Conventions", "CF-1.6,ACDD-1.3");
    nc.put_att(G, "featureType", "trajectory");
    if (!P.keywords.empty()) nc.put_att(G, "keywords", P.keywords);
    nc.put_att(G, "history", "Converted from .dat file " + P.dat_file +
                             " using definitions file " + dfn_path);
    nc.put_att(G, "date_created", Gadget::iso_now());

    if (!ds.comments.empty()) {
        string comment;
        for (size_t i = 0; i < ds.comments.size(); ++i) {
            if (i) comment += "\n";
            comment += ds.comments[i];
        }
        nc.put_att(G, "comment", comment);
    }

    const Column* lon = find_coordinate(ds, P.lon_field, {"longitude", "lon", "long"}, "Longitude");
    const Column* lat = find_coordinate(ds, P.lat_field, {"latitude", "lat"}, "Latitude");

    double vmin, vmax;
    if (lon && valid_range(*lon, vmin, vmax)) {
        nc.put_att(G, "geospatial_lon_min", NC_DOUBLE, vmin);
        nc.put_att(G, "geospatial_lon_max", NC_DOUBLE, vmax);
        nc.put_att(G, "geospatial_lon_units", "degrees_east");
    } else {
        LOG_WARN("No longitude field found, geospatial_lon_* attributes not written");
    }
    if (lat && valid_range(*lat, vmin, vmax)) {
        nc.put_att(G, "geospatial_lat_min", NC_DOUBLE, vmin);
        nc.put_att(G, "geospatial_lat_max", NC_DOUBLE, vmax);
        nc.put_att(G, "geospatial_lat_units", "degrees_north");
    } else {
        LOG_WARN("No latitude field found, geospatial_lat_* attributes not written");
    }

    // PROJ and other non-data records
    for (const auto& rec : ds.records) {
        for (const auto& kv : rec.second) {
            if (kv.second.empty()) continue;
            nc.put_att(G, sanitize_name(to_lower(rec.first + "_" + kv.first)), kv.second);
        }
    }
}

void write_netcdf(const Dataset& ds, const Args_Convert& P, const string& dfn_path)
{
    if (ds.points == 0) {
        throw runtime_error("No data records to write");
    }

    const CrsInfo crs = resolve_crs(P.crs);
    NcFile nc = NcFile::create(P.out_file);

    const int point_dim = nc.def_dim("point", ds.points);
    const size_t point_chunk = min(P.chunk_size, ds.points);

    // ---- line dimension ----
    const Column* line_col = nullptr;
    LineIndex li;
    int line_varid = -1, line_index_varid = -1;
    if (!P.line_field.empty()) {
        line_col = ds.find(P.line_field);
        if (line_col && (line_col->dtype == DataType::STRING || line_col->columns != 1)) {
            LOG_WARN("Line field " + line_col->def.name + " is not a 1D numeric field, stored as point variable");
            line_col = nullptr;
        }
    }
    if (line_col) {
        li = build_line_index(*line_col);
        const int line_dim = nc.def_dim("line", li.lines.size());

        line_varid = nc.def_var("line", to_nc_type(line_col->dtype), {line_dim});
        define_field_attributes(nc, line_varid, *line_col, false);

        line_index_varid = nc.def_var("line_index", NC_INT, {point_dim});
        nc.put_att(line_index_varid, "long_name", "zero-based index of line for each point");
        if (P.deflate > 0) nc.def_deflate(line_index_varid, P.deflate);
        nc.def_chunking(line_index_varid, {point_chunk});

        LOG_INFO("Found " + to_string(li.lines.size()) + " lines in field " + line_col->def.name);
    } else if (!P.line_field.empty()) {
        LOG_DEBUG("No line field " + P.line_field + ", writing points only");
    }

    // ---- crs ----
    const int crs_varid = nc.def_var("crs", NC_BYTE, {});
    define_crs(nc, crs_varid, crs);

    // ---- point variables ----
    vector<int> varids(ds.columns.size(), -1);
    for (size_t k = 0; k < ds.columns.size(); ++k) {
        const Column& c = ds.columns[k];
        if (&c == line_col) continue;

        const string& name = c.def.short_name;
        if (name == "line" || name == "line_index" || name == "crs" || name == "point") {
            throw runtime_error("Field " + c.def.name + " uses reserved variable name " + name);
        }

        vector<int> dims = {point_dim};
        vector<size_t> chunks = {point_chunk};
        if (c.columns > 1) {
            dims.push_back(nc.def_dim(name + "_columns", (size_t)c.columns));
            chunks.push_back((size_t)c.columns);
        }

        const int varid = nc.def_var(name, to_nc_type(c.dtype), dims);
        // variable length strings cannot be compressed
        if (c.dtype != DataType::STRING && P.deflate > 0) nc.def_deflate(varid, P.deflate);
        nc.def_chunking(varid, chunks);

        define_field_attributes(nc, varid, c, c.dtype != DataType::STRING);
        varids[k] = varid;
    }

    define_global_attributes(nc, ds, P, dfn_path);
    nc.enddef();

    // ---- data ----
    nc.put_scalar(crs_varid, 0);
    if (line_col) {
        if (is_integer(line_col->dtype)) {
            vector<int64_t> lines(li.lines.size());
            for (size_t i = 0; i < lines.size(); ++i) lines[i] = (int64_t)llround(li.lines[i]);
            nc.put_var(line_varid, lines);
        } else {
            nc.put_var(line_varid, li.lines);
        }
        nc.put_var(line_index_varid, li.index);
    }

    for (size_t k = 0; k < ds.columns.size(); ++k) {
        if (varids[k] < 0) continue;
        const Column& c = ds.columns[k];
        if (c.dtype == DataType::STRING)  nc.put_var(varids[k], c.strings);
        else if (is_integer(c.dtype))     nc.put_var(varids[k], c.ints);
        else                              nc.put_var(varids[k], c.values);
        LOG_DEBUG("Wrote variable " + c.def.short_name + " (" + dtype_name(c.dtype) + ")");
    }

    nc.close();
    LOG_INFO("Finished writing NetCDF file " + P.out_file);
}

void run_convert(const Args_Convert& P)
{
    const string dfn_path = resolve_dfn_path(P.dat_file, P.dfn_file);
    LOG_INFO("Data file: " + P.dat_file);
    LOG_INFO("Definition file: " + dfn_path);

    DfnDefinition dfn = parse_dfn(dfn_path);
    Dataset ds = read_dat(P.dat_file, dfn);

    if (P.reduce_precision) {
        reduce_precision(ds);
    }

    write_netcdf(ds, P, dfn_path);
    LOG_INFO("convert finished (" + to_string(ds.points) + " points, " +
             to_string(ds.columns.size()) + " fields).");
}
