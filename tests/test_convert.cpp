// tests/test_convert.cpp
//
// ASEG-GDF to NetCDF conversion, checked by reading the output back.

#include "convert/convert.hpp"
#include "netcdf/ncfile.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>

using namespace test_utils;

namespace {

Args_Convert convert_args(const TempDir& dir)
{
    write_lines(dir.file("survey.dfn"), sample_dfn());
    write_lines(dir.file("survey.dat"), sample_dat());

    Args_Convert P;
    P.dat_file = dir.file("survey.dat");
    P.out_file = dir.file("survey.nc");
    return P;
}

bool fits_float32(const std::vector<double>& values, int fractional_digits)
{
    for (double v : values) {
        if (std::fabs(v - (double)(float)v) >= std::pow(10.0, -fractional_digits)) return false;
    }
    return true;
}

} // namespace

TEST(ConvertTest, WritesDimensionsAndLineIndex)
{
    TempDir dir("convert_dims");
    Args_Convert P = convert_args(dir);
    run_convert(P);

    NcFile nc = NcFile::open(P.out_file);
    auto point = nc.dim_id("point");
    auto line  = nc.dim_id("line");
    ASSERT_TRUE(point.has_value());
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(nc.dim_len(*point), 4u);
    EXPECT_EQ(nc.dim_len(*line), 2u);

    auto line_var = nc.var_id("line");
    auto index_var = nc.var_id("line_index");
    ASSERT_TRUE(line_var && index_var);
    EXPECT_EQ(nc.get_var_int64(*line_var), (std::vector<int64_t>{1001, 1002}));
    EXPECT_EQ(nc.get_var_int64(*index_var), (std::vector<int64_t>{0, 0, 1, 1}));
    EXPECT_EQ(nc.var_info(*index_var).type, NC_INT);

    auto em = nc.var_id("em_x");
    ASSERT_TRUE(em.has_value());
    NcVarInfo info = nc.var_info(*em);
    ASSERT_EQ(info.dim_names.size(), 2u);
    EXPECT_EQ(info.dim_names[0], "point");
    EXPECT_EQ(info.dim_names[1], "em_x_columns");
    EXPECT_EQ(info.shape[1], 3u);
}

TEST(ConvertTest, ReducesOverSpecifiedTypes)
{
    TempDir dir("convert_reduce");
    Args_Convert P = convert_args(dir);
    run_convert(P);

    NcFile nc = NcFile::open(P.out_file);
    EXPECT_EQ(nc.var_info(*nc.var_id("line")).type, NC_SHORT);
    EXPECT_EQ(nc.var_info(*nc.var_id("fid")).type, NC_FLOAT);
    EXPECT_EQ(nc.var_info(*nc.var_id("latitude")).type, NC_FLOAT);
    EXPECT_EQ(nc.var_info(*nc.var_id("em_x")).type, NC_FLOAT);
    EXPECT_EQ(nc.var_info(*nc.var_id("survey")).type, NC_STRING);

    const bool lon_float = fits_float32({135.123456, 135.223456, 136.5, 136.75}, 6);
    EXPECT_EQ(nc.var_info(*nc.var_id("longitude")).type, lon_float ? NC_FLOAT : NC_DOUBLE);
}

TEST(ConvertTest, NoReduceKeepsFormatTypes)
{
    TempDir dir("convert_noreduce");
    Args_Convert P = convert_args(dir);
    P.reduce_precision = false;
    run_convert(P);

    NcFile nc = NcFile::open(P.out_file);
    EXPECT_EQ(nc.var_info(*nc.var_id("line")).type, NC_INT);
    EXPECT_EQ(nc.var_info(*nc.var_id("fid")).type, NC_DOUBLE);
    EXPECT_EQ(nc.var_info(*nc.var_id("em_x")).type, NC_DOUBLE);
    EXPECT_EQ(nc.get_var_double(*nc.var_id("fid")), (std::vector<double>{10.0, 10.5, 11.0, 11.5}));
}

TEST(ConvertTest, VariableAttributes)
{
    TempDir dir("convert_attrs");
    Args_Convert P = convert_args(dir);
    run_convert(P);

    NcFile nc = NcFile::open(P.out_file);
    const int fid = *nc.var_id("fid");
    EXPECT_EQ(nc.get_att_text(fid, "units").value_or(""), "s");
    EXPECT_EQ(nc.get_att_text(fid, "long_name").value_or(""), "Fiducial");
    EXPECT_EQ(nc.get_att_text(fid, "aseg_gdf_format").value_or(""), "F10.1");
    EXPECT_EQ(nc.get_att_text(fid, "aseg_gdf_name").value_or(""), "FID");
    EXPECT_EQ(nc.get_att_text(fid, "grid_mapping").value_or(""), "crs");
    ASSERT_TRUE(nc.get_att_double(fid, "_FillValue").has_value());
    EXPECT_NEAR(*nc.get_att_double(fid, "_FillValue"), -99999.9, 0.01);

    const int em = *nc.var_id("em_x");
    EXPECT_EQ(nc.get_att_text(em, "datum").value_or(""), "ground");
    EXPECT_FALSE(nc.get_att_double(em, "_FillValue").has_value());

    const int crs = *nc.var_id("crs");
    EXPECT_NE(nc.get_att_text(crs, "spatial_ref").value_or("").find("GDA94"), std::string::npos);
    EXPECT_EQ(nc.get_att_text(crs, "grid_mapping_name").value_or(""), "latitude_longitude");
    EXPECT_DOUBLE_EQ(nc.get_att_double(crs, "semi_major_axis").value_or(0), 6378137.0);
}

TEST(ConvertTest, GlobalAttributes)
{
    TempDir dir("convert_global");
    Args_Convert P = convert_args(dir);
    P.keywords = "AEM,test";
    run_convert(P);

    NcFile nc = NcFile::open(P.out_file);
    EXPECT_EQ(nc.get_att_text(NC_GLOBAL, "title").value_or(""), "survey");
    EXPECT_EQ(nc.get_att_text(NC_GLOBAL, "Conventions").value_or(""), "CF-1.6,ACDD-1.3");
    EXPECT_EQ(nc.get_att_text(NC_GLOBAL, "featureType").value_or(""), "trajectory");
    EXPECT_EQ(nc.get_att_text(NC_GLOBAL, "keywords").value_or(""), "AEM,test");
    EXPECT_EQ(nc.get_att_text(NC_GLOBAL, "comment").value_or(""), "Sample survey for tests");
    EXPECT_TRUE(nc.get_att_text(NC_GLOBAL, "date_created").has_value());

    EXPECT_NEAR(nc.get_att_double(NC_GLOBAL, "geospatial_lon_min").value_or(0), 135.123456, 1e-5);
    EXPECT_NEAR(nc.get_att_double(NC_GLOBAL, "geospatial_lon_max").value_or(0), 136.75, 1e-5);
    EXPECT_NEAR(nc.get_att_double(NC_GLOBAL, "geospatial_lat_min").value_or(0), -26.5, 1e-5);
    EXPECT_NEAR(nc.get_att_double(NC_GLOBAL, "geospatial_lat_max").value_or(0), -25.25, 1e-5);
}

TEST(ConvertTest, GeospatialRangeIgnoresFillValues)
{
    TempDir dir("convert_fill");
    Args_Convert P = convert_args(dir);
    std::vector<std::string> dat = sample_dat();
    dat.push_back(sample_record(1003, 12.0, -999.0, -999.0, 1.0, 1.0, 1.0, "SV03"));
    write_lines(P.dat_file, dat);
    run_convert(P);

    NcFile nc = NcFile::open(P.out_file);
    EXPECT_NEAR(nc.get_att_double(NC_GLOBAL, "geospatial_lon_min").value_or(0), 135.123456, 1e-5);
    EXPECT_NEAR(nc.get_att_double(NC_GLOBAL, "geospatial_lat_min").value_or(0), -26.5, 1e-5);
    EXPECT_EQ(nc.dim_len(*nc.dim_id("line")), 3u);
}

TEST(ConvertTest, ExplicitDefinitionFileAndMissingFiles)
{
    TempDir dir("convert_dfn");
    Args_Convert P = convert_args(dir);
    write_lines(dir.file("other.dfn"), sample_dfn());
    std::remove(dir.file("survey.dfn").c_str());

    EXPECT_THROW(run_convert(P), std::runtime_error);

    P.dfn_file = dir.file("other.dfn");
    EXPECT_NO_THROW(run_convert(P));
}

TEST(ConvertTest, ResolveCrs)
{
    EXPECT_EQ(resolve_crs("gda94").epsg, 4283);
    EXPECT_EQ(resolve_crs("GDA2020").epsg, 7844);
    EXPECT_EQ(resolve_crs("WGS84").epsg, 4326);
    EXPECT_THROW(resolve_crs("MGA54"), std::runtime_error);

    CrsInfo wkt = resolve_crs(
        "GEOGCS[\"AGD66\",DATUM[\"Australian_Geodetic_Datum_1966\","
        "SPHEROID[\"Australian National Spheroid\",6378160,298.25]],"
        "PRIMEM[\"Greenwich\",0],UNIT[\"degree\",0.0174532925199433],"
        "AUTHORITY[\"EPSG\",\"4202\"]]");
    EXPECT_EQ(wkt.grid_mapping_name, "latitude_longitude");
    EXPECT_DOUBLE_EQ(wkt.semi_major_axis, 6378160.0);
    EXPECT_DOUBLE_EQ(wkt.inverse_flattening, 298.25);
    EXPECT_EQ(wkt.epsg, 4202);
}

TEST(ConvertTest, ResolveDfnPath)
{
    EXPECT_EQ(resolve_dfn_path("a/b/x.dat", ""), "a/b/x.dfn");
    EXPECT_EQ(resolve_dfn_path("a/b/x.dat.gz", ""), "a/b/x.dfn");
    EXPECT_EQ(resolve_dfn_path("a/b/x.dat", "y.dfn"), "y.dfn");
}

TEST(ConvertTest, BuildLineIndexKeepsOrderOfAppearance)
{
    Column c;
    c.def.name = "LINE";
    c.dtype = DataType::INT32;
    c.ints = {30, 30, 10, 10, 30, 20};

    LineIndex li = build_line_index(c);
    EXPECT_EQ(li.lines, (std::vector<double>{30, 10, 20}));
    EXPECT_EQ(li.index, (std::vector<int32_t>{0, 0, 1, 1, 0, 2}));

    Column s;
    s.dtype = DataType::STRING;
    EXPECT_THROW(build_line_index(s), std::runtime_error);
}

TEST(ConvertTest, OtherRecordsBecomeGlobalAttributes)
{
    TempDir dir("convert_proj");
    Args_Convert P = convert_args(dir);

    std::vector<std::string> dfn = sample_dfn();
    dfn.insert(dfn.end() - 1, "DEFN 8 ST=RECD,RT=PROJ;RT:A4;NAME:A20");
    write_lines(dir.file("survey.dfn"), dfn);

    std::vector<std::string> dat = sample_dat();
    dat.insert(dat.begin(), "PROJ GDA94 / MGA 54");
    write_lines(P.dat_file, dat);

    run_convert(P);

    NcFile nc = NcFile::open(P.out_file);
    EXPECT_EQ(nc.get_att_text(NC_GLOBAL, "proj_name").value_or(""), "GDA94 / MGA 54");
    EXPECT_EQ(nc.dim_len(*nc.dim_id("point")), 4u);
}

TEST(ConvertTest, ExponentValueBeyondFloat32KeepsDouble)
{
    TempDir dir("convert_exponent");
    write_lines(dir.file("big.dfn"), {
        "DEFN 1 ST=RECD,RT=;ID:I4",
        "DEFN 2 ST=RECD,RT=;COND:E12.4:UNITS=S/m",
        "DEFN 3 ST=RECD,RT=;RES:E12.4:UNITS=ohm.m",
        "DEFN 4 ST=RECD,RT=;END DEFN",
    });
    write_lines(dir.file("big.dat"), {
        "   1  1.0000E+40  2.5000E+00",
        "   2  2.5000E+00  1.2500E-01",
    });

    Args_Convert P;
    P.dat_file = dir.file("big.dat");
    P.out_file = dir.file("big.nc");
    ASSERT_NO_THROW(run_convert(P));

    NcFile nc = NcFile::open(P.out_file);
    EXPECT_EQ(nc.var_info(*nc.var_id("cond")).type, NC_DOUBLE);
    EXPECT_EQ(nc.var_info(*nc.var_id("res")).type, NC_FLOAT);
    EXPECT_EQ(nc.get_var_double(*nc.var_id("cond")), (std::vector<double>{1.0e40, 2.5}));
}
