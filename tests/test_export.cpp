// tests/test_export.cpp
//
// NetCDF to ASEG-GDF export, and the convert / export round trip.

#include "export/export.hpp"
#include "convert/convert.hpp"
#include "aseg/datreader.hpp"
#include "info/info.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <cmath>

using namespace test_utils;

namespace {

ExportField numeric_field(const std::string& name, std::vector<double> values, DataType dtype)
{
    ExportField f;
    f.name = name;
    f.short_name = name;
    f.values = std::move(values);
    f.format = variable_to_aseg_format(f.values, dtype, 1, 2);
    return f;
}

// convert the sample survey, then export it again
struct RoundTrip {
    DfnDefinition dfn_in;
    Dataset in;
    DfnDefinition dfn_out;
    Dataset out;
};

RoundTrip round_trip(const TempDir& dir, const std::string& dat_name)
{
    write_lines(dir.file("survey.dfn"), sample_dfn());
    write_lines(dir.file("survey.dat"), sample_dat());

    Args_Convert C;
    C.dat_file = dir.file("survey.dat");
    C.out_file = dir.file("survey.nc");
    run_convert(C);

    Args_Export E;
    E.nc_file  = C.out_file;
    E.out_file = dir.file(dat_name);
    run_export(E);

    RoundTrip rt;
    rt.dfn_in  = parse_dfn(dir.file("survey.dfn"));
    rt.in      = read_dat(C.dat_file, rt.dfn_in);
    rt.dfn_out = parse_dfn(dir.file("exported.dfn"));
    rt.out     = read_dat(E.out_file, rt.dfn_out);
    return rt;
}

} // namespace

TEST(ExportTest, DefinitionLines)
{
    ExportField x = numeric_field("x", {1.5, -2.25}, DataType::FLOAT32);
    x.name = "X";
    x.units = "m, metres";
    x.long_name = "Easting; projected";
    x.fill_value = -9999.0;

    ExportField s;
    s.name = "SURVEY";
    s.short_name = "survey";
    s.strings = {"a", "b"};
    s.format = string_variable_to_aseg_format(1, "A6");

    std::vector<std::string> lines = make_dfn_lines({x, s});
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "DEFN   ST=RECD,RT=COMM;RT:A4;COMMENTS:A76");
    EXPECT_EQ(lines[1], "DEFN 1 ST=RECD,RT=;X:F6.2:NAME=x,UNITS=m  metres,NULL=-9999.00,"
                        "LONG_NAME=Easting  projected");
    EXPECT_EQ(lines[2], "DEFN 2 ST=RECD,RT=;SURVEY:A6:NAME=survey");
    EXPECT_EQ(lines[3], "DEFN 3 ST=RECD,RT=;END DEFN");

    // and the result parses back
    DfnDefinition dfn = parse_dfn_lines(lines);
    ASSERT_EQ(dfn.data.fields.size(), 2u);
    EXPECT_EQ(dfn.data.fields[0].units, "m  metres");
    EXPECT_DOUBLE_EQ(*dfn.data.fields[0].null_value, -9999.0);
}

TEST(ExportTest, DataRecordIsFixedWidth)
{
    ExportField x = numeric_field("X", {1.5, -2.25}, DataType::FLOAT32);
    ExportField n = numeric_field("N", {7, 12}, DataType::INT16);

    ExportField s;
    s.name = "S";
    s.strings = {"ab", "abcdefgh"};
    s.format = string_variable_to_aseg_format(1, "A4");

    std::vector<ExportField> fields = {x, n, s};
    EXPECT_EQ(make_dat_record(fields, 0), "  1.50  7ab  ");
    EXPECT_EQ(make_dat_record(fields, 1), " -2.25 12abcd");
}

TEST(ExportTest, RoundTripReproducesValues)
{
    TempDir dir("export_roundtrip");
    RoundTrip rt = round_trip(dir, "exported.dat");

    ASSERT_EQ(rt.out.points, rt.in.points);
    ASSERT_EQ(rt.out.columns.size(), rt.in.columns.size());

    for (const auto& a : rt.in.columns) {
        const Column* b = rt.out.find(a.def.short_name);
        ASSERT_NE(b, nullptr) << a.def.short_name;
        EXPECT_EQ(b->def.name, a.def.name);
        EXPECT_EQ(b->columns, a.columns);
        EXPECT_EQ(b->def.units, a.def.units);

        if (a.dtype == DataType::STRING) {
            EXPECT_EQ(b->strings, a.strings);
            continue;
        }
        ASSERT_EQ(b->size(), a.size());
        // float32 storage, then rounding to the declared decimal places
        const double tol = 2.0 * std::pow(10.0, -a.def.decoded.fractional_digits);
        for (size_t i = 0; i < a.size(); ++i) {
            EXPECT_NEAR(b->at(i), a.at(i), tol) << a.def.short_name << "[" << i << "]";
        }
    }

    ASSERT_EQ(rt.out.comments.size(), 1u);
    EXPECT_EQ(rt.out.comments[0], "Sample survey for tests");
}

TEST(ExportTest, RoundTripKeepsFieldMetadata)
{
    TempDir dir("export_metadata");
    RoundTrip rt = round_trip(dir, "exported.dat.gz");

    EXPECT_EQ(rt.dfn_out.data.fields[0].name, "LINE");
    const FieldDef* fid = rt.dfn_out.find_field("fid");
    ASSERT_NE(fid, nullptr);
    EXPECT_EQ(fid->long_name, "Fiducial");
    ASSERT_TRUE(fid->null_value.has_value());
    EXPECT_NEAR(*fid->null_value, -99999.9, 0.01);

    const FieldDef* em = rt.dfn_out.find_field("EM");
    ASSERT_NE(em, nullptr);
    EXPECT_EQ(em->decoded.columns, 3);
}

TEST(ExportTest, BlankFloatValuesSurviveRoundTrip)
{
    TempDir dir("export_blank");
    write_lines(dir.file("blank.dfn"), {
        "DEFN 1 ST=RECD,RT=;ID:I4",
        "DEFN 2 ST=RECD,RT=;X:F10.2:UNITS=m",
        "DEFN 3 ST=RECD,RT=;END DEFN",
    });
    write_lines(dir.file("blank.dat"), {
        "   1     12.34",
        "   2          ",
        "   3     -5.67",
    });

    Args_Convert C;
    C.dat_file = dir.file("blank.dat");
    C.out_file = dir.file("blank.nc");
    run_convert(C);

    Args_Export E;
    E.nc_file  = C.out_file;
    E.out_file = dir.file("again.dat");
    run_export(E);

    DfnDefinition dfn = parse_dfn(dir.file("again.dfn"));
    const FieldDef* x = dfn.find_field("x");
    ASSERT_NE(x, nullptr);
    EXPECT_EQ(x->decoded.fractional_digits, 2);
    EXPECT_LT(x->decoded.integer_digits, 10);
    ASSERT_TRUE(x->null_value.has_value());

    Dataset ds = read_dat(E.out_file, dfn);
    const Column* col = ds.find("x");
    ASSERT_NE(col, nullptr);
    ASSERT_EQ(col->size(), 3u);
    EXPECT_NEAR(col->values[0], 12.34, 0.01);
    EXPECT_NEAR(col->values[2], -5.67, 0.01);
    EXPECT_EQ(col->missing, 1u);
    EXPECT_DOUBLE_EQ(col->values[1], *x->null_value);
}

TEST(ExportTest, DecimalPlacesOption)
{
    TempDir dir("export_decimals");
    write_lines(dir.file("survey.dfn"), sample_dfn());
    write_lines(dir.file("survey.dat"), sample_dat());

    Args_Convert C;
    C.dat_file = dir.file("survey.dat");
    C.out_file = dir.file("survey.nc");
    run_convert(C);

    Args_Export E;
    E.nc_file  = C.out_file;
    E.out_file = dir.file("out.dat");
    E.dfn_file = dir.file("defs.dfn");
    E.decimal_places = 2;
    run_export(E);

    DfnDefinition dfn = parse_dfn(E.dfn_file);
    EXPECT_EQ(dfn.find_field("longitude")->decoded.fractional_digits, 2);
    EXPECT_EQ(dfn.find_field("fid")->decoded.fractional_digits, 2);
    EXPECT_EQ(dfn.find_field("line")->decoded.fractional_digits, 0);
}

TEST(InfoTest, TableListsEveryField)
{
    DfnDefinition dfn = parse_dfn_lines(sample_dfn(), "sample.dfn");
    std::string table = format_dfn_table(dfn);

    EXPECT_NE(table.find("sample.dfn"), std::string::npos);
    for (const auto& f : dfn.data.fields) {
        EXPECT_NE(table.find(f.name), std::string::npos) << f.name;
    }
    EXPECT_NE(table.find("3E12.4"), std::string::npos);
    EXPECT_NE(table.find("float64"), std::string::npos);
    EXPECT_NE(table.find("RT=COMM"), std::string::npos);
}
