// tests/test_datreader.cpp
//
// Fixed-width record parsing against a definition.

#include "aseg/datreader.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace test_utils;

class DatReaderTest : public ::testing::Test {
protected:
    DfnDefinition dfn = parse_dfn_lines(sample_dfn(), "sample.dfn");
};

TEST_F(DatReaderTest, ReadsEveryField)
{
    Dataset ds = read_dat_lines(sample_dat(), dfn);
    EXPECT_EQ(ds.points, 4u);
    ASSERT_EQ(ds.columns.size(), 6u);

    const Column* line = ds.find("line");
    ASSERT_NE(line, nullptr);
    EXPECT_EQ(line->dtype, DataType::INT32);
    EXPECT_EQ(line->ints[0], 1001);
    EXPECT_EQ(line->ints[3], 1002);

    const Column* lon = ds.find("LONGITUDE");
    ASSERT_NE(lon, nullptr);
    EXPECT_EQ(lon->dtype, DataType::FLOAT64);
    EXPECT_DOUBLE_EQ(lon->values[0], 135.123456);

    const Column* survey = ds.find("survey");
    ASSERT_NE(survey, nullptr);
    EXPECT_EQ(survey->dtype, DataType::STRING);
    EXPECT_EQ(survey->strings[2], "SV02");
}

TEST_F(DatReaderTest, FindByEitherNameOnConstDataset)
{
    Dataset ds = read_dat_lines(sample_dat(), dfn);
    const Dataset& cds = ds;

    ASSERT_NE(cds.find("fid"), nullptr);
    EXPECT_EQ(cds.find("fid"), ds.find("FID"));
    EXPECT_EQ(cds.find("em_x"), cds.find("EM"));
    EXPECT_EQ(cds.find("missing"), nullptr);
    EXPECT_EQ(ds.find("missing"), nullptr);
}

TEST_F(DatReaderTest, MultiColumnValuesAreRowMajor)
{
    Dataset ds = read_dat_lines(sample_dat(), dfn);
    const Column* em = ds.find("em_x");
    ASSERT_NE(em, nullptr);
    EXPECT_EQ(em->columns, 3);
    ASSERT_EQ(em->size(), 12u);
    EXPECT_DOUBLE_EQ(em->at(0), 1.2345);
    EXPECT_DOUBLE_EQ(em->at(1), 0.2);
    EXPECT_DOUBLE_EQ(em->at(2), -3.5);
    EXPECT_DOUBLE_EQ(em->at(3), 1.5);
}

TEST_F(DatReaderTest, CommentsAreCollected)
{
    Dataset ds = read_dat_lines(sample_dat(), dfn);
    ASSERT_EQ(ds.comments.size(), 1u);
    EXPECT_EQ(ds.comments[0], "Sample survey for tests");
}

TEST_F(DatReaderTest, FortranExponentIsAccepted)
{
    std::string rec = sample_record(1001, 10.0, 135.0, -25.0, 1.5, 0.2, -3.5, "SV01");
    // first EM value starts at offset 39
    size_t e = rec.find('E', 39);
    ASSERT_NE(e, std::string::npos);
    rec[e] = 'D';

    Dataset ds = read_dat_lines({rec}, dfn);
    EXPECT_DOUBLE_EQ(ds.find("em_x")->values[0], 1.5);
}

TEST_F(DatReaderTest, BlankFieldsTakeFillValue)
{
    std::string rec = sample_record(1001, 10.0, 135.0, -25.0, 1.5, 0.2, -3.5, "SV01");
    rec.replace(28, 11, std::string(11, ' '));  // latitude

    Dataset ds = read_dat_lines({rec}, dfn);
    const Column* lat = ds.find("latitude");
    EXPECT_DOUBLE_EQ(lat->values[0], -999.0);
    EXPECT_EQ(lat->missing, 1u);
    ASSERT_TRUE(lat->fill_value.has_value());
    EXPECT_DOUBLE_EQ(*lat->fill_value, -999.0);
}

TEST_F(DatReaderTest, ShortLineFillsRemainingFields)
{
    std::string rec = sample_record(1001, 10.0, 135.0, -25.0, 1.5, 0.2, -3.5, "SV01");
    rec.resize(39);     // ends after latitude

    Dataset ds = read_dat_lines({rec}, dfn);
    const Column* em = ds.find("em_x");
    EXPECT_EQ(em->missing, 3u);
    ASSERT_TRUE(em->fill_value.has_value());
    EXPECT_DOUBLE_EQ(*em->fill_value, default_fill(DataType::FLOAT64));
    EXPECT_DOUBLE_EQ(em->values[2], default_fill(DataType::FLOAT64));
    EXPECT_EQ(ds.find("survey")->strings[0], "");
    EXPECT_DOUBLE_EQ(ds.find("latitude")->values[0], -25.0);
}

TEST_F(DatReaderTest, InvalidValueNamesLineAndField)
{
    std::vector<std::string> lines = sample_dat();
    lines[2].replace(6, 10, "      abcd");  // FID of the second data record

    try {
        read_dat_lines(lines, dfn, "bad.dat");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("FID"), std::string::npos) << msg;
        EXPECT_NE(msg.find("bad.dat:3"), std::string::npos) << msg;
    }
}

TEST(DatReaderRecordTypeTest, OnlyMarkedLinesAreData)
{
    DfnDefinition dfn = parse_dfn_lines({
        "DEFN 1 ST=RECD,RT=DATA;RT:A4",
        "DEFN 2 ST=RECD,RT=DATA;X:F8.2",
        "DEFN 3 ST=RECD,RT=PROJ;RT:A4;NAME:A20",
        "DEFN 4 ST=RECD,RT=DATA;END DEFN",
    });

    Dataset ds = read_dat_lines({
        "PROJ GDA94 / MGA 54",
        "DATA    1.25",
        "DATA   -2.50",
        "XXXX    9.99",
    }, dfn);

    EXPECT_EQ(ds.points, 2u);
    EXPECT_DOUBLE_EQ(ds.find("x")->values[1], -2.5);
    ASSERT_EQ(ds.records.size(), 1u);
    EXPECT_EQ(ds.records[0].first, "PROJ");
    ASSERT_EQ(ds.records[0].second.size(), 1u);
    EXPECT_EQ(ds.records[0].second[0].first, "NAME");
    EXPECT_EQ(ds.records[0].second[0].second, "GDA94 / MGA 54");
}

TEST(DatReaderFileTest, ReadsGzipAndPlainAlike)
{
    TempDir dir("dat_file");
    const std::string path = dir.file("sample.dat");
    write_lines(path, sample_dat());

    DfnDefinition dfn = parse_dfn_lines(sample_dfn());
    Dataset ds = read_dat(path, dfn);
    EXPECT_EQ(ds.points, 4u);
    EXPECT_THROW(read_dat(dir.file("missing.dat"), dfn), std::runtime_error);
}
