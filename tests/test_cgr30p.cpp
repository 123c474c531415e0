#include <gtest/gtest.h>
#include "aerotrace/cgr30p.h"
#include "aerotrace/csv_reader.h"
#include <string>
#include <vector>

using namespace aerotrace;
using namespace aerotrace::cgr30p;

class CGR30PTest : public ::testing::Test {
protected:
    CGR30P_Decoder decoder;
    FlightMetadata metadata;
    std::vector<ParseWarning> warnings;

    void decodeHeader(const std::string& line) {
        auto result = decoder.decodeHeader(utils::splitCsvLine(line), metadata, 1, warnings);
        ASSERT_TRUE(result.success) << result.error;
    }

    DecodeResult decodeRow(const std::string& line, EngineRecord& record, bool strict = false) {
        record.line = 2;
        return decoder.decodeRow(utils::splitCsvLine(line), record, strict, warnings);
    }
};

// =============================================================================
// Column classification
// =============================================================================

TEST_F(CGR30PTest, ClassifyScalarChannels) {
    EXPECT_EQ(CGR30P_Decoder::classifyColumn("RPM").channel, Channel::RPM);
    EXPECT_EQ(CGR30P_Decoder::classifyColumn("MAP (inHg)").channel, Channel::MAP);
    EXPECT_EQ(CGR30P_Decoder::classifyColumn("Oil P").channel, Channel::OIL_PRESSURE);
    EXPECT_EQ(CGR30P_Decoder::classifyColumn("OIL TEMP").channel, Channel::OIL_TEMPERATURE);
    EXPECT_EQ(CGR30P_Decoder::classifyColumn("Fuel Press").channel, Channel::FUEL_PRESSURE);
    EXPECT_EQ(CGR30P_Decoder::classifyColumn("Volts").channel, Channel::VOLTS);
    EXPECT_EQ(CGR30P_Decoder::classifyColumn("Amps").channel, Channel::AMPS);
    EXPECT_EQ(CGR30P_Decoder::classifyColumn("G-Meter").channel, Channel::G_FORCE);
    EXPECT_EQ(CGR30P_Decoder::classifyColumn("Local Date").channel, Channel::DATE);
    EXPECT_EQ(CGR30P_Decoder::classifyColumn("Time").channel, Channel::TIME);
    EXPECT_EQ(CGR30P_Decoder::classifyColumn("Remarks").channel, Channel::NONE);
    EXPECT_EQ(CGR30P_Decoder::classifyColumn("").channel, Channel::NONE);
}

TEST_F(CGR30PTest, ClassifyCylinderChannels) {
    auto egt = CGR30P_Decoder::classifyColumn("EGT 1");
    EXPECT_EQ(egt.channel, Channel::EGT);
    EXPECT_EQ(egt.cylinder, 1);

    auto e3 = CGR30P_Decoder::classifyColumn("E3");
    EXPECT_EQ(e3.channel, Channel::EGT);
    EXPECT_EQ(e3.cylinder, 3);

    auto cht = CGR30P_Decoder::classifyColumn("CHT12");
    EXPECT_EQ(cht.channel, Channel::CHT);
    EXPECT_EQ(cht.cylinder, 12);

    auto c4 = CGR30P_Decoder::classifyColumn("C4");
    EXPECT_EQ(c4.channel, Channel::CHT);
    EXPECT_EQ(c4.cylinder, 4);

    EXPECT_EQ(CGR30P_Decoder::classifyColumn("EGT0").channel, Channel::NONE);
    EXPECT_EQ(CGR30P_Decoder::classifyColumn("EGT123").channel, Channel::NONE);
    EXPECT_EQ(CGR30P_Decoder::classifyColumn("CHTX").channel, Channel::NONE);
}

TEST_F(CGR30PTest, ClassifyColumnUnit) {
    auto celsius = CGR30P_Decoder::classifyColumn("CHT1 (\xC2\xB0" "C)");
    EXPECT_EQ(celsius.channel, Channel::CHT);
    EXPECT_TRUE(celsius.unit_declared);
    EXPECT_EQ(celsius.unit, TemperatureUnit::CELSIUS);
    EXPECT_EQ(celsius.name, "CHT1 (\xC2\xB0" "C)");

    auto fahrenheit = CGR30P_Decoder::classifyColumn("Oil Temp (F)");
    EXPECT_TRUE(fahrenheit.unit_declared);
    EXPECT_EQ(fahrenheit.unit, TemperatureUnit::FAHRENHEIT);

    auto plain = CGR30P_Decoder::classifyColumn("EGT2");
    EXPECT_FALSE(plain.unit_declared);

    // Units on non-temperature channels are not temperature units
    auto map = CGR30P_Decoder::classifyColumn("MAP (inHg)");
    EXPECT_FALSE(map.unit_declared);
}

// =============================================================================
// Detection
// =============================================================================

TEST_F(CGR30PTest, HeaderRowNeedsTwoChannels) {
    EXPECT_TRUE(decoder.isHeaderRow({"DATE", "TIME", "RPM", "MAP"}));
    EXPECT_TRUE(decoder.isHeaderRow({"EGT1", "CHT1"}));
    EXPECT_FALSE(decoder.isHeaderRow({"DATE", "TIME", "RPM"}));
    EXPECT_FALSE(decoder.isHeaderRow({"06/01/2024", "14:02:10", "2410", "24.8"}));
    EXPECT_FALSE(decoder.isHeaderRow({}));
}

TEST_F(CGR30PTest, DetectByModelLine) {
    EXPECT_TRUE(decoder.isCGR30P({"Electronics International CGR-30P Data Log"}));
    EXPECT_TRUE(decoder.isCGR30P({"Model: cgr 30p"}));
}

TEST_F(CGR30PTest, DetectByColumns) {
    EXPECT_TRUE(decoder.isCGR30P({"DATE,TIME,RPM,EGT1,CHT1"}));
    EXPECT_FALSE(decoder.isCGR30P({"DATE,TIME,RPM,MAP"}));
    EXPECT_FALSE(decoder.isCGR30P({"hello", "world"}));
    EXPECT_FALSE(decoder.isCGR30P({}));
}

// =============================================================================
// Preamble
// =============================================================================

TEST_F(CGR30PTest, PreambleColonPairs) {
    EXPECT_TRUE(decoder.decodePreambleLine("Aircraft ID: N12345", metadata));
    EXPECT_TRUE(decoder.decodePreambleLine("Serial Number: 30P-0042", metadata));
    EXPECT_TRUE(decoder.decodePreambleLine("Software Version: 2.14", metadata));

    EXPECT_EQ(metadata.aircraft_id, "N12345");
    EXPECT_EQ(metadata.serial_number, "30P-0042");
    EXPECT_EQ(metadata.software_version, "2.14");
    EXPECT_TRUE(metadata.extra.empty());
}

TEST_F(CGR30PTest, PreambleCsvPairs) {
    EXPECT_TRUE(decoder.decodePreambleLine("Tail Number,N54321", metadata));
    EXPECT_TRUE(decoder.decodePreambleLine("Start,14:02", metadata));
    EXPECT_TRUE(decoder.decodePreambleLine("Pilot,J. Smith,,", metadata));

    EXPECT_EQ(metadata.aircraft_id, "N54321");
    ASSERT_EQ(metadata.extra.size(), 2u);
    EXPECT_EQ(metadata.extra[0].first, "Start");
    EXPECT_EQ(metadata.extra[0].second, "14:02");
    EXPECT_EQ(metadata.extra[1].first, "Pilot");
    EXPECT_EQ(metadata.extra[1].second, "J. Smith");
}

TEST_F(CGR30PTest, PreambleModelAndUnit) {
    EXPECT_TRUE(decoder.decodePreambleLine("Electronics International CGR-30P", metadata));
    EXPECT_EQ(metadata.model, MODEL_NAME);

    EXPECT_FALSE(metadata.temperature_unit_declared);
    EXPECT_TRUE(decoder.decodePreambleLine("Temperature Unit: Celsius", metadata));
    EXPECT_TRUE(metadata.temperature_unit_declared);
    EXPECT_EQ(metadata.temperature_unit, TemperatureUnit::CELSIUS);
}

TEST_F(CGR30PTest, PreambleUnrecognized) {
    EXPECT_FALSE(decoder.decodePreambleLine("", metadata));
    EXPECT_FALSE(decoder.decodePreambleLine("   ", metadata));
    EXPECT_FALSE(decoder.decodePreambleLine("just some text", metadata));
    EXPECT_FALSE(decoder.decodePreambleLine("a,b,c", metadata));
    EXPECT_TRUE(metadata.extra.empty());
}

// =============================================================================
// Header
// =============================================================================

TEST_F(CGR30PTest, HeaderLayout) {
    decodeHeader("DATE,TIME,RPM,MAP,EGT1,EGT2,CHT1,CHT2,OIL P,OIL T,Remarks");

    const auto& columns = decoder.columns();
    ASSERT_EQ(columns.size(), 11u);
    EXPECT_EQ(columns[0].channel, Channel::DATE);
    EXPECT_EQ(columns[2].channel, Channel::RPM);
    EXPECT_EQ(columns[5].channel, Channel::EGT);
    EXPECT_EQ(columns[5].cylinder, 2);
    EXPECT_EQ(columns[10].channel, Channel::NONE);
    EXPECT_TRUE(warnings.empty());
}

TEST_F(CGR30PTest, HeaderCylinderLimit) {
    CGR30P_Decoder four(4);
    auto result = four.decodeHeader(utils::splitCsvLine("RPM,EGT1,EGT4,EGT5"),
                                    metadata, 7, warnings);
    ASSERT_TRUE(result.success);

    EXPECT_EQ(four.columns()[3].channel, Channel::NONE);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].line, 7u);
    EXPECT_EQ(warnings[0].message, "Column 'EGT5' exceeds 4 cylinders, ignored");
}

TEST_F(CGR30PTest, HeaderDuplicateColumn) {
    decodeHeader("RPM,MAP,Tach");

    EXPECT_EQ(decoder.columns()[2].channel, Channel::NONE);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].message, "Duplicate column 'Tach' ignored");
}

TEST_F(CGR30PTest, HeaderWithoutDataChannels) {
    auto result = decoder.decodeHeader({"DATE", "TIME", "Remarks"}, metadata, 1, warnings);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Header has no data channels");
    EXPECT_TRUE(decoder.columns().empty());
}

TEST_F(CGR30PTest, HeaderTakesMetadataUnit) {
    metadata.temperature_unit = TemperatureUnit::CELSIUS;
    metadata.temperature_unit_declared = true;
    decodeHeader("RPM,EGT1,CHT1 (F)");

    EXPECT_EQ(decoder.columns()[1].unit, TemperatureUnit::CELSIUS);
    EXPECT_EQ(decoder.columns()[2].unit, TemperatureUnit::FAHRENHEIT);
}

// =============================================================================
// Rows
// =============================================================================

TEST_F(CGR30PTest, RowBeforeHeader) {
    EngineRecord record;
    auto result = decodeRow("2410,24.8", record);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Column header not decoded");
}

TEST_F(CGR30PTest, FullRow) {
    decodeHeader("DATE,TIME,RPM,MAP,EGT1,EGT2,CHT1,CHT2,OIL P,OIL T,FUEL P,VOLTS,AMPS,G");

    EngineRecord record;
    auto result = decodeRow("06/01/2024,14:02:10,2410,24.8,1310,1295,352,360,62,185,24.5,14.1,12.3,1.02",
                            record);
    ASSERT_TRUE(result.success) << result.error;

    const EngineData& data = record.data;
    EXPECT_EQ(record.date, "06/01/2024");
    EXPECT_EQ(record.time, "14:02:10");
    EXPECT_DOUBLE_EQ(*data.rpm, 2410.0);
    EXPECT_DOUBLE_EQ(*data.manifold_pressure, 24.8);
    ASSERT_EQ(data.egts.size(), 2u);
    EXPECT_DOUBLE_EQ(data.egts[1].value, 1295.0);
    ASSERT_EQ(data.chts.size(), 2u);
    EXPECT_DOUBLE_EQ(data.chts[0].value, 352.0);
    EXPECT_DOUBLE_EQ(*data.oil_pressure, 62.0);
    EXPECT_DOUBLE_EQ(*data.oil_temperature, 185.0);
    EXPECT_DOUBLE_EQ(*data.fuel_pressure, 24.5);
    EXPECT_DOUBLE_EQ(*data.volts, 14.1);
    EXPECT_DOUBLE_EQ(*data.amps, 12.3);
    EXPECT_DOUBLE_EQ(*data.g_force, 1.02);
    EXPECT_TRUE(warnings.empty());
}

TEST_F(CGR30PTest, CylindersSortedByNumber) {
    decodeHeader("RPM,EGT3,EGT1,EGT2");

    EngineRecord record;
    ASSERT_TRUE(decodeRow("2400,1330,1310,1320", record).success);

    ASSERT_EQ(record.data.egts.size(), 3u);
    EXPECT_EQ(record.data.egts[0].number, 1);
    EXPECT_DOUBLE_EQ(record.data.egts[0].value, 1310.0);
    EXPECT_EQ(record.data.egts[2].number, 3);
}

TEST_F(CGR30PTest, CelsiusConvertedToFahrenheit) {
    decodeHeader("RPM,CHT1 (C),EGT1 (C),OIL T (C)");

    EngineRecord record;
    ASSERT_TRUE(decodeRow("2400,200,700,100", record).success);

    EXPECT_DOUBLE_EQ(record.data.chts[0].value, 392.0);
    EXPECT_DOUBLE_EQ(record.data.egts[0].value, 1292.0);
    EXPECT_DOUBLE_EQ(*record.data.oil_temperature, 212.0);
    EXPECT_DOUBLE_EQ(*record.data.rpm, 2400.0);
}

TEST_F(CGR30PTest, MissingValuesLeftAbsent) {
    decodeHeader("RPM,MAP,EGT1,EGT2,OIL P");

    EngineRecord record;
    ASSERT_TRUE(decodeRow("2400,---,1310,,N/A", record).success);

    EXPECT_TRUE(record.data.rpm.has_value());
    EXPECT_FALSE(record.data.manifold_pressure.has_value());
    ASSERT_EQ(record.data.egts.size(), 1u);
    EXPECT_EQ(record.data.egts[0].number, 1);
    EXPECT_FALSE(record.data.oil_pressure.has_value());
}

TEST_F(CGR30PTest, ShortRowReadsAsMissing) {
    decodeHeader("RPM,MAP,EGT1");

    EngineRecord record;
    ASSERT_TRUE(decodeRow("2400", record).success);
    EXPECT_FALSE(record.data.manifold_pressure.has_value());
    EXPECT_TRUE(record.data.egts.empty());
}

TEST_F(CGR30PTest, InvalidValueWarns) {
    decodeHeader("RPM,MAP");

    EngineRecord record;
    auto result = decodeRow("abc,24.8", record);
    ASSERT_TRUE(result.success);

    EXPECT_FALSE(record.data.rpm.has_value());
    EXPECT_DOUBLE_EQ(*record.data.manifold_pressure, 24.8);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].line, 2u);
    EXPECT_EQ(warnings[0].message, "Invalid value 'abc' in column 'RPM'");
}

TEST_F(CGR30PTest, InvalidValueStrict) {
    decodeHeader("RPM,MAP");

    EngineRecord record;
    auto result = decodeRow("2400,24.8x", record, true);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.no_data);
    EXPECT_EQ(result.error, "Invalid value '24.8x' in column 'MAP'");
}

TEST_F(CGR30PTest, RowWithoutValues) {
    decodeHeader("DATE,TIME,RPM,MAP");

    EngineRecord record;
    auto result = decodeRow("06/01/2024,14:02:10,,-", record);
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.no_data);
    EXPECT_EQ(result.error, "Row has no channel values");
}

TEST_F(CGR30PTest, ExtraFieldsWarn) {
    decodeHeader("RPM,MAP");

    EngineRecord record;
    ASSERT_TRUE(decodeRow("2400,24.8,x,y", record).success);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].message, "Row has 2 fields beyond the header");

    // Trailing empty fields are not worth a warning
    warnings.clear();
    EngineRecord trailing;
    ASSERT_TRUE(decodeRow("2400,24.8,,", trailing).success);
    EXPECT_TRUE(warnings.empty());
}

TEST_F(CGR30PTest, ResetForgetsHeader) {
    decodeHeader("RPM,MAP");
    decoder.reset();
    EXPECT_TRUE(decoder.columns().empty());

    EngineRecord record;
    EXPECT_FALSE(decodeRow("2400,24.8", record).success);
}
