#include "ocl_gaiasync/logger.h"
#include "ocl_gaiasync/openclust_catalogue.h"
#include <gtest/gtest.h>
#include <sstream>

using namespace ocl::gaiasync;

namespace {

// Fixed-width catalogue line: name, RA "hh mm ss", Dec "sdd mm ss", class, diameter
std::string entry(const std::string& name, const std::string& ra, const std::string& dec,
                  const std::string& g1_class, const std::string& diam) {
    std::string line(47, ' ');
    line.replace(0, name.size(), name);
    line.replace(18, ra.size(), ra);
    line.replace(27, dec.size(), dec);
    line.replace(37, g1_class.size(), g1_class);
    line.replace(47 - diam.size(), diam.size(), diam);
    return line;
}

void expectParseError(const std::string& line, const std::string& fragment) {
    try {
        OpenClustCatalogue::parseEntry(line);
        FAIL() << "Expected SyncException for: " << line;
    } catch (const SyncException& e) {
        EXPECT_EQ(e.code(), ErrorCode::PARSE_ERROR);
        EXPECT_NE(std::string(e.what()).find(fragment), std::string::npos) << e.what();
    }
}

} // namespace

TEST(OpenClustCatalogueTest, ParsePleiades) {
    Region m45 = OpenClustCatalogue::parseEntry(
        entry("Melotte_22", "03 47 00", "+24 07 00", " 1", "120.0"));

    EXPECT_EQ(m45.name(), "Melotte_22");
    EXPECT_NEAR(m45.coords().ra, 56.75, 1e-9);
    EXPECT_NEAR(m45.coords().dec, 24.0 + 7.0 / 60.0, 1e-9);
    ASSERT_TRUE(m45.isCircular());
    EXPECT_DOUBLE_EQ(std::get<Circular>(m45.shape()).diam, 120.0);
    EXPECT_EQ(m45.properties().at("g1_class"), "1");
    EXPECT_FALSE(m45.serial().has_value());
}

TEST(OpenClustCatalogueTest, NegativeDeclination) {
    Region south = OpenClustCatalogue::parseEntry(
        entry("IC_2391", "08 40 12", "-53 02 00", " 2", "50"));
    EXPECT_NEAR(south.coords().ra, (8.0 + 40.0 / 60.0 + 12.0 / 3600.0) * 15.0, 1e-9);
    EXPECT_NEAR(south.coords().dec, -(53.0 + 2.0 / 60.0), 1e-9);

    // Sign carried by a zero degrees field
    Region near_equator = OpenClustCatalogue::parseEntry(
        entry("Near_Equator", "12 00 00", "-00 30 00", "", "5.5"));
    EXPECT_NEAR(near_equator.coords().dec, -0.5, 1e-9);
    EXPECT_EQ(near_equator.properties().count("g1_class"), 0u);
}

TEST(OpenClustCatalogueTest, MissingDiameter) {
    expectParseError(entry("Berkeley_1", "00 09 36", "+60 28 00", " 1", ""),
                     "does not have diameter info");
}

TEST(OpenClustCatalogueTest, InvalidFields) {
    expectParseError(entry("Bad_RA", "0x 09 36", "+60 28 00", "", "3.0"), "right ascension");
    expectParseError(entry("Bad_Dec", "00 09 36", "+6a 28 00", "", "3.0"), "declination");
    expectParseError(entry("Bad_Diam", "00 09 36", "+60 28 00", "", "abc"), "invalid diameter");
    expectParseError(entry("", "00 09 36", "+60 28 00", "", "3.0"), "without cluster name");

    // Out of range values are rejected by the region itself
    expectParseError(entry("Too_North", "00 09 36", "+95 00 00", "", "3.0"), "");
    expectParseError(entry("Zero_Diam", "00 09 36", "+60 28 00", "", "0"), "");
}

TEST(OpenClustCatalogueTest, ParseSkipsBlankAndInvalidLines) {
    std::stringstream input;
    input << entry("Melotte_22", "03 47 00", "+24 07 00", " 1", "120.0") << "\n"
          << "\n"
          << entry("Berkeley_1", "00 09 36", "+60 28 00", " 1", "") << "\n"
          << entry("NGC_752", "01 57 41", "+37 47 06", " 2", "75") << "\n";

    Logger logger(LogLevel::SILENT);
    auto clusters = OpenClustCatalogue::parse(input, logger);

    ASSERT_EQ(clusters.size(), 2u);
    EXPECT_EQ(clusters.count("Melotte_22"), 1u);
    EXPECT_EQ(clusters.count("NGC_752"), 1u);
    EXPECT_EQ(clusters.count("Berkeley_1"), 0u);
}

TEST(OpenClustCatalogueTest, LaterEntryReplacesEarlier) {
    std::stringstream input;
    input << entry("NGC_752", "01 57 41", "+37 47 06", " 2", "75") << "\n"
          << entry("NGC_752", "01 57 41", "+37 47 06", " 3", "80") << "\n";

    Logger logger(LogLevel::SILENT);
    auto clusters = OpenClustCatalogue::parse(input, logger);

    ASSERT_EQ(clusters.size(), 1u);
    EXPECT_EQ(clusters.at("NGC_752").properties().at("g1_class"), "3");
}

TEST(OpenClustCatalogueTest, MissingFile) {
    Logger logger(LogLevel::SILENT);
    try {
        OpenClustCatalogue::load("/nonexistent/clusters.dat", logger);
        FAIL() << "Expected SyncException";
    } catch (const SyncException& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_PARAMS);
    }
}
