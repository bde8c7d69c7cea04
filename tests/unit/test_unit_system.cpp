/**
 * @file test_unit_system.cpp
 * @brief Unit tests for UnitSystem conversions used by the engine report
 */

#include <gtest/gtest.h>
#include "UnitSystem.hpp"
#include <stdexcept>

using namespace BlendSim;

class UnitSystemTest : public ::testing::Test {
protected:
    UnitSystem units;
};

// ============================================================================
// Lookup
// ============================================================================

TEST_F(UnitSystemTest, KnownUnits) {
    EXPECT_TRUE(units.hasUnit("mm"));
    EXPECT_TRUE(units.hasUnit("g/kWh"));
    EXPECT_TRUE(units.hasUnit("%"));
    EXPECT_FALSE(units.hasUnit("furlong"));

    EXPECT_EQ(units.getUnit("furlong"), nullptr);
    EXPECT_THROW(units.getDimension("furlong"), std::runtime_error);
}

TEST_F(UnitSystemTest, Compatibility) {
    EXPECT_TRUE(units.areCompatible("kW", "hp"));
    EXPECT_TRUE(units.areCompatible("kg/kWh", "g/kWh"));
    EXPECT_FALSE(units.areCompatible("kW", "N-m"));
    EXPECT_THROW(units.convert(1.0, "kW", "N-m"), std::runtime_error);
}

// ============================================================================
// Conversions
// ============================================================================

TEST_F(UnitSystemTest, LengthToBase) {
    EXPECT_NEAR(units.toBase(80.0, "mm"), 0.08, 1e-15);
    EXPECT_NEAR(units.toBase(9.0, "cm"), 0.09, 1e-15);
    EXPECT_NEAR(units.fromBase(0.0254, "in"), 1.0, 1e-12);
}

TEST_F(UnitSystemTest, PowerAndTorque) {
    EXPECT_NEAR(units.convert(1.0, "hp", "kW"), 0.74569987, 1e-8);
    EXPECT_NEAR(units.convert(100.0, "N-m", "lbf-ft"), 73.7562149, 1e-6);
}

TEST_F(UnitSystemTest, SpecificFuelConsumption) {
    EXPECT_NEAR(units.convert(0.25838, "kg/kWh", "g/kWh"), 258.38, 1e-9);

    std::vector<double> bsfc = {0.25, 0.33};
    std::vector<double> grams = units.convert(bsfc, "kg/kWh", "g/kWh");
    ASSERT_EQ(grams.size(), 2u);
    EXPECT_NEAR(grams[0], 250.0, 1e-9);
    EXPECT_NEAR(grams[1], 330.0, 1e-9);
}

TEST_F(UnitSystemTest, FractionToPercent) {
    EXPECT_NEAR(units.convert(0.32, "fraction", "%"), 32.0, 1e-12);
    EXPECT_NEAR(units.toBase(2.0, "%"), 0.02, 1e-15);
}

// ============================================================================
// Parsing
// ============================================================================

TEST_F(UnitSystemTest, ParseValueWithUnit) {
    double value;
    std::string unit;

    ASSERT_TRUE(units.parseValueWithUnit("80 mm", value, unit));
    EXPECT_DOUBLE_EQ(value, 80.0);
    EXPECT_EQ(unit, "mm");

    ASSERT_TRUE(units.parseValueWithUnit("0.09", value, unit));
    EXPECT_DOUBLE_EQ(value, 0.09);
    EXPECT_TRUE(unit.empty());

    EXPECT_FALSE(units.parseValueWithUnit("bore", value, unit));
}

TEST_F(UnitSystemTest, ParseAndConvertToBase) {
    EXPECT_NEAR(units.parseAndConvertToBase("90 mm"), 0.09, 1e-15);
    EXPECT_THROW(units.parseAndConvertToBase("ninety"), std::runtime_error);
}

TEST_F(UnitSystemTest, SuggestedDisplayUnits) {
    EXPECT_EQ(units.getSuggestedDisplayUnit("bsfc"), "g/kWh");
    EXPECT_EQ(units.getSuggestedDisplayUnit("efficiency"), "%");
}
