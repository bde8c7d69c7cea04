/**
 * @file test_config_reader.cpp
 * @brief Unit tests for ConfigReader class
 */

#include <gtest/gtest.h>
#include "ConfigReader.hpp"
#include "BlendSim.hpp"
#include <fstream>
#include <cstdio>

using namespace BlendSim;

class ConfigReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
        test_config_file = "test_config_unit.config";

        if (rank == 0) {
            std::ofstream config(test_config_file);
            config << "# engine test deck\n";
            config << "[engine]\n";
            config << "compression_ratio = 9.5\n";
            config << "bore = 86 mm\n";
            config << "stroke = 0.086\n";
            config << "\n[SWEEP]\n";
            config << "rpm_start = 1500\n";
            config << "rpm_end = 4500\n";
            config << "rpm_step = 250      # fine sweep\n";
            config << "\n[NOISE]\n";
            config << "enabled = yes\n";
            config << "fraction = 1.5 %\n";
            config << "seed = 42\n";
            config << "\n[OUTPUT]\n";
            config << "directory = results\n";
            config << "basename = blend_test\n";
            config << "render_plots = false\n";
            config.close();
        }
        MPI_Barrier(PETSC_COMM_WORLD);
    }

    void TearDown() override {
        MPI_Barrier(PETSC_COMM_WORLD);
        if (rank == 0) {
            std::remove(test_config_file.c_str());
        }
    }

    void writeDeck(const std::string& filename, const std::string& body) {
        if (rank == 0) {
            std::ofstream deck(filename);
            deck << body;
        }
        MPI_Barrier(PETSC_COMM_WORLD);
    }

    std::string test_config_file;
    int rank;
};

TEST_F(ConfigReaderTest, LoadConfigFile) {
    ConfigReader reader;
    bool loaded = reader.loadFile(test_config_file);
    EXPECT_TRUE(loaded) << "Should load config file successfully";
}

TEST_F(ConfigReaderTest, MissingFileFailsToLoad) {
    ConfigReader reader;
    EXPECT_FALSE(reader.loadFile("does_not_exist.config"));
}

TEST_F(ConfigReaderTest, SectionNamesAreNormalized) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    EXPECT_TRUE(reader.hasSection("ENGINE"));
    EXPECT_FALSE(reader.hasSection("engine"));
    EXPECT_TRUE(reader.hasKey("ENGINE", "bore"));
    EXPECT_EQ(reader.getSections().size(), 4u);
}

TEST_F(ConfigReaderTest, ReadPlainValues) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    EXPECT_DOUBLE_EQ(reader.getDouble("ENGINE", "compression_ratio"), 9.5);
    EXPECT_EQ(reader.getInt("NOISE", "seed"), 42);
    EXPECT_TRUE(reader.getBool("NOISE", "enabled"));
    EXPECT_FALSE(reader.getBool("OUTPUT", "render_plots", true));
    EXPECT_EQ(reader.getString("OUTPUT", "basename"), "blend_test");

    // Inline comment stripped
    EXPECT_DOUBLE_EQ(reader.getDouble("SWEEP", "rpm_step"), 250.0);
}

TEST_F(ConfigReaderTest, DefaultsForMissingKeys) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    EXPECT_EQ(reader.getInt("SWEEP", "missing", 7), 7);
    EXPECT_DOUBLE_EQ(reader.getDouble("NOPE", "x", 1.25), 1.25);
    EXPECT_EQ(reader.getString("OUTPUT", "missing", "fallback"), "fallback");
}

TEST_F(ConfigReaderTest, UnitAwareValues) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    EXPECT_NEAR(reader.getDoubleWithUnit("ENGINE", "bore", 0.0, "m"), 0.086, 1e-12);
    EXPECT_NEAR(reader.getDoubleWithUnit("ENGINE", "stroke", 0.0, "m"), 0.086, 1e-12);
    EXPECT_NEAR(reader.getDoubleWithUnit("NOISE", "fraction", 0.0, "fraction"), 0.015, 1e-12);
}

TEST_F(ConfigReaderTest, ParseRunConfig) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    RunConfig config;
    reader.parseRunConfig(config);

    EXPECT_DOUBLE_EQ(config.engine.compression_ratio, 9.5);
    EXPECT_NEAR(config.engine.bore, 0.086, 1e-12);
    EXPECT_DOUBLE_EQ(config.sweep.rpm_start, 1500.0);
    EXPECT_DOUBLE_EQ(config.sweep.rpm_end, 4500.0);
    EXPECT_TRUE(config.sweep.rpm_values.empty());
    EXPECT_TRUE(config.noise.enabled);
    EXPECT_NEAR(config.noise.fraction, 0.015, 1e-12);
    EXPECT_EQ(config.noise.seed, 42u);
    EXPECT_EQ(config.output.directory, "results");
    EXPECT_EQ(config.output.basename, "blend_test");
    EXPECT_TRUE(config.output.write_png);
    EXPECT_FALSE(config.output.render_plots);
}

TEST_F(ConfigReaderTest, ValidConfigPasses) {
    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(test_config_file));

    ConfigReader::ValidationResult result = reader.validate();
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(ConfigReaderTest, InvalidValuesAreReported) {
    const std::string deck = "test_config_invalid.config";
    writeDeck(deck,
              "[ENGINE]\nbore = -80 mm\n"
              "[SWEEP]\nrpm_start = 3000\nrpm_end = 1000\n"
              "[NOISE]\nfraction = -0.1\nseed = -4\n"
              "[DYNO]\nbrake = water\n");

    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(deck));
    ConfigReader::ValidationResult result = reader.validate();

    EXPECT_FALSE(result.valid);
    EXPECT_GE(result.errors.size(), 4u);
    EXPECT_FALSE(result.warnings.empty());

    MPI_Barrier(PETSC_COMM_WORLD);
    if (rank == 0) std::remove(deck.c_str());
}

TEST_F(ConfigReaderTest, ExplicitRpmValues) {
    const std::string deck = "test_config_values.config";
    writeDeck(deck, "[SWEEP]\nrpm_values = 1000, 2500, 4000\n");

    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(deck));

    SweepConfig sweep;
    EXPECT_TRUE(reader.parseSweepConfig(sweep));
    ASSERT_EQ(sweep.rpm_values.size(), 3u);
    EXPECT_DOUBLE_EQ(sweep.rpm_values[1], 2500.0);

    // No [ENGINE] section is only a warning
    ConfigReader::ValidationResult result = reader.validate();
    EXPECT_TRUE(result.valid);
    EXPECT_FALSE(result.warnings.empty());

    MPI_Barrier(PETSC_COMM_WORLD);
    if (rank == 0) std::remove(deck.c_str());
}

TEST_F(ConfigReaderTest, GeneratedTemplateReloads) {
    const std::string deck = "test_config_template.config";
    if (rank == 0) {
        ASSERT_TRUE(ConfigReader::generateTemplate(deck));
    }
    MPI_Barrier(PETSC_COMM_WORLD);

    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(deck));
    EXPECT_TRUE(reader.validate().valid);

    RunConfig config;
    reader.parseRunConfig(config);
    EXPECT_NEAR(config.engine.bore, 0.08, 1e-12);
    EXPECT_NEAR(config.engine.stroke, 0.09, 1e-12);
    EXPECT_DOUBLE_EQ(config.noise.fraction, 0.02);
    EXPECT_EQ(config.noise.seed, 1u);
    EXPECT_EQ(config.output.basename, BLENDSIM_DEFAULT_BASENAME);

    MPI_Barrier(PETSC_COMM_WORLD);
    if (rank == 0) std::remove(deck.c_str());
}
