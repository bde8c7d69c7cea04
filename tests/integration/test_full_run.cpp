/**
 * @file test_full_run.cpp
 * @brief End-to-end runs of the E10/E20 comparison
 */

#include <gtest/gtest.h>
#include "PerformanceRun.hpp"
#include "ConfigReader.hpp"
#include "BlendSim.hpp"
#include <fstream>
#include <vector>
#include <cstdio>
#include <unistd.h>

using namespace BlendSim;

class FullRunTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
        output_dir = "test_full_run_output";

        config.output.directory = output_dir;
        config.output.basename = "full_run";
        config.output.render_plots = false;
    }

    void TearDown() override {
        MPI_Barrier(PETSC_COMM_WORLD);
        if (rank == 0) {
            for (int i = 0; i < 4; ++i) {
                std::remove((output_dir + "/full_run_panel" + std::to_string(i) + ".dat").c_str());
            }
            std::remove((output_dir + "/full_run.gp").c_str());
            std::remove((output_dir + "/full_run.csv").c_str());
            std::remove((output_dir + "/full_run_SUMMARY.txt").c_str());
            rmdir(output_dir.c_str());
            std::remove("test_full_run.config");
        }
    }

    static bool fileExists(const std::string& path) {
        std::ifstream file(path);
        return file.good();
    }

    int rank;
    std::string output_dir;
    RunConfig config;
};

TEST_F(FullRunTest, DefaultRunProducesAllOutputs) {
    PerformanceRun run(PETSC_COMM_WORLD);

    EXPECT_EQ(run.initialize(config), 0);
    EXPECT_EQ(run.setup(), 0);
    EXPECT_FALSE(run.isComputed());
    EXPECT_EQ(run.run(), 0);
    EXPECT_TRUE(run.isComputed());
    EXPECT_EQ(run.writeSummary(), 0);
    EXPECT_EQ(run.generatePlots(), 0);

    EXPECT_EQ(run.getSeries(FuelBlend::E10).size(), 9u);
    EXPECT_EQ(run.getSeries(FuelBlend::E20).size(), 9u);

    if (rank == 0) {
        const ReportExporter::ExportResult& result = run.getExportResult();
        EXPECT_TRUE(result.figure_written);
        EXPECT_TRUE(result.table_written);
        EXPECT_TRUE(fileExists(output_dir + "/full_run.gp"));
        EXPECT_TRUE(fileExists(output_dir + "/full_run.csv"));
        EXPECT_TRUE(fileExists(output_dir + "/full_run_SUMMARY.txt"));
    }
}

TEST_F(FullRunTest, NoiseKeepsModelSeriesIntact) {
    PerformanceRun run(PETSC_COMM_WORLD);
    ASSERT_EQ(run.initialize(config), 0);
    ASSERT_EQ(run.setup(), 0);
    ASSERT_EQ(run.run(), 0);

    const PerformanceSeries& model = run.getModelSeries(FuelBlend::E10);
    const PerformanceSeries& noisy = run.getSeries(FuelBlend::E10);

    ASSERT_EQ(model.size(), noisy.size());
    EXPECT_NEAR(model.points[4].brake_power, 739.0, 0.739);
    EXPECT_NE(model.points[4].brake_power, noisy.points[4].brake_power);
    EXPECT_EQ(model.points[4].rpm, noisy.points[4].rpm);
}

TEST_F(FullRunTest, SameSeedSameResult) {
    PerformanceRun first(PETSC_COMM_WORLD);
    PerformanceRun second(PETSC_COMM_WORLD);
    for (PerformanceRun* run : {&first, &second}) {
        ASSERT_EQ(run->initialize(config), 0);
        ASSERT_EQ(run->setup(), 0);
        ASSERT_EQ(run->run(), 0);
    }

    EXPECT_EQ(first.getSeries(FuelBlend::E20).bsfc(), second.getSeries(FuelBlend::E20).bsfc());
    EXPECT_EQ(first.getSeries(FuelBlend::E10).torque(), second.getSeries(FuelBlend::E10).torque());
}

TEST_F(FullRunTest, RepeatedRunIsReproducible) {
    PerformanceRun run(PETSC_COMM_WORLD);
    ASSERT_EQ(run.initialize(config), 0);
    ASSERT_EQ(run.setup(), 0);

    ASSERT_EQ(run.run(), 0);
    std::vector<double> e10_first = run.getSeries(FuelBlend::E10).brakePower();
    std::vector<double> e20_first = run.getSeries(FuelBlend::E20).thermalEfficiency();

    ASSERT_EQ(run.run(), 0);
    EXPECT_EQ(run.getSeries(FuelBlend::E10).brakePower(), e10_first);
    EXPECT_EQ(run.getSeries(FuelBlend::E20).thermalEfficiency(), e20_first);
}

TEST_F(FullRunTest, DisabledNoiseReturnsModelValues) {
    config.noise.enabled = false;

    PerformanceRun run(PETSC_COMM_WORLD);
    ASSERT_EQ(run.initialize(config), 0);
    ASSERT_EQ(run.setup(), 0);
    ASSERT_EQ(run.run(), 0);

    EXPECT_EQ(run.getSeries(FuelBlend::E10).brakePower(),
              run.getModelSeries(FuelBlend::E10).brakePower());
    EXPECT_EQ(run.getSeries(FuelBlend::E20).thermalEfficiency(),
              run.getModelSeries(FuelBlend::E20).thermalEfficiency());
}

TEST_F(FullRunTest, CommandLineOverrides) {
    PetscOptionsSetValue(nullptr, "-noise", "0");
    PetscOptionsSetValue(nullptr, "-rpm_start", "2000");
    PetscOptionsSetValue(nullptr, "-rpm_end", "4000");
    PetscOptionsSetValue(nullptr, "-rpm_step", "1000");

    PerformanceRun run(PETSC_COMM_WORLD);
    ASSERT_EQ(run.initialize(config), 0);
    PetscErrorCode ierr = run.setFromOptions();

    PetscOptionsClearValue(nullptr, "-noise");
    PetscOptionsClearValue(nullptr, "-rpm_start");
    PetscOptionsClearValue(nullptr, "-rpm_end");
    PetscOptionsClearValue(nullptr, "-rpm_step");

    ASSERT_EQ(ierr, 0);
    EXPECT_FALSE(run.getConfig().noise.enabled);
    EXPECT_DOUBLE_EQ(run.getConfig().sweep.rpm_start, 2000.0);

    ASSERT_EQ(run.setup(), 0);
    ASSERT_EQ(run.run(), 0);
    ASSERT_EQ(run.getSeries(FuelBlend::E10).size(), 3u);
    EXPECT_EQ(run.getSeries(FuelBlend::E10).rpm(), (std::vector<double>{2000.0, 3000.0, 4000.0}));
}

TEST_F(FullRunTest, NegativeNoiseOptionIsRejected) {
    PetscOptionsSetValue(nullptr, "-noise", "-0.05");

    PerformanceRun run(PETSC_COMM_WORLD);
    ASSERT_EQ(run.initialize(config), 0);
    PetscPushErrorHandler(PetscReturnErrorHandler, nullptr);
    PetscErrorCode ierr = run.setFromOptions();
    PetscPopErrorHandler();

    PetscOptionsClearValue(nullptr, "-noise");

    EXPECT_NE(ierr, 0);
    EXPECT_TRUE(run.getConfig().noise.enabled);
    EXPECT_DOUBLE_EQ(run.getConfig().noise.fraction, config.noise.fraction);
}

TEST_F(FullRunTest, RunFromConfigFile) {
    if (rank == 0) {
        std::ofstream deck("test_full_run.config");
        deck << "[ENGINE]\ncompression_ratio = 10\nbore = 80 mm\nstroke = 90 mm\n";
        deck << "[SWEEP]\nrpm_values = 1000, 3000, 5000\n";
        deck << "[NOISE]\nenabled = false\n";
        deck << "[OUTPUT]\ndirectory = " << output_dir << "\nbasename = full_run\n";
        deck << "render_plots = false\n";
    }
    MPI_Barrier(PETSC_COMM_WORLD);

    PerformanceRun run(PETSC_COMM_WORLD);
    ASSERT_EQ(run.initializeFromConfigFile("test_full_run.config"), 0);
    ASSERT_EQ(run.setup(), 0);
    ASSERT_EQ(run.run(), 0);
    ASSERT_EQ(run.generatePlots(), 0);

    const PerformanceSeries& e10 = run.getSeries(FuelBlend::E10);
    ASSERT_EQ(e10.size(), 3u);
    EXPECT_NEAR(e10.points[1].brake_power, 739.27, 0.01);
}

TEST_F(FullRunTest, InvalidGeometryIsReported) {
    config.engine.bore = -0.08;

    PerformanceRun run(PETSC_COMM_WORLD);
    ASSERT_EQ(run.initialize(config), 0);
    PetscPushErrorHandler(PetscReturnErrorHandler, nullptr);
    PetscErrorCode ierr = run.setup();
    PetscPopErrorHandler();

    EXPECT_NE(ierr, 0);
}

TEST_F(FullRunTest, RunBeforeSetupIsReported) {
    PerformanceRun run(PETSC_COMM_WORLD);
    ASSERT_EQ(run.initialize(config), 0);

    PetscPushErrorHandler(PetscReturnErrorHandler, nullptr);
    PetscErrorCode ierr = run.run();
    PetscErrorCode summary_ierr = run.writeSummary();
    PetscPopErrorHandler();

    EXPECT_NE(ierr, 0);
    EXPECT_NE(summary_ierr, 0);
    EXPECT_FALSE(run.isComputed());
}
