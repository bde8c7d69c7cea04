#ifndef PERFORMANCE_RUN_HPP
#define PERFORMANCE_RUN_HPP

#include "BlendSim.hpp"
#include "EngineModel.hpp"
#include "NoiseInjector.hpp"
#include "ReportExporter.hpp"
#include <petsc.h>
#include <memory>
#include <string>

namespace BlendSim {

/**
 * @brief One invocation of the E10/E20 comparison
 *
 * Owns the configuration, the model, the seeded noise generator and the
 * resulting series. Typical sequence:
 *
 *   initializeFromConfigFile() or initialize()
 *   setFromOptions()   command-line overrides
 *   setup()            validates parameters, builds model and injector
 *   run()              model, then noise
 *   writeSummary()
 *   generatePlots()
 *
 * Computation happens on every rank; console and file output on rank 0.
 */
class PerformanceRun {
public:
    explicit PerformanceRun(MPI_Comm comm);
    ~PerformanceRun() = default;

    PetscErrorCode initialize(const RunConfig& cfg);
    PetscErrorCode initializeFromConfigFile(const std::string& config_file);
    PetscErrorCode setFromOptions();
    PetscErrorCode setup();
    PetscErrorCode run();
    PetscErrorCode writeSummary();
    PetscErrorCode generatePlots();

    const RunConfig& getConfig() const { return config; }

    /// Series before noise injection
    const PerformanceSeries& getModelSeries(FuelBlend blend) const;

    /// Series after noise injection (identical to the model series when noise is off)
    const PerformanceSeries& getSeries(FuelBlend blend) const;

    const ReportExporter::ExportResult& getExportResult() const { return export_result_; }
    bool isComputed() const { return computed_; }

private:
    MPI_Comm comm;
    int rank;
    RunConfig config;

    std::unique_ptr<PerformanceModel> model_;
    std::unique_ptr<NoiseInjector> noise_;

    PerformanceSeries e10_model_, e20_model_;
    PerformanceSeries e10_, e20_;

    ReportExporter::ExportResult export_result_;
    bool computed_ = false;

    void printSeriesTable(const PerformanceSeries& series) const;
};

} // namespace BlendSim

#endif // PERFORMANCE_RUN_HPP
