#include "PerformanceRun.hpp"
#include "ConfigReader.hpp"
#include "UnitSystem.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <cerrno>
#include <cmath>
#include <sys/stat.h>

namespace BlendSim {

PerformanceRun::PerformanceRun(MPI_Comm comm_in) : comm(comm_in), rank(0) {
    MPI_Comm_rank(comm, &rank);
}

PetscErrorCode PerformanceRun::initialize(const RunConfig& cfg) {
    PetscFunctionBeginUser;

    config = cfg;
    computed_ = false;

    PetscFunctionReturn(0);
}

PetscErrorCode PerformanceRun::initializeFromConfigFile(const std::string& config_file) {
    PetscFunctionBeginUser;

    if (rank == 0) {
        PetscPrintf(comm, "Loading configuration from: %s\n", config_file.c_str());
    }

    ConfigReader reader;
    if (!reader.loadFile(config_file)) {
        SETERRQ(comm, PETSC_ERR_FILE_OPEN, "Failed to load configuration file");
    }

    ConfigReader::ValidationResult validation = reader.validate();
    if (rank == 0) {
        for (const auto& w : validation.warnings) {
            PetscPrintf(comm, "  Warning: %s\n", w.c_str());
        }
        for (const auto& e : validation.errors) {
            PetscPrintf(comm, "  Error: %s\n", e.c_str());
        }
    }
    if (!validation.valid) {
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "Invalid parameter in configuration file");
    }

    RunConfig cfg;
    reader.parseRunConfig(cfg);
    config = cfg;
    computed_ = false;

    PetscFunctionReturn(0);
}

PetscErrorCode PerformanceRun::setFromOptions() {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;
    PetscBool flg;
    PetscReal rval;
    PetscInt ival;
    char buffer[PETSC_MAX_PATH_LEN];

    ierr = PetscOptionsGetReal(nullptr, nullptr, "-rpm_start", &rval, &flg); CHKERRQ(ierr);
    if (flg) { config.sweep.rpm_start = rval; config.sweep.rpm_values.clear(); }
    ierr = PetscOptionsGetReal(nullptr, nullptr, "-rpm_end", &rval, &flg); CHKERRQ(ierr);
    if (flg) { config.sweep.rpm_end = rval; config.sweep.rpm_values.clear(); }
    ierr = PetscOptionsGetReal(nullptr, nullptr, "-rpm_step", &rval, &flg); CHKERRQ(ierr);
    if (flg) { config.sweep.rpm_step = rval; config.sweep.rpm_values.clear(); }

    ierr = PetscOptionsGetReal(nullptr, nullptr, "-noise", &rval, &flg); CHKERRQ(ierr);
    if (flg) {
        if (!(rval >= 0.0) || !std::isfinite(rval)) {
            SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "Invalid parameter: -noise must be non-negative");
        }
        config.noise.fraction = rval;
        config.noise.enabled = rval > 0.0;
    }
    ierr = PetscOptionsGetInt(nullptr, nullptr, "-seed", &ival, &flg); CHKERRQ(ierr);
    if (flg) {
        if (ival < 0) {
            SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "Invalid parameter: -seed must be non-negative");
        }
        config.noise.seed = static_cast<unsigned int>(ival);
    }

    ierr = PetscOptionsGetString(nullptr, nullptr, "-o", buffer, sizeof(buffer), &flg); CHKERRQ(ierr);
    if (flg) config.output.directory = buffer;
    ierr = PetscOptionsGetString(nullptr, nullptr, "-basename", buffer, sizeof(buffer), &flg); CHKERRQ(ierr);
    if (flg) config.output.basename = buffer;

    ierr = PetscOptionsHasName(nullptr, nullptr, "-no_plots", &flg); CHKERRQ(ierr);
    if (flg) config.output.render_plots = false;

    PetscFunctionReturn(0);
}

PetscErrorCode PerformanceRun::setup() {
    PetscFunctionBeginUser;

    try {
        EngineGeometry geometry(config.engine.compression_ratio,
                                config.engine.bore, config.engine.stroke);
        RPMSweep sweep = RPMSweep::fromConfig(config.sweep);

        model_ = std::make_unique<PerformanceModel>(geometry, sweep);
        noise_ = std::make_unique<NoiseInjector>(config.noise.enabled ? config.noise.fraction : 0.0,
                                                 config.noise.seed);
    } catch (const std::invalid_argument& e) {
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "%s", e.what());
    }

    if (rank == 0) {
        if (mkdir(config.output.directory.c_str(), 0755) != 0 && errno != EEXIST) {
            PetscPrintf(comm, "Warning: cannot create output directory %s\n",
                        config.output.directory.c_str());
        }

        UnitSystem units;
        const EngineGeometry& g = model_->getGeometry();
        PetscPrintf(comm, "Engine geometry:\n");
        PetscPrintf(comm, "  Compression ratio: %g\n", g.getCompressionRatio());
        PetscPrintf(comm, "  Bore:              %s\n",
                    units.formatValue(units.fromBase(g.getBore(), "mm"), "mm", 4).c_str());
        PetscPrintf(comm, "  Stroke:            %s\n",
                    units.formatValue(units.fromBase(g.getStroke(), "mm"), "mm", 4).c_str());
        PetscPrintf(comm, "  Swept volume:      %s\n",
                    units.formatValue(units.fromBase(g.sweptVolume(), "cm3"), "cm3", 6).c_str());
        PetscPrintf(comm, "Speed sweep:         %g .. %g rpm (%d points)\n",
                    model_->getSweep().values().front(), model_->getSweep().values().back(),
                    static_cast<int>(model_->getSweep().size()));
        if (config.noise.enabled) {
            PetscPrintf(comm, "Measurement noise:   %g %% (seed %u)\n",
                        100.0 * config.noise.fraction, config.noise.seed);
        } else {
            PetscPrintf(comm, "Measurement noise:   disabled\n");
        }
    }

    PetscFunctionReturn(0);
}

PetscErrorCode PerformanceRun::run() {
    PetscFunctionBeginUser;

    if (!model_ || !noise_) {
        SETERRQ(comm, PETSC_ERR_ORDER, "PerformanceRun::setup() must be called before run()");
    }

    try {
        auto series = model_->computeAll();
        e10_model_ = series.first;
        e20_model_ = series.second;
    } catch (const std::domain_error& e) {
        SETERRQ(comm, PETSC_ERR_FP, "%s", e.what());
    }

    // Each run draws from a freshly seeded generator
    noise_->reseed(config.noise.seed);
    e10_ = e10_model_;
    e20_ = e20_model_;
    if (config.noise.enabled) {
        noise_->apply(e10_, e20_);
    }

    computed_ = true;

    PetscFunctionReturn(0);
}

const PerformanceSeries& PerformanceRun::getModelSeries(FuelBlend blend) const {
    return blend == FuelBlend::E20 ? e20_model_ : e10_model_;
}

const PerformanceSeries& PerformanceRun::getSeries(FuelBlend blend) const {
    return blend == FuelBlend::E20 ? e20_ : e10_;
}

void PerformanceRun::printSeriesTable(const PerformanceSeries& series) const {
    PetscPrintf(comm, "\n%s\n", series.name().c_str());
    PetscPrintf(comm, "  %8s %12s %12s %14s %12s\n",
                "RPM", "Power (kW)", "Torque (Nm)", "BSFC (g/kWh)", "Eta (%)");
    for (const auto& p : series.points) {
        PetscPrintf(comm, "  %8.0f %12.3f %12.3f %14.3f %12.3f\n",
                    p.rpm, p.brake_power, p.torque, 1000.0 * p.bsfc,
                    100.0 * p.thermal_efficiency);
    }
}

PetscErrorCode PerformanceRun::writeSummary() {
    PetscFunctionBeginUser;

    if (!computed_) {
        SETERRQ(comm, PETSC_ERR_ORDER, "PerformanceRun::run() must be called before writeSummary()");
    }

    PerformanceSummary s10 = summarize(e10_);
    PerformanceSummary s20 = summarize(e20_);
    BlendComparison cmp = compareBlends(s10, s20);

    if (rank == 0) {
        printSeriesTable(e10_);
        printSeriesTable(e20_);

        PetscPrintf(comm, "\nBlend comparison (E20 relative to E10)\n");
        PetscPrintf(comm, "  Peak brake power: %8.3f kW @ %5.0f rpm vs %8.3f kW @ %5.0f rpm (%+.2f %%)\n",
                    s10.peak_power, s10.peak_power_rpm, s20.peak_power, s20.peak_power_rpm,
                    cmp.peak_power_change);
        PetscPrintf(comm, "  Peak torque:      %8.3f Nm @ %5.0f rpm vs %8.3f Nm @ %5.0f rpm (%+.2f %%)\n",
                    s10.peak_torque, s10.peak_torque_rpm, s20.peak_torque, s20.peak_torque_rpm,
                    cmp.peak_torque_change);
        PetscPrintf(comm, "  Minimum BSFC:     %8.3f g/kWh @ %5.0f rpm vs %8.3f g/kWh @ %5.0f rpm (%+.2f %%)\n",
                    1000.0 * s10.min_bsfc, s10.min_bsfc_rpm, 1000.0 * s20.min_bsfc, s20.min_bsfc_rpm,
                    cmp.min_bsfc_change);
        PetscPrintf(comm, "  Mean efficiency:  %8.3f %% vs %8.3f %% (%+.2f %%)\n",
                    100.0 * s10.mean_efficiency, 100.0 * s20.mean_efficiency,
                    cmp.mean_efficiency_change);

        std::string path = config.output.directory + "/" + config.output.basename + "_SUMMARY.txt";
        std::ofstream summary(path);
        if (summary) {
            summary << "E10 vs E20 Performance Summary\n";
            summary << "==============================\n\n";
            summary << "Noise fraction: " << (config.noise.enabled ? config.noise.fraction : 0.0)
                    << " (seed " << config.noise.seed << ")\n\n";
            for (const auto* item : {&s10, &s20}) {
                summary << (item == &s10 ? "E10" : "E20") << "\n";
                summary << "  Peak brake power (kW): " << item->peak_power
                        << " at " << item->peak_power_rpm << " rpm\n";
                summary << "  Peak torque (Nm): " << item->peak_torque
                        << " at " << item->peak_torque_rpm << " rpm\n";
                summary << "  Minimum BSFC (g/kWh): " << 1000.0 * item->min_bsfc
                        << " at " << item->min_bsfc_rpm << " rpm\n";
                summary << "  Mean thermal efficiency (%): " << 100.0 * item->mean_efficiency << "\n\n";
            }
            summary << "E20 change relative to E10 (%)\n";
            summary << "  Peak brake power: " << cmp.peak_power_change << "\n";
            summary << "  Peak torque: " << cmp.peak_torque_change << "\n";
            summary << "  Minimum BSFC: " << cmp.min_bsfc_change << "\n";
            summary << "  Mean thermal efficiency: " << cmp.mean_efficiency_change << "\n";
        } else {
            PetscPrintf(comm, "Warning: cannot write summary file %s\n", path.c_str());
        }
    }

    PetscFunctionReturn(0);
}

PetscErrorCode PerformanceRun::generatePlots() {
    PetscFunctionBeginUser;

    if (!computed_) {
        SETERRQ(comm, PETSC_ERR_ORDER, "PerformanceRun::run() must be called before generatePlots()");
    }

    if (rank == 0) {
        ReportExporter exporter(config.output);
        export_result_ = exporter.exportReport(e10_, e20_);

        for (const auto& w : export_result_.warnings) {
            PetscPrintf(comm, "Warning: %s\n", w.c_str());
        }
        for (const auto& f : export_result_.files) {
            PetscPrintf(comm, "  Wrote %s\n", f.c_str());
        }
    }

    PetscFunctionReturn(0);
}

} // namespace BlendSim
