#ifndef BLENDSIM_HPP
#define BLENDSIM_HPP

#include <petsc.h>

#include <string>
#include <vector>
#include <memory>
#include <map>
#include <utility>

namespace BlendSim {

// Forward declarations
class PerformanceModel;
class NoiseInjector;
class ReportExporter;
class ConfigReader;
class PerformanceRun;

/**
 * @brief Ethanol-petrol blends modelled by the simulator
 */
enum class FuelBlend {
    E10,    ///< 10% ethanol by volume
    E20     ///< 20% ethanol by volume
};

std::string blendName(FuelBlend blend);

#define BLENDSIM_VERSION "1.0.0"

// Default output base filename for figure, script, data and table
#define BLENDSIM_DEFAULT_BASENAME "E10_E20_PerformanceGraphs"

// Configuration structures
struct EngineConfig {
    double compression_ratio = 10.0;   ///< Dimensionless
    double bore = 0.08;                ///< m
    double stroke = 0.09;              ///< m
};

struct SweepConfig {
    double rpm_start = 1000.0;
    double rpm_end = 5000.0;
    double rpm_step = 500.0;

    // Explicit speed list; overrides start/end/step when non-empty
    std::vector<double> rpm_values;
};

struct NoiseConfig {
    bool enabled = true;
    double fraction = 0.02;            ///< Relative standard deviation (2%)
    unsigned int seed = 1;
};

struct OutputConfig {
    std::string directory = ".";
    std::string basename = BLENDSIM_DEFAULT_BASENAME;
    bool write_png = true;
    bool write_pdf = true;
    bool write_data = true;            ///< CSV table of post-noise values
    bool render_plots = true;          ///< Invoke gnuplot on the generated script
};

struct RunConfig {
    EngineConfig engine;
    SweepConfig sweep;
    NoiseConfig noise;
    OutputConfig output;
};

} // namespace BlendSim

#endif // BLENDSIM_HPP
