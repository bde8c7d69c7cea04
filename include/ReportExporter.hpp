#ifndef REPORT_EXPORTER_HPP
#define REPORT_EXPORTER_HPP

#include "BlendSim.hpp"
#include "EngineModel.hpp"
#include "GnuplotViz.hpp"
#include "UnitSystem.hpp"
#include <string>
#include <vector>

namespace BlendSim {

/**
 * @brief Renders the E10/E20 comparison figure and data table
 *
 * 2x2 grid: brake power, torque, BSFC (g/kWh) and thermal efficiency (%)
 * against engine speed. E10 is drawn red with circles, E20 blue with
 * squares. The exporter only reads the series it is given.
 */
class ReportExporter {
public:
    struct ExportResult {
        bool figure_written = false;   ///< Script and data written, gnuplot succeeded
        bool table_written = false;
        std::vector<std::string> files;
        std::vector<std::string> warnings;
    };

    explicit ReportExporter(const OutputConfig& config);

    /**
     * @throws std::invalid_argument if the two series are not aligned
     */
    ExportResult exportReport(const PerformanceSeries& e10,
                              const PerformanceSeries& e20);

    /// Panels in display units, in grid order
    std::vector<GnuplotViz::LinePanel> buildPanels(const PerformanceSeries& e10,
                                                   const PerformanceSeries& e20) const;

    bool writeTable(const PerformanceSeries& e10, const PerformanceSeries& e20,
                    const std::string& path) const;

    std::string figurePath(const std::string& extension) const;
    std::string tablePath() const;

private:
    OutputConfig config_;
    UnitSystem units_;

    static void checkAligned(const PerformanceSeries& a, const PerformanceSeries& b);
};

} // namespace BlendSim

#endif // REPORT_EXPORTER_HPP
