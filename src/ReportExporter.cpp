/**
 * @file ReportExporter.cpp
 * @brief Comparison figure and CSV table for the two blends
 */

#include "ReportExporter.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace BlendSim {

namespace {

GnuplotViz::LineStyle e10Style() {
    GnuplotViz::LineStyle style;
    style.label = "E10";
    style.color = "#FF0000";
    style.point_type = 6;
    return style;
}

GnuplotViz::LineStyle e20Style() {
    GnuplotViz::LineStyle style;
    style.label = "E20";
    style.color = "#0000FF";
    style.point_type = 4;
    return style;
}

GnuplotViz::LinePanel makePanel(const std::string& title, const std::string& ylabel,
                                const std::vector<double>& rpm,
                                std::vector<double> y10, std::vector<double> y20) {
    GnuplotViz::LinePanel panel;
    panel.title = title;
    panel.xlabel = "RPM";
    panel.ylabel = ylabel;
    panel.x = rpm;
    panel.y.push_back(std::move(y10));
    panel.y.push_back(std::move(y20));
    panel.styles = {e10Style(), e20Style()};
    return panel;
}

} // namespace

ReportExporter::ReportExporter(const OutputConfig& config) : config_(config) {
    if (config_.directory.empty()) config_.directory = ".";
    if (config_.basename.empty()) config_.basename = BLENDSIM_DEFAULT_BASENAME;
}

void ReportExporter::checkAligned(const PerformanceSeries& a, const PerformanceSeries& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("Series length mismatch: " + a.name() + " has " +
                                    std::to_string(a.size()) + " points, " + b.name() +
                                    " has " + std::to_string(b.size()));
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (a.points[i].rpm != b.points[i].rpm) {
            throw std::invalid_argument("Series rpm axes differ at index " + std::to_string(i));
        }
    }
}

std::string ReportExporter::figurePath(const std::string& extension) const {
    return config_.directory + "/" + config_.basename + "." + extension;
}

std::string ReportExporter::tablePath() const {
    return figurePath("csv");
}

std::vector<GnuplotViz::LinePanel> ReportExporter::buildPanels(const PerformanceSeries& e10,
                                                               const PerformanceSeries& e20) const {
    checkAligned(e10, e20);

    const std::vector<double> rpm = e10.rpm();
    std::vector<GnuplotViz::LinePanel> panels;

    panels.push_back(makePanel("Brake Power vs RPM", "Brake Power (kW)", rpm,
                               e10.brakePower(), e20.brakePower()));
    panels.push_back(makePanel("Torque vs RPM", "Torque (Nm)", rpm,
                               e10.torque(), e20.torque()));
    panels.push_back(makePanel("BSFC vs RPM", "BSFC (g/kWh)", rpm,
                               units_.convert(e10.bsfc(), "kg/kWh", "g/kWh"),
                               units_.convert(e20.bsfc(), "kg/kWh", "g/kWh")));
    panels.push_back(makePanel("Thermal Efficiency vs RPM", "Thermal Efficiency (%)", rpm,
                               units_.convert(e10.thermalEfficiency(), "fraction", "%"),
                               units_.convert(e20.thermalEfficiency(), "fraction", "%")));

    return panels;
}

bool ReportExporter::writeTable(const PerformanceSeries& e10, const PerformanceSeries& e20,
                                const std::string& path) const {
    checkAligned(e10, e20);

    std::ofstream file(path);
    if (!file) return false;

    file << "rpm";
    for (const auto* series : {&e10, &e20}) {
        const std::string n = series->name();
        file << "," << n << "_brake_power_kW"
             << "," << n << "_torque_Nm"
             << "," << n << "_bsfc_g_per_kWh"
             << "," << n << "_thermal_efficiency_pct";
    }
    file << "\n";

    file << std::setprecision(10);
    for (size_t i = 0; i < e10.size(); ++i) {
        file << e10.points[i].rpm;
        for (const auto* series : {&e10, &e20}) {
            const PerformancePoint& p = series->points[i];
            file << "," << p.brake_power
                 << "," << p.torque
                 << "," << units_.convert(p.bsfc, "kg/kWh", "g/kWh")
                 << "," << units_.convert(p.thermal_efficiency, "fraction", "%");
        }
        file << "\n";
    }

    return static_cast<bool>(file);
}

ReportExporter::ExportResult ReportExporter::exportReport(const PerformanceSeries& e10,
                                                          const PerformanceSeries& e20) {
    ExportResult result;

    GnuplotViz viz(config_.directory);
    viz.setRenderEnabled(config_.render_plots);

    auto panels = buildPanels(e10, e20);
    if (config_.write_png || config_.write_pdf) {
        result.figure_written = viz.plotLinePanels(panels, 2, 2, config_.basename,
                                                   config_.write_png, config_.write_pdf);
        result.files.push_back(viz.scriptPath(config_.basename));
        if (result.figure_written && config_.render_plots) {
            if (config_.write_png) result.files.push_back(figurePath("png"));
            if (config_.write_pdf) result.files.push_back(figurePath("pdf"));
        }
        if (!result.figure_written) {
            result.warnings.push_back("Figure export failed for " + viz.scriptPath(config_.basename));
        }
    }

    if (config_.write_data) {
        result.table_written = writeTable(e10, e20, tablePath());
        if (result.table_written) {
            result.files.push_back(tablePath());
        } else {
            result.warnings.push_back("Cannot write data table: " + tablePath());
        }
    }

    return result;
}

} // namespace BlendSim
