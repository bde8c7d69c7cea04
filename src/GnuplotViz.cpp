#include "GnuplotViz.hpp"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <iostream>
#include <cstdlib>
#include <cerrno>
#include <sys/stat.h>

namespace BlendSim {

GnuplotViz::GnuplotViz(const std::string& output_dir)
    : output_dir_(output_dir.empty() ? "." : output_dir) {
    if (mkdir(output_dir_.c_str(), 0755) != 0 && errno != EEXIST) {
        std::cerr << "Warning: Cannot create output directory: " << output_dir_ << std::endl;
    }
}

GnuplotViz::~GnuplotViz() {}

std::string GnuplotViz::scriptPath(const std::string& filename) const {
    return output_dir_ + "/" + filename + ".gp";
}

std::string GnuplotViz::panelDataPath(const std::string& filename, size_t panel) const {
    return output_dir_ + "/" + filename + "_panel" + std::to_string(panel) + ".dat";
}

bool GnuplotViz::writeLineData(const LinePanel& panel, const std::string& path) const {
    std::ofstream file(path);
    if (!file) return false;

    file << std::setprecision(10);
    for (size_t i = 0; i < panel.x.size(); ++i) {
        file << panel.x[i];
        for (const auto& column : panel.y) {
            if (i < column.size()) {
                file << " " << column[i];
            }
        }
        file << "\n";
    }
    return static_cast<bool>(file);
}

std::string GnuplotViz::panelCommands(const std::vector<LinePanel>& panels,
                                      int rows, int cols,
                                      const std::string& filename) const {
    std::stringstream ss;
    ss << "set multiplot layout " << rows << "," << cols << "\n\n";

    for (size_t i = 0; i < panels.size() && static_cast<int>(i) < rows * cols; ++i) {
        const LinePanel& panel = panels[i];
        ss << "set title '" << panel.title << "'\n";
        ss << "set xlabel '" << panel.xlabel << "'\n";
        ss << "set ylabel '" << panel.ylabel << "'\n";
        ss << "plot ";
        for (size_t s = 0; s < panel.styles.size(); ++s) {
            const LineStyle& style = panel.styles[s];
            if (s > 0) ss << ", \\\n     ";
            ss << "'" << filename << "_panel" << i << ".dat' using 1:" << (s + 2)
               << " with linespoints lw " << style.line_width
               << " lc rgb '" << style.color << "'"
               << " pt " << style.point_type << " ps 1.2"
               << " title '" << style.label << "'";
        }
        ss << "\n\n";
    }

    ss << "unset multiplot\n";
    return ss.str();
}

bool GnuplotViz::plotLinePanels(const std::vector<LinePanel>& panels,
                                int rows, int cols,
                                const std::string& filename,
                                bool write_png, bool write_pdf) {
    for (size_t i = 0; i < panels.size(); ++i) {
        if (!writeLineData(panels[i], panelDataPath(filename, i))) {
            std::cerr << "Warning: Cannot write plot data: " << panelDataPath(filename, i) << std::endl;
            return false;
        }
    }

    std::ofstream script(scriptPath(filename));
    if (!script) {
        std::cerr << "Warning: Cannot write gnuplot script: " << scriptPath(filename) << std::endl;
        return false;
    }

    script << "set grid\n";
    script << "set key top right\n\n";

    std::string commands = panelCommands(panels, rows, cols, filename);

    if (write_png) {
        script << "set terminal pngcairo size 1000,800 enhanced font 'Arial,10'\n";
        script << "set output '" << filename << ".png'\n";
        script << commands;
        script << "unset output\n\n";
    }

    if (write_pdf) {
        script << "set terminal pdfcairo size 10in,8in enhanced font 'Arial,10'\n";
        script << "set output '" << filename << ".pdf'\n";
        script << commands;
        script << "unset output\n";
    }
    script.close();

    if (!script) return false;
    if (!render_enabled_ || (!write_png && !write_pdf)) return true;

    return runGnuplot(filename);
}

bool GnuplotViz::runGnuplot(const std::string& filename) const {
    std::string cmd = "cd \"" + output_dir_ + "\" && " BLENDSIM_GNUPLOT_EXECUTABLE " \"" +
                      filename + ".gp\" 2>/dev/null";
    int status = std::system(cmd.c_str());
    if (status != 0) {
        std::cerr << "Warning: gnuplot exited with status " << status
                  << " for " << scriptPath(filename) << std::endl;
        return false;
    }
    return true;
}

} // namespace BlendSim
