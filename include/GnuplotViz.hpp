#ifndef GNUPLOT_VIZ_HPP
#define GNUPLOT_VIZ_HPP

#include <vector>
#include <string>

#ifndef BLENDSIM_GNUPLOT_EXECUTABLE
#define BLENDSIM_GNUPLOT_EXECUTABLE "gnuplot"
#endif

namespace BlendSim {

/**
 * @brief Line plots through gnuplot scripts
 *
 * Writes whitespace-separated data files and a gnuplot script into the
 * output directory, then runs gnuplot on the script. Multi-panel figures
 * are laid out with `set multiplot` and can be rendered to PNG (pngcairo)
 * and PDF (pdfcairo) from the same script.
 */
class GnuplotViz {
public:
    struct LineStyle {
        std::string label;
        std::string color = "#000000";
        int point_type = 7;          ///< gnuplot pt (6 open circle, 4 open square)
        double line_width = 1.5;
    };

    struct LinePanel {
        std::string title;
        std::string xlabel;
        std::string ylabel;
        std::vector<double> x;
        std::vector<std::vector<double>> y;   ///< One column per style
        std::vector<LineStyle> styles;
    };

    GnuplotViz(const std::string& output_dir = ".");
    ~GnuplotViz();

    /**
     * @brief Multi-panel line figure (rows x cols grid)
     * @param filename Base name without extension; outputs go to
     *        <filename>.png / <filename>.pdf, script to <filename>.gp
     * @return false if the script could not be written or gnuplot failed
     */
    bool plotLinePanels(const std::vector<LinePanel>& panels,
                        int rows, int cols,
                        const std::string& filename,
                        bool write_png = true, bool write_pdf = true);

    /// When disabled only data and script files are written
    void setRenderEnabled(bool enabled) { render_enabled_ = enabled; }
    bool isRenderEnabled() const { return render_enabled_; }

    std::string scriptPath(const std::string& filename) const;
    std::string panelDataPath(const std::string& filename, size_t panel) const;

private:
    std::string output_dir_;
    bool render_enabled_ = true;

    bool writeLineData(const LinePanel& panel, const std::string& path) const;
    std::string panelCommands(const std::vector<LinePanel>& panels,
                              int rows, int cols,
                              const std::string& filename) const;
    bool runGnuplot(const std::string& filename) const;
};

} // namespace BlendSim

#endif // GNUPLOT_VIZ_HPP
