#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "BlendSim.hpp"
#include "UnitSystem.hpp"
#include <istream>
#include <string>
#include <map>
#include <vector>

namespace BlendSim {

/**
 * @brief Reader for BlendSim .config files
 *
 * INI layout with sections [ENGINE], [SWEEP], [NOISE] and [OUTPUT].
 * Section names are case-insensitive and stored upper case; keys are
 * case-sensitive. Lines starting with # or ; are comments and anything
 * after an inline # is dropped. Lengths and ratios may carry a unit
 * ("80 mm", "2 %") and are returned in SI.
 *
 * Accessors never throw: a missing key yields the default, an unparsable
 * value yields the default with a warning on std::cerr.
 */
class ConfigReader {
public:
    struct ValidationResult {
        bool valid = true;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    ConfigReader() = default;

    /// false if the file cannot be opened
    bool loadFile(const std::string& filename);

    // =========================================================================
    // Run Configuration
    // =========================================================================

    /// Each returns false, leaving config untouched, when its section is absent
    bool parseEngineConfig(EngineConfig& config) const;
    bool parseSweepConfig(SweepConfig& config) const;
    bool parseNoiseConfig(NoiseConfig& config) const;
    bool parseOutputConfig(OutputConfig& config) const;

    void parseRunConfig(RunConfig& config) const;

    /**
     * @brief Check the parsed run configuration
     *
     * Errors make the configuration unusable (non-positive geometry, empty
     * or decreasing sweep, negative noise or seed). Warnings flag missing
     * sections, unknown sections and settings that are probably mistakes.
     */
    ValidationResult validate() const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
               int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                     double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                 bool default_val = false) const;

    /// Comma-separated list; unparsable entries are skipped with a warning
    std::vector<double> getDoubleArray(const std::string& section,
                                       const std::string& key) const;

    /**
     * @brief Numeric value converted to SI
     * @param default_unit Unit assumed when the value has none; empty means SI
     */
    double getDoubleWithUnit(const std::string& section, const std::string& key,
                             double default_val,
                             const std::string& default_unit = "") const;

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;

    /// Commented template with the built-in defaults
    static bool generateTemplate(const std::string& filename);

private:
    using Section = std::map<std::string, std::string>;

    std::map<std::string, Section> sections_;
    UnitSystem units_;

    void parse(std::istream& in, const std::string& source);
    const std::string* lookup(const std::string& section, const std::string& key) const;
    void warnUnparsable(const std::string& section, const std::string& key,
                        const std::string& what) const;

    void validateEngine(const EngineConfig& engine, ValidationResult& result) const;
    void validateSweep(const SweepConfig& sweep, ValidationResult& result) const;
    void validateNoise(const NoiseConfig& noise, ValidationResult& result) const;
    void validateOutput(const OutputConfig& output, ValidationResult& result) const;
};

} // namespace BlendSim

#endif // CONFIG_READER_HPP
