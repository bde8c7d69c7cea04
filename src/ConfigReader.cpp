#include "ConfigReader.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>

namespace BlendSim {

namespace {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::string upper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

std::string lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

const char* const kKnownSections[] = {"ENGINE", "SWEEP", "NOISE", "OUTPUT"};

} // namespace

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }
    parse(file, filename);
    return true;
}

void ConfigReader::parse(std::istream& in, const std::string& source) {
    std::string section;
    std::string line;
    int line_num = 0;

    while (std::getline(in, line)) {
        ++line_num;

        size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty() || line[0] == ';') continue;

        if (line.front() == '[' && line.back() == ']') {
            section = upper(trim(line.substr(1, line.size() - 2)));
            sections_[section];
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            std::cerr << "Warning: " << source << ":" << line_num
                      << ": expected key = value: " << line << std::endl;
            continue;
        }
        if (section.empty()) {
            std::cerr << "Warning: " << source << ":" << line_num
                      << ": key outside any section ignored" << std::endl;
            continue;
        }

        sections_[section][trim(line.substr(0, eq))] = trim(line.substr(eq + 1));
    }
}

const std::string* ConfigReader::lookup(const std::string& section,
                                        const std::string& key) const {
    auto sec = sections_.find(section);
    if (sec == sections_.end()) return nullptr;
    auto it = sec->second.find(key);
    if (it == sec->second.end() || it->second.empty()) return nullptr;
    return &it->second;
}

void ConfigReader::warnUnparsable(const std::string& section, const std::string& key,
                                  const std::string& what) const {
    std::cerr << "Warning: Cannot parse [" << section << "]:" << key
              << " = '" << *lookup(section, key) << "' as " << what << std::endl;
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    const std::string* val = lookup(section, key);
    return val ? *val : default_val;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                         int default_val) const {
    const std::string* val = lookup(section, key);
    if (!val) return default_val;
    try {
        return std::stoi(*val);
    } catch (const std::logic_error&) {
        warnUnparsable(section, key, "integer");
        return default_val;
    }
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    const std::string* val = lookup(section, key);
    if (!val) return default_val;
    try {
        return std::stod(*val);
    } catch (const std::logic_error&) {
        warnUnparsable(section, key, "number");
        return default_val;
    }
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                           bool default_val) const {
    const std::string* val = lookup(section, key);
    if (!val) return default_val;

    std::string v = lower(*val);
    if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;

    warnUnparsable(section, key, "boolean");
    return default_val;
}

std::vector<double> ConfigReader::getDoubleArray(const std::string& section,
                                                 const std::string& key) const {
    std::vector<double> result;
    const std::string* val = lookup(section, key);
    if (!val) return result;

    std::stringstream ss(*val);
    std::string token;
    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;
        try {
            result.push_back(std::stod(token));
        } catch (const std::logic_error&) {
            std::cerr << "Warning: Skipping '" << token << "' in [" << section
                      << "]:" << key << std::endl;
        }
    }
    return result;
}

double ConfigReader::getDoubleWithUnit(const std::string& section, const std::string& key,
                                       double default_val, const std::string& default_unit) const {
    const std::string* val = lookup(section, key);
    if (!val) return default_val;

    double number;
    std::string unit;
    if (!units_.parseValueWithUnit(*val, number, unit)) {
        warnUnparsable(section, key, "quantity");
        return default_val;
    }
    if (unit.empty()) unit = default_unit;
    if (unit.empty()) return number;

    try {
        return units_.toBase(number, unit);
    } catch (const std::runtime_error& e) {
        std::cerr << "Warning: [" << section << "]:" << key << ": " << e.what() << std::endl;
        return default_val;
    }
}

bool ConfigReader::hasSection(const std::string& section) const {
    return sections_.count(section) > 0;
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec = sections_.find(section);
    return sec != sections_.end() && sec->second.count(key) > 0;
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> names;
    names.reserve(sections_.size());
    for (const auto& sec : sections_) names.push_back(sec.first);
    return names;
}

// =============================================================================
// Run Configuration
// =============================================================================

bool ConfigReader::parseEngineConfig(EngineConfig& config) const {
    if (!hasSection("ENGINE")) return false;

    config.compression_ratio = getDouble("ENGINE", "compression_ratio", config.compression_ratio);
    config.bore = getDoubleWithUnit("ENGINE", "bore", config.bore, "m");
    config.stroke = getDoubleWithUnit("ENGINE", "stroke", config.stroke, "m");
    return true;
}

bool ConfigReader::parseSweepConfig(SweepConfig& config) const {
    if (!hasSection("SWEEP")) return false;

    config.rpm_start = getDouble("SWEEP", "rpm_start", config.rpm_start);
    config.rpm_end = getDouble("SWEEP", "rpm_end", config.rpm_end);
    config.rpm_step = getDouble("SWEEP", "rpm_step", config.rpm_step);
    config.rpm_values = getDoubleArray("SWEEP", "rpm_values");
    return true;
}

bool ConfigReader::parseNoiseConfig(NoiseConfig& config) const {
    if (!hasSection("NOISE")) return false;

    config.enabled = getBool("NOISE", "enabled", config.enabled);
    config.fraction = getDoubleWithUnit("NOISE", "fraction", config.fraction, "fraction");

    // Negative seeds are reported by validate() and never reach the generator
    int seed = getInt("NOISE", "seed", static_cast<int>(config.seed));
    if (seed >= 0) config.seed = static_cast<unsigned int>(seed);
    return true;
}

bool ConfigReader::parseOutputConfig(OutputConfig& config) const {
    if (!hasSection("OUTPUT")) return false;

    config.directory = getString("OUTPUT", "directory", config.directory);
    config.basename = getString("OUTPUT", "basename", config.basename);
    config.write_png = getBool("OUTPUT", "write_png", config.write_png);
    config.write_pdf = getBool("OUTPUT", "write_pdf", config.write_pdf);
    config.write_data = getBool("OUTPUT", "write_data", config.write_data);
    config.render_plots = getBool("OUTPUT", "render_plots", config.render_plots);
    return true;
}

void ConfigReader::parseRunConfig(RunConfig& config) const {
    parseEngineConfig(config.engine);
    parseSweepConfig(config.sweep);
    parseNoiseConfig(config.noise);
    parseOutputConfig(config.output);
}

// =============================================================================
// Validation
// =============================================================================

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;

    if (!hasSection("ENGINE")) {
        result.warnings.push_back("No [ENGINE] section - using bore 80 mm, stroke 90 mm, CR 10");
    }
    if (!hasSection("SWEEP")) {
        result.warnings.push_back("No [SWEEP] section - using 1000..5000 rpm step 500");
    }
    for (const auto& sec : sections_) {
        bool known = std::find(std::begin(kKnownSections), std::end(kKnownSections),
                               sec.first) != std::end(kKnownSections);
        if (!known) {
            result.warnings.push_back("Unknown section [" + sec.first + "] ignored");
        }
    }

    RunConfig config;
    parseRunConfig(config);

    validateEngine(config.engine, result);
    validateSweep(config.sweep, result);
    validateNoise(config.noise, result);
    validateOutput(config.output, result);

    result.valid = result.errors.empty();
    return result;
}

void ConfigReader::validateEngine(const EngineConfig& engine, ValidationResult& result) const {
    if (!(engine.bore > 0.0)) result.errors.push_back("Invalid bore (must be positive)");
    if (!(engine.stroke > 0.0)) result.errors.push_back("Invalid stroke (must be positive)");
    if (!(engine.compression_ratio > 0.0)) {
        result.errors.push_back("Invalid compression ratio (must be positive)");
    }
}

void ConfigReader::validateSweep(const SweepConfig& sweep, ValidationResult& result) const {
    if (sweep.rpm_values.empty()) {
        if (!(sweep.rpm_start > 0.0)) result.errors.push_back("Invalid rpm_start (must be positive)");
        if (!(sweep.rpm_step > 0.0)) result.errors.push_back("Invalid rpm_step (must be positive)");
        if (!(sweep.rpm_end >= sweep.rpm_start)) {
            result.errors.push_back("Invalid rpm_end (must not be below rpm_start)");
        }
        return;
    }

    if (hasKey("SWEEP", "rpm_start") || hasKey("SWEEP", "rpm_end") || hasKey("SWEEP", "rpm_step")) {
        result.warnings.push_back("rpm_values given - rpm_start/rpm_end/rpm_step ignored");
    }
    for (size_t i = 0; i < sweep.rpm_values.size(); ++i) {
        bool positive = sweep.rpm_values[i] > 0.0;
        bool increasing = i == 0 || sweep.rpm_values[i] > sweep.rpm_values[i - 1];
        if (!positive || !increasing) {
            result.errors.push_back("Invalid rpm_values (must be positive and increasing)");
            return;
        }
    }
}

void ConfigReader::validateNoise(const NoiseConfig& noise, ValidationResult& result) const {
    if (!(noise.fraction >= 0.0)) {
        result.errors.push_back("Invalid noise fraction (must be non-negative)");
    } else if (noise.fraction > 0.2) {
        result.warnings.push_back("Noise fraction above 20% - perturbed values may change sign");
    }
    if (getInt("NOISE", "seed", 0) < 0) {
        result.errors.push_back("Invalid seed (must be non-negative)");
    }
}

void ConfigReader::validateOutput(const OutputConfig& output, ValidationResult& result) const {
    if (!output.write_png && !output.write_pdf) {
        result.warnings.push_back("Both PNG and PDF output disabled - no figure will be written");
    }
    if (output.basename.find('/') != std::string::npos) {
        result.warnings.push_back("basename contains '/' - use [OUTPUT] directory instead");
    }
}

// =============================================================================
// Template Generation
// =============================================================================

bool ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file) return false;

    const RunConfig defaults{};

    file << "# BlendSim Configuration File\n";
    file << "# E10 vs E20 spark-ignition engine performance comparison\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n";
    file << "# Lengths accept units (m, cm, mm, in); plain numbers are metres\n\n";

    file << "[ENGINE]\n";
    file << "compression_ratio = " << defaults.engine.compression_ratio << "\n";
    file << "bore = " << defaults.engine.bore * 1000.0 << " mm\n";
    file << "stroke = " << defaults.engine.stroke * 1000.0 << " mm\n\n";

    file << "[SWEEP]\n";
    file << "# Engine speed range (rev/min), end inclusive\n";
    file << "rpm_start = " << defaults.sweep.rpm_start << "\n";
    file << "rpm_end = " << defaults.sweep.rpm_end << "\n";
    file << "rpm_step = " << defaults.sweep.rpm_step << "\n";
    file << "# Explicit list, overrides the range when present\n";
    file << "; rpm_values = 1000, 2000, 3000, 4000, 5000\n\n";

    file << "[NOISE]\n";
    file << "enabled = true\n";
    file << "fraction = " << defaults.noise.fraction
         << "                       # Relative std deviation (or e.g. 2 %)\n";
    file << "seed = " << defaults.noise.seed << "\n\n";

    file << "[OUTPUT]\n";
    file << "directory = " << defaults.output.directory << "\n";
    file << "basename = " << defaults.output.basename << "\n";
    file << "write_png = true\n";
    file << "write_pdf = true\n";
    file << "write_data = true                     # CSV table of plotted values\n";
    file << "render_plots = true                   # Run gnuplot on the generated script\n";

    return static_cast<bool>(file);
}

} // namespace BlendSim
