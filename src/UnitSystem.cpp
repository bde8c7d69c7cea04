#include "UnitSystem.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace BlendSim {

namespace {

struct UnitEntry {
    const char* category;
    const char* name;
    const char* symbol;
    int L, M, T;
    double scale;
};

// Scale is the SI value of one unit
const UnitEntry kUnitTable[] = {
    // Geometry
    {"length", "meter", "m", 1, 0, 0, 1.0},
    {"length", "centimeter", "cm", 1, 0, 0, 1e-2},
    {"length", "millimeter", "mm", 1, 0, 0, 1e-3},
    {"length", "inch", "in", 1, 0, 0, 0.0254},
    {"length", "foot", "ft", 1, 0, 0, 0.3048},
    {"area", "square meter", "m2", 2, 0, 0, 1.0},
    {"area", "square centimeter", "cm2", 2, 0, 0, 1e-4},
    {"area", "square millimeter", "mm2", 2, 0, 0, 1e-6},
    {"volume", "cubic meter", "m3", 3, 0, 0, 1.0},
    {"volume", "liter", "L", 3, 0, 0, 1e-3},
    {"volume", "cubic centimeter", "cm3", 3, 0, 0, 1e-6},
    {"volume", "cubic inch", "in3", 3, 0, 0, 1.6387064e-5},

    // Mass, time and intake air
    {"mass", "kilogram", "kg", 0, 1, 0, 1.0},
    {"mass", "gram", "g", 0, 1, 0, 1e-3},
    {"mass", "pound mass", "lbm", 0, 1, 0, 0.45359237},
    {"time", "second", "s", 0, 0, 1, 1.0},
    {"time", "minute", "min", 0, 0, 1, 60.0},
    {"time", "hour", "hr", 0, 0, 1, 3600.0},
    {"density", "kilogram per cubic meter", "kg/m3", -3, 1, 0, 1.0},
    {"density", "gram per cubic centimeter", "g/cm3", -3, 1, 0, 1e3},

    // Work and output
    {"energy", "joule", "J", 2, 1, -2, 1.0},
    {"energy", "kilojoule", "kJ", 2, 1, -2, 1e3},
    {"energy", "megajoule", "MJ", 2, 1, -2, 1e6},
    {"energy", "watt hour", "Wh", 2, 1, -2, 3600.0},
    {"energy", "kilowatt hour", "kWh", 2, 1, -2, 3.6e6},
    {"energy", "british thermal unit", "BTU", 2, 1, -2, 1055.05585262},
    {"power", "watt", "W", 2, 1, -3, 1.0},
    {"power", "kilowatt", "kW", 2, 1, -3, 1e3},
    {"power", "horsepower", "hp", 2, 1, -3, 745.69987158227},
    {"power", "metric horsepower", "PS", 2, 1, -3, 735.49875},
    {"torque", "newton meter", "N-m", 2, 1, -2, 1.0},
    {"torque", "kilonewton meter", "kN-m", 2, 1, -2, 1e3},
    {"torque", "pound force foot", "lbf-ft", 2, 1, -2, 1.3558179483314},

    // Fuel
    {"specific_energy", "joule per kilogram", "J/kg", 2, 0, -2, 1.0},
    {"specific_energy", "kilojoule per kilogram", "kJ/kg", 2, 0, -2, 1e3},
    {"specific_energy", "megajoule per kilogram", "MJ/kg", 2, 0, -2, 1e6},
    {"specific_energy", "BTU per pound mass", "BTU/lbm", 2, 0, -2, 2326.0},
    {"mass_rate", "kilogram per second", "kg/s", 0, 1, -1, 1.0},
    {"mass_rate", "gram per second", "g/s", 0, 1, -1, 1e-3},
    {"mass_rate", "kilogram per hour", "kg/hr", 0, 1, -1, 1.0 / 3600.0},
    {"mass_rate", "pound mass per hour", "lbm/hr", 0, 1, -1, 0.45359237 / 3600.0},
    {"specific_fuel_consumption", "kilogram per joule", "kg/J", -2, 0, 2, 1.0},
    {"specific_fuel_consumption", "kilogram per kilowatt hour", "kg/kWh", -2, 0, 2, 1.0 / 3.6e6},
    {"specific_fuel_consumption", "gram per kilowatt hour", "g/kWh", -2, 0, 2, 1e-3 / 3.6e6},
    {"specific_fuel_consumption", "pound mass per horsepower hour", "lbm/hp-hr", -2, 0, 2,
     0.45359237 / (745.69987158227 * 3600.0)},

    // Ratios (efficiencies, noise fraction)
    {"dimensionless", "fraction", "fraction", 0, 0, 0, 1.0},
    {"dimensionless", "percent", "%", 0, 0, 0, 1e-2},
};

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trimmed(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

void appendExponent(std::ostringstream& os, const char* symbol, int exponent) {
    if (exponent == 0) return;
    if (os.tellp() > 0) os << " ";
    os << symbol;
    if (exponent != 1) os << "^" << exponent;
}

} // namespace

std::string Dimension::toString() const {
    std::ostringstream os;
    appendExponent(os, "M", M);
    appendExponent(os, "L", L);
    appendExponent(os, "T", T);
    std::string s = os.str();
    return s.empty() ? "dimensionless" : s;
}

// =============================================================================
// UnitSystem Implementation
// =============================================================================

UnitSystem::UnitSystem() {
    for (const UnitEntry& entry : kUnitTable) {
        Unit unit;
        unit.name = entry.name;
        unit.symbol = entry.symbol;
        unit.category = entry.category;
        unit.dimension = Dimension(entry.L, entry.M, entry.T);
        unit.scale = entry.scale;
        registerUnit(unit);
    }

    display_units_["bore"] = "mm";
    display_units_["stroke"] = "mm";
    display_units_["swept_volume"] = "cm3";
    display_units_["heating_value"] = "MJ/kg";
    display_units_["mass_flow"] = "kg/s";
    display_units_["brake_power"] = "kW";
    display_units_["torque"] = "N-m";
    display_units_["bsfc"] = "g/kWh";
    display_units_["efficiency"] = "%";
}

void UnitSystem::registerUnit(const Unit& unit) {
    // Exact symbol wins; lowercase aliases never replace an existing key
    units_[unit.symbol] = unit;
    units_.emplace(lowercase(unit.symbol), unit);
    units_.emplace(lowercase(unit.name), unit);
}

const Unit* UnitSystem::getUnit(const std::string& name_or_symbol) const {
    auto it = units_.find(name_or_symbol);
    if (it == units_.end()) {
        it = units_.find(lowercase(name_or_symbol));
    }
    return it == units_.end() ? nullptr : &it->second;
}

const Unit& UnitSystem::requireUnit(const std::string& name_or_symbol) const {
    const Unit* unit = getUnit(name_or_symbol);
    if (!unit) {
        throw std::runtime_error("Unknown unit: " + name_or_symbol);
    }
    return *unit;
}

bool UnitSystem::hasUnit(const std::string& name_or_symbol) const {
    return getUnit(name_or_symbol) != nullptr;
}

Dimension UnitSystem::getDimension(const std::string& unit) const {
    return requireUnit(unit).dimension;
}

bool UnitSystem::areCompatible(const std::string& unit1, const std::string& unit2) const {
    const Unit* a = getUnit(unit1);
    const Unit* b = getUnit(unit2);
    return a && b && a->dimension == b->dimension;
}

// =============================================================================
// Conversion
// =============================================================================

double UnitSystem::convert(double value, const std::string& from_unit,
                           const std::string& to_unit) const {
    const Unit& from = requireUnit(from_unit);
    const Unit& to = requireUnit(to_unit);
    if (from.dimension != to.dimension) {
        throw std::runtime_error("Cannot convert " + from_unit + " (" +
                                 from.dimension.toString() + ") to " + to_unit +
                                 " (" + to.dimension.toString() + ")");
    }
    return to.fromSI(from.toSI(value));
}

std::vector<double> UnitSystem::convert(const std::vector<double>& values,
                                        const std::string& from_unit,
                                        const std::string& to_unit) const {
    std::vector<double> result;
    result.reserve(values.size());
    for (double v : values) {
        result.push_back(convert(v, from_unit, to_unit));
    }
    return result;
}

double UnitSystem::toBase(double value, const std::string& from_unit) const {
    return requireUnit(from_unit).toSI(value);
}

double UnitSystem::fromBase(double value, const std::string& to_unit) const {
    return requireUnit(to_unit).fromSI(value);
}

// =============================================================================
// Parsing and Display
// =============================================================================

bool UnitSystem::parseValueWithUnit(const std::string& text, double& value,
                                    std::string& unit) const {
    std::string s = trimmed(text);
    if (s.empty()) return false;

    // Only decimal numbers; strtod would also take "inf", "nan" and hex
    unsigned char lead = static_cast<unsigned char>(s[0]);
    if (!std::isdigit(lead) && lead != '.' && lead != '+' && lead != '-') {
        return false;
    }

    const char* begin = s.c_str();
    char* end = nullptr;
    double parsed = std::strtod(begin, &end);
    if (end == begin) return false;

    value = parsed;
    unit = trimmed(std::string(end));
    return true;
}

double UnitSystem::parseAndConvertToBase(const std::string& text) const {
    double value;
    std::string unit;
    if (!parseValueWithUnit(text, value, unit)) {
        throw std::runtime_error("Failed to parse: " + text);
    }
    return unit.empty() ? value : toBase(value, unit);
}

std::string UnitSystem::getSuggestedDisplayUnit(const std::string& quantity) const {
    auto it = display_units_.find(quantity);
    return it == display_units_.end() ? std::string() : it->second;
}

std::string UnitSystem::formatValue(double value, const std::string& unit,
                                    int precision) const {
    std::ostringstream os;
    os << std::setprecision(precision) << value << " " << unit;
    return os.str();
}

} // namespace BlendSim
