#ifndef UNIT_SYSTEM_HPP
#define UNIT_SYSTEM_HPP

#include <string>
#include <map>
#include <vector>
#include <stdexcept>

namespace BlendSim {

/**
 * @brief Integer exponents of length, mass and time
 *
 * Engine quantities only need L, M and T: power is M L^2 T^-3, specific
 * fuel consumption M / (M L^2 T^-2) = L^-2 T^2, fractions are 0 0 0.
 */
struct Dimension {
    int L = 0;
    int M = 0;
    int T = 0;

    Dimension() = default;
    Dimension(int length, int mass, int time) : L(length), M(mass), T(time) {}

    bool operator==(const Dimension& other) const {
        return L == other.L && M == other.M && T == other.T;
    }
    bool operator!=(const Dimension& other) const { return !(*this == other); }

    /// e.g. "M L^2 T^-3", or "dimensionless"
    std::string toString() const;
};

/**
 * @brief A named unit and its linear scale to SI base
 */
struct Unit {
    std::string name;           ///< e.g. "gram per kilowatt hour"
    std::string symbol;         ///< e.g. "g/kWh"
    std::string category;       ///< e.g. "specific_fuel_consumption"
    Dimension dimension;
    double scale = 1.0;         ///< value_SI = value * scale

    double toSI(double value) const { return value * scale; }
    double fromSI(double value) const { return value / scale; }
};

/**
 * @brief Unit lookup and conversion for engine and fuel quantities
 *
 * Covers geometry (mm, cm3), energy and heating value (MJ/kg), power (kW,
 * hp), torque (N-m), mass flow (kg/s, kg/hr), specific fuel consumption
 * (kg/kWh, g/kWh) and plain ratios (fraction, %). Symbols are matched
 * exactly first, then case-insensitively.
 */
class UnitSystem {
public:
    UnitSystem();

    // =========================================================================
    // Lookup
    // =========================================================================

    /// nullptr when the unit is not in the table
    const Unit* getUnit(const std::string& name_or_symbol) const;
    bool hasUnit(const std::string& name_or_symbol) const;

    /**
     * @throws std::runtime_error if the unit is unknown
     */
    Dimension getDimension(const std::string& unit) const;

    bool areCompatible(const std::string& unit1, const std::string& unit2) const;

    // =========================================================================
    // Conversion
    // =========================================================================

    /**
     * @brief Convert between two units of the same dimension
     * @throws std::runtime_error on unknown or incompatible units
     */
    double convert(double value, const std::string& from_unit,
                   const std::string& to_unit) const;
    std::vector<double> convert(const std::vector<double>& values,
                                const std::string& from_unit,
                                const std::string& to_unit) const;

    double toBase(double value, const std::string& from_unit) const;
    double fromBase(double value, const std::string& to_unit) const;

    // =========================================================================
    // Parsing and Display
    // =========================================================================

    /**
     * @brief Split "80 mm" into 80 and "mm"
     * @return false if the text does not start with a number
     */
    bool parseValueWithUnit(const std::string& text, double& value,
                            std::string& unit) const;

    /**
     * @brief Parse and convert to SI; a bare number is taken as SI already
     * @throws std::runtime_error on parse failure or unknown unit
     */
    double parseAndConvertToBase(const std::string& text) const;

    /// Display unit for a named quantity ("bsfc" -> "g/kWh"), empty if none
    std::string getSuggestedDisplayUnit(const std::string& quantity) const;

    std::string formatValue(double value, const std::string& unit,
                            int precision = 6) const;

private:
    std::map<std::string, Unit> units_;          ///< Keyed by symbol and lowercase name/symbol
    std::map<std::string, std::string> display_units_;

    void registerUnit(const Unit& unit);
    const Unit& requireUnit(const std::string& name_or_symbol) const;
};

} // namespace BlendSim

#endif // UNIT_SYSTEM_HPP
