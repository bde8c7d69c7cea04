#ifndef ENGINE_MODEL_HPP
#define ENGINE_MODEL_HPP

/**
 * @file EngineModel.hpp
 * @brief Steady-state spark-ignition engine performance model
 *
 * Quasi-static mapping from engine speed to performance quantities:
 * - Volumetric efficiency peaking at 3000 rpm, floored at 0.7
 * - Four-stroke air mass flow at standard air density
 * - Blend-specific brake thermal efficiency curves (E10, E20)
 * - Brake power, torque and brake-specific fuel consumption
 *
 * All calculations are performed in SI base units except brake power (kW),
 * torque (N·m) and BSFC (kg/kWh).
 */

#include "BlendSim.hpp"
#include <vector>
#include <string>
#include <cstddef>

namespace BlendSim {

/**
 * @brief Single-cylinder engine geometry
 */
class EngineGeometry {
public:
    EngineGeometry(double compression_ratio, double bore, double stroke);

    double getCompressionRatio() const { return compression_ratio_; }
    double getBore() const { return bore_; }
    double getStroke() const { return stroke_; }

    /**
     * @brief Swept volume Vs = (pi/4) * bore^2 * stroke
     * @return Swept volume (m^3)
     */
    double sweptVolume() const;

private:
    double compression_ratio_;  // Carried for completeness, not used by the model
    double bore_;
    double stroke_;
};

/**
 * @brief Lower heating value and stoichiometric air-fuel ratio of a blend
 */
class FuelProperties {
public:
    FuelProperties(FuelBlend blend, double lhv, double afr);

    static FuelProperties E10();
    static FuelProperties E20();
    static FuelProperties forBlend(FuelBlend blend);

    FuelBlend getBlend() const { return blend_; }
    std::string getName() const { return blendName(blend_); }
    double getLHV() const { return lhv_; }   ///< J/kg
    double getAFR() const { return afr_; }

private:
    FuelBlend blend_;
    double lhv_;
    double afr_;
};

/**
 * @brief Quadratic brake thermal efficiency curve with a lower floor
 *
 * eta(r) = max(peak - curvature * (r - peak_rpm)^2, floor)
 */
struct ThermalEfficiencyCurve {
    double peak = 0.32;
    double curvature = 2.5e-6;
    double floor = 0.25;
    double peak_rpm = 3000.0;

    double evaluate(double rpm) const;

    static ThermalEfficiencyCurve E10();
    static ThermalEfficiencyCurve E20();
    static ThermalEfficiencyCurve forBlend(FuelBlend blend);
};

/**
 * @brief Ordered sequence of strictly positive engine speeds (rev/min)
 */
class RPMSweep {
public:
    /// Default sweep 1000..5000 rpm in 500 rpm steps
    RPMSweep();

    /// Inclusive range; end is included when it falls on the step grid
    RPMSweep(double start, double end, double step);

    /// Explicit list, strictly positive and strictly increasing
    explicit RPMSweep(const std::vector<double>& values);

    static RPMSweep fromConfig(const SweepConfig& config);

    const std::vector<double>& values() const { return values_; }
    size_t size() const { return values_.size(); }
    double operator[](size_t i) const { return values_[i]; }

    std::vector<double>::const_iterator begin() const { return values_.begin(); }
    std::vector<double>::const_iterator end() const { return values_.end(); }

    static constexpr size_t MAX_POINTS = 1000000;

private:
    std::vector<double> values_;
};

/**
 * @brief Performance state at one engine speed for one blend
 */
struct PerformancePoint {
    double rpm = 0.0;                    ///< rev/min
    double volumetric_efficiency = 0.0;  ///< Dimensionless
    double air_mass_flow = 0.0;          ///< kg/s
    double fuel_mass_flow = 0.0;         ///< kg/s
    double thermal_efficiency = 0.0;     ///< Dimensionless
    double brake_power = 0.0;            ///< kW
    double torque = 0.0;                 ///< N·m
    double bsfc = 0.0;                   ///< kg/kWh
};

/**
 * @brief Performance points of one blend aligned with the rpm sweep
 */
struct PerformanceSeries {
    FuelBlend blend = FuelBlend::E10;
    std::vector<PerformancePoint> points;

    size_t size() const { return points.size(); }
    std::string name() const { return blendName(blend); }

    // Column views for plotting and export
    std::vector<double> rpm() const;
    std::vector<double> brakePower() const;
    std::vector<double> torque() const;
    std::vector<double> bsfc() const;
    std::vector<double> thermalEfficiency() const;
};

/**
 * @brief Characteristic values of one series
 */
struct PerformanceSummary {
    double peak_power = 0.0;             ///< kW
    double peak_power_rpm = 0.0;
    double peak_torque = 0.0;            ///< N·m
    double peak_torque_rpm = 0.0;
    double min_bsfc = 0.0;               ///< kg/kWh
    double min_bsfc_rpm = 0.0;
    double mean_efficiency = 0.0;
};

/**
 * @brief Relative change of E20 against E10, in percent
 */
struct BlendComparison {
    double peak_power_change = 0.0;
    double peak_torque_change = 0.0;
    double min_bsfc_change = 0.0;
    double mean_efficiency_change = 0.0;
};

PerformanceSummary summarize(const PerformanceSeries& series);
BlendComparison compareBlends(const PerformanceSummary& baseline,
                              const PerformanceSummary& candidate);

/**
 * @brief Per-rpm calculation chain for both blends
 *
 * VE -> air mass flow -> fuel mass flow -> thermal efficiency
 *    -> brake power -> torque -> BSFC
 */
class PerformanceModel {
public:
    static constexpr double AIR_DENSITY = 1.225;         ///< kg/m^3, standard air
    static constexpr double VE_PEAK = 0.90;
    static constexpr double VE_CURVATURE = 0.000002;
    static constexpr double VE_FLOOR = 0.7;
    static constexpr double VE_PEAK_RPM = 3000.0;
    static constexpr double TORQUE_FACTOR = 9550.0;      ///< 60000 / (2 pi), rounded
    static constexpr double SECONDS_PER_HOUR = 3600.0;

    PerformanceModel(const EngineGeometry& geometry, const RPMSweep& sweep);

    double volumetricEfficiency(double rpm) const;

    /// Four-stroke intake: one charge per two revolutions
    double airMassFlow(double rpm) const;

    /**
     * @brief Evaluate the full chain at one engine speed
     * @throws std::domain_error if the brake power is not strictly positive
     */
    PerformancePoint computePoint(const FuelProperties& fuel,
                                  const ThermalEfficiencyCurve& efficiency,
                                  double rpm) const;

    PerformanceSeries computeSeries(const FuelProperties& fuel,
                                    const ThermalEfficiencyCurve& efficiency) const;
    PerformanceSeries computeSeries(FuelBlend blend) const;

    /// E10 first, then E20
    std::pair<PerformanceSeries, PerformanceSeries> computeAll() const;

    const EngineGeometry& getGeometry() const { return geometry_; }
    const RPMSweep& getSweep() const { return sweep_; }

private:
    EngineGeometry geometry_;
    RPMSweep sweep_;
};

} // namespace BlendSim

#endif // ENGINE_MODEL_HPP
