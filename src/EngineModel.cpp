/**
 * @file EngineModel.cpp
 * @brief Implementation of the engine performance model
 */

#include "EngineModel.hpp"
#include <cmath>
#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace BlendSim {

std::string blendName(FuelBlend blend) {
    switch (blend) {
        case FuelBlend::E10: return "E10";
        case FuelBlend::E20: return "E20";
    }
    return "UNKNOWN";
}

// =============================================================================
// EngineGeometry Implementation
// =============================================================================

EngineGeometry::EngineGeometry(double compression_ratio, double bore, double stroke)
    : compression_ratio_(compression_ratio), bore_(bore), stroke_(stroke) {
    if (!(bore > 0.0) || !std::isfinite(bore)) {
        throw std::invalid_argument("Invalid parameter: bore must be positive");
    }
    if (!(stroke > 0.0) || !std::isfinite(stroke)) {
        throw std::invalid_argument("Invalid parameter: stroke must be positive");
    }
    if (!(compression_ratio > 0.0) || !std::isfinite(compression_ratio)) {
        throw std::invalid_argument("Invalid parameter: compression ratio must be positive");
    }
}

double EngineGeometry::sweptVolume() const {
    return (M_PI / 4.0) * bore_ * bore_ * stroke_;
}

// =============================================================================
// FuelProperties Implementation
// =============================================================================

FuelProperties::FuelProperties(FuelBlend blend, double lhv, double afr)
    : blend_(blend), lhv_(lhv), afr_(afr) {
    if (!(lhv > 0.0) || !std::isfinite(lhv)) {
        throw std::invalid_argument("Invalid parameter: lower heating value must be positive");
    }
    if (!(afr > 0.0) || !std::isfinite(afr)) {
        throw std::invalid_argument("Invalid parameter: air-fuel ratio must be positive");
    }
}

FuelProperties FuelProperties::E10() {
    return FuelProperties(FuelBlend::E10, 43.54e6, 14.1);
}

FuelProperties FuelProperties::E20() {
    return FuelProperties(FuelBlend::E20, 41.93e6, 13.5);
}

FuelProperties FuelProperties::forBlend(FuelBlend blend) {
    return blend == FuelBlend::E20 ? E20() : E10();
}

// =============================================================================
// ThermalEfficiencyCurve Implementation
// =============================================================================

double ThermalEfficiencyCurve::evaluate(double rpm) const {
    double dr = rpm - peak_rpm;
    double eta = peak - curvature * dr * dr;
    return std::max(eta, floor);
}

ThermalEfficiencyCurve ThermalEfficiencyCurve::E10() {
    ThermalEfficiencyCurve curve;
    curve.peak = 0.32;
    curve.curvature = 0.0000025;
    curve.floor = 0.25;
    return curve;
}

ThermalEfficiencyCurve ThermalEfficiencyCurve::E20() {
    ThermalEfficiencyCurve curve;
    curve.peak = 0.33;
    curve.curvature = 0.0000020;
    curve.floor = 0.26;
    return curve;
}

ThermalEfficiencyCurve ThermalEfficiencyCurve::forBlend(FuelBlend blend) {
    return blend == FuelBlend::E20 ? E20() : E10();
}

// =============================================================================
// RPMSweep Implementation
// =============================================================================

RPMSweep::RPMSweep() : RPMSweep(1000.0, 5000.0, 500.0) {
}

RPMSweep::RPMSweep(double start, double end, double step) {
    if (!(start > 0.0) || !std::isfinite(start)) {
        throw std::invalid_argument("Invalid parameter: rpm start must be positive");
    }
    if (!(step > 0.0) || !std::isfinite(step)) {
        throw std::invalid_argument("Invalid parameter: rpm step must be positive");
    }
    if (!(end >= start) || !std::isfinite(end)) {
        throw std::invalid_argument("Invalid parameter: rpm end must not be below rpm start");
    }

    // Tolerance keeps the end point when (end - start) / step is integral
    double intervals = std::floor((end - start) / step + 1e-9);
    if (!std::isfinite(intervals) || intervals >= static_cast<double>(MAX_POINTS)) {
        throw std::invalid_argument("Invalid parameter: rpm step too small");
    }
    size_t n = static_cast<size_t>(intervals) + 1;
    values_.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        values_.push_back(start + static_cast<double>(i) * step);
    }
}

RPMSweep::RPMSweep(const std::vector<double>& values) : values_(values) {
    if (values_.empty()) {
        throw std::invalid_argument("Invalid parameter: rpm sweep is empty");
    }
    for (size_t i = 0; i < values_.size(); ++i) {
        if (!(values_[i] > 0.0) || !std::isfinite(values_[i])) {
            throw std::invalid_argument("Invalid parameter: rpm values must be positive");
        }
        if (i > 0 && !(values_[i] > values_[i - 1])) {
            throw std::invalid_argument("Invalid parameter: rpm values must be strictly increasing");
        }
    }
}

RPMSweep RPMSweep::fromConfig(const SweepConfig& config) {
    if (!config.rpm_values.empty()) {
        return RPMSweep(config.rpm_values);
    }
    return RPMSweep(config.rpm_start, config.rpm_end, config.rpm_step);
}

// =============================================================================
// PerformanceSeries Implementation
// =============================================================================

namespace {

template <typename Getter>
std::vector<double> column(const std::vector<PerformancePoint>& points, Getter get) {
    std::vector<double> result;
    result.reserve(points.size());
    for (const auto& p : points) {
        result.push_back(get(p));
    }
    return result;
}

} // namespace

std::vector<double> PerformanceSeries::rpm() const {
    return column(points, [](const PerformancePoint& p) { return p.rpm; });
}

std::vector<double> PerformanceSeries::brakePower() const {
    return column(points, [](const PerformancePoint& p) { return p.brake_power; });
}

std::vector<double> PerformanceSeries::torque() const {
    return column(points, [](const PerformancePoint& p) { return p.torque; });
}

std::vector<double> PerformanceSeries::bsfc() const {
    return column(points, [](const PerformancePoint& p) { return p.bsfc; });
}

std::vector<double> PerformanceSeries::thermalEfficiency() const {
    return column(points, [](const PerformancePoint& p) { return p.thermal_efficiency; });
}

// =============================================================================
// Summary and Comparison
// =============================================================================

PerformanceSummary summarize(const PerformanceSeries& series) {
    PerformanceSummary summary;
    if (series.points.empty()) return summary;

    const auto& pts = series.points;
    auto max_power = std::max_element(pts.begin(), pts.end(),
        [](const PerformancePoint& a, const PerformancePoint& b) {
            return a.brake_power < b.brake_power;
        });
    auto max_torque = std::max_element(pts.begin(), pts.end(),
        [](const PerformancePoint& a, const PerformancePoint& b) {
            return a.torque < b.torque;
        });
    auto min_bsfc = std::min_element(pts.begin(), pts.end(),
        [](const PerformancePoint& a, const PerformancePoint& b) {
            return a.bsfc < b.bsfc;
        });

    summary.peak_power = max_power->brake_power;
    summary.peak_power_rpm = max_power->rpm;
    summary.peak_torque = max_torque->torque;
    summary.peak_torque_rpm = max_torque->rpm;
    summary.min_bsfc = min_bsfc->bsfc;
    summary.min_bsfc_rpm = min_bsfc->rpm;

    double eta_sum = std::accumulate(pts.begin(), pts.end(), 0.0,
        [](double acc, const PerformancePoint& p) { return acc + p.thermal_efficiency; });
    summary.mean_efficiency = eta_sum / static_cast<double>(pts.size());

    return summary;
}

BlendComparison compareBlends(const PerformanceSummary& baseline,
                              const PerformanceSummary& candidate) {
    auto change = [](double base, double value) {
        if (base == 0.0) return 0.0;
        return 100.0 * (value - base) / base;
    };

    BlendComparison cmp;
    cmp.peak_power_change = change(baseline.peak_power, candidate.peak_power);
    cmp.peak_torque_change = change(baseline.peak_torque, candidate.peak_torque);
    cmp.min_bsfc_change = change(baseline.min_bsfc, candidate.min_bsfc);
    cmp.mean_efficiency_change = change(baseline.mean_efficiency, candidate.mean_efficiency);
    return cmp;
}

// =============================================================================
// PerformanceModel Implementation
// =============================================================================

PerformanceModel::PerformanceModel(const EngineGeometry& geometry, const RPMSweep& sweep)
    : geometry_(geometry), sweep_(sweep) {
}

double PerformanceModel::volumetricEfficiency(double rpm) const {
    double dr = rpm - VE_PEAK_RPM;
    double ve = VE_PEAK - VE_CURVATURE * dr * dr;
    return std::max(ve, VE_FLOOR);
}

double PerformanceModel::airMassFlow(double rpm) const {
    return (rpm / 2.0) * geometry_.sweptVolume() * AIR_DENSITY * volumetricEfficiency(rpm);
}

PerformancePoint PerformanceModel::computePoint(const FuelProperties& fuel,
                                                const ThermalEfficiencyCurve& efficiency,
                                                double rpm) const {
    PerformancePoint p;
    p.rpm = rpm;
    p.volumetric_efficiency = volumetricEfficiency(rpm);
    p.air_mass_flow = airMassFlow(rpm);
    p.fuel_mass_flow = p.air_mass_flow / fuel.getAFR();
    p.thermal_efficiency = efficiency.evaluate(rpm);

    // Brake power (kW)
    p.brake_power = (p.fuel_mass_flow * fuel.getLHV() * p.thermal_efficiency) / 1000.0;

    if (!(p.brake_power > 0.0)) {
        throw std::domain_error("Brake power is not positive at " + std::to_string(rpm) +
                                " rpm; BSFC undefined");
    }

    // Torque (N·m)
    p.torque = (p.brake_power * TORQUE_FACTOR) / rpm;

    // BSFC (kg/kWh)
    p.bsfc = (p.fuel_mass_flow * SECONDS_PER_HOUR) / p.brake_power;

    return p;
}

PerformanceSeries PerformanceModel::computeSeries(const FuelProperties& fuel,
                                                  const ThermalEfficiencyCurve& efficiency) const {
    PerformanceSeries series;
    series.blend = fuel.getBlend();
    series.points.reserve(sweep_.size());
    for (double rpm : sweep_) {
        series.points.push_back(computePoint(fuel, efficiency, rpm));
    }
    return series;
}

PerformanceSeries PerformanceModel::computeSeries(FuelBlend blend) const {
    return computeSeries(FuelProperties::forBlend(blend), ThermalEfficiencyCurve::forBlend(blend));
}

std::pair<PerformanceSeries, PerformanceSeries> PerformanceModel::computeAll() const {
    return {computeSeries(FuelBlend::E10), computeSeries(FuelBlend::E20)};
}

} // namespace BlendSim
