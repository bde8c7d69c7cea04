#include "NoiseInjector.hpp"
#include <cmath>
#include <stdexcept>

namespace BlendSim {

NoiseInjector::NoiseInjector(double fraction, unsigned int seed)
    : fraction_(fraction), seed_(seed), rng_(seed), normal_(0.0, 1.0) {
    if (!(fraction >= 0.0) || !std::isfinite(fraction)) {
        throw std::invalid_argument("Invalid parameter: noise fraction must be non-negative");
    }
}

void NoiseInjector::reseed(unsigned int seed) {
    seed_ = seed;
    rng_.seed(seed);
    normal_.reset();
}

double NoiseInjector::factor() {
    return 1.0 + fraction_ * normal_(rng_);
}

void NoiseInjector::perturb(std::vector<double>& values) {
    for (double& v : values) {
        v *= factor();
    }
}

template <typename Member>
void NoiseInjector::perturbMember(PerformanceSeries& series, Member member) {
    for (auto& p : series.points) {
        p.*member *= factor();
    }
}

void NoiseInjector::apply(PerformanceSeries& a, PerformanceSeries& b) {
    perturbMember(a, &PerformancePoint::brake_power);
    perturbMember(b, &PerformancePoint::brake_power);
    perturbMember(a, &PerformancePoint::torque);
    perturbMember(b, &PerformancePoint::torque);
    perturbMember(a, &PerformancePoint::bsfc);
    perturbMember(b, &PerformancePoint::bsfc);
    perturbMember(a, &PerformancePoint::thermal_efficiency);
    perturbMember(b, &PerformancePoint::thermal_efficiency);
}

} // namespace BlendSim
