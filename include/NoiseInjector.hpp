#ifndef NOISE_INJECTOR_HPP
#define NOISE_INJECTOR_HPP

#include "EngineModel.hpp"
#include <random>
#include <vector>

namespace BlendSim {

/**
 * @brief Multiplicative Gaussian measurement noise
 *
 * Every value v becomes v * (1 + fraction * z) with z ~ N(0, 1), drawn
 * from a generator seeded once per injector. Perturbed values are not
 * clamped.
 *
 * Draw order for a blend pair (A, B):
 *   brake power A, brake power B, torque A, torque B,
 *   BSFC A, BSFC B, thermal efficiency A, thermal efficiency B
 * and ascending rpm index within each array.
 */
class NoiseInjector {
public:
    explicit NoiseInjector(double fraction = 0.02, unsigned int seed = 1);

    void perturb(std::vector<double>& values);

    /// Perturb both series in place, in the documented draw order
    void apply(PerformanceSeries& a, PerformanceSeries& b);

    void reseed(unsigned int seed);

    double getFraction() const { return fraction_; }
    unsigned int getSeed() const { return seed_; }

private:
    double fraction_;
    unsigned int seed_;
    std::mt19937 rng_;
    std::normal_distribution<double> normal_;

    double factor();

    template <typename Member>
    void perturbMember(PerformanceSeries& series, Member member);
};

} // namespace BlendSim

#endif // NOISE_INJECTOR_HPP
