#ifndef DYNEST_LIKELIHOODS_H
#define DYNEST_LIKELIHOODS_H

#include <string>
#include <vector>

#include <DyNest/TypeDefs.h>

namespace DYN {

// Test likelihoods for driving a sampler. Pure: logl depends only on theta.
struct Likelihood {
    virtual ~Likelihood() = default;
    virtual float_type operator()(const Col & theta) const = 0;
    // short label used in output file roots
    virtual std::string name() const = 0;
};

// spherically symmetric, normalised
struct GaussianLikelihood : public Likelihood {
    GaussianLikelihood(const float_type sd = 1.0) : sigma(sd) {}
    float_type operator()(const Col & theta) const override;
    std::string name() const override { return "gaussian"; }
    const float_type sigma;
};

// peaked on the sphere of radius rshell; not normalised
struct GaussianShellLikelihood : public Likelihood {
    GaussianShellLikelihood(const float_type sd = 0.2, const float_type rsh = 2.0) : sigma(sd), rshell(rsh) {}
    float_type operator()(const Col & theta) const override;
    std::string name() const override { return "gaussian_shell"; }
    const float_type sigma, rshell;
};

// Four normalised Gaussians placed at (0, sep), (0, -sep), (sep, 0) and
// (-sep, 0) in the first two dimensions, centred on 0 in any others.
struct GaussianMixLikelihood : public Likelihood {
    GaussianMixLikelihood(
        const float_type separation = 4.0,
        const std::vector<float_type> & wts = { 0.4, 0.3, 0.2, 0.1 },
        const float_type sd = 1.0
    );
    float_type operator()(const Col & theta) const override;
    std::string name() const override { return "gaussian_mix"; }
    const float_type sep;
    const std::vector<float_type> weights;
    const float_type sigma;
};

// Bimodal in the first two dimensions (log-gamma, then Gaussian, with modes
// at +/- 10); the remaining dimensions are split between log-gamma and
// Gaussian factors centred on 10.
struct LogGammaMixLikelihood : public Likelihood {
    LogGammaMixLikelihood(const float_type shape = 1.0, const float_type sd = 1.0) : c(shape), sigma(sd) {}
    float_type operator()(const Col & theta) const override;
    std::string name() const override { return "log_gamma_mix"; }
    const float_type c, sigma;
};

// maximum 0 at the origin
struct RastriginLikelihood : public Likelihood {
    RastriginLikelihood(const float_type amp = 10.0) : A(amp) {}
    float_type operator()(const Col & theta) const override;
    std::string name() const override { return "rastrigin"; }
    const float_type A;
};

// maximum 0 at (1, ..., 1) with the default a
struct RosenbrockLikelihood : public Likelihood {
    RosenbrockLikelihood(const float_type aval = 1.0, const float_type bval = 100.0) : a(aval), b(bval) {}
    float_type operator()(const Col & theta) const override;
    std::string name() const override { return "rosenbrock"; }
    const float_type a, b;
};

}

#endif // DYNEST_LIKELIHOODS_H
