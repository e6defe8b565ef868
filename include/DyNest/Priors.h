#ifndef DYNEST_PRIORS_H
#define DYNEST_PRIORS_H

#include <memory>
#include <string>
#include <vector>
#include <gsl/gsl_rng.h>

#include <DyNest/TypeDefs.h>

namespace DYN {

// Map a unit hypercube point to parameters where each coordinate is no
// smaller than the one before (x_{n-1} ^ (1/n), then each earlier coordinate
// scaled by its own root).
Col forced_identifiability(const Col & cube);

// A Prior maps unit hypercube points to physical parameters.
//
// Options shared by every variant:
//  - sort: the parameters are exchangeable, so they are kept in ascending order
//  - adaptive: the first coordinate chooses how many of the rest are active
//    (from nfunc_min to all); only that block is sorted, and the returned first
//    coordinate is the (continuous) count
// Abstract Base Class: concrete priors supply the elementwise transform and
// their PolyChord name and parameters.
struct Prior {
    Prior(const bool adapt = false, const bool srt = false, const int nfmin = 1)
    : adaptive(adapt), sort(srt), nfunc_min(nfmin) {}
    virtual ~Prior() = default;

    // NaN in the count coordinate of an adaptive prior gives all NaN
    virtual Col transform(const Col & cube) const;

    // a draw from the prior, using an explicit random source
    Col sample(const gsl_rng * rng, const size_t nparam) const;

    // "[adaptive_][sorted_]<base_name>"
    std::string polychord_name() const;

    virtual std::string base_name() const = 0;
    virtual std::vector<float_type> polychord_params() const = 0;

    const bool adaptive;
    const bool sort;
    const int nfunc_min;

    protected:
        virtual Col cube_to_physical(const Col & cube) const = 0;
        Col adaptive_transform(const Col & cube) const;
};

struct UniformPrior : public Prior {
    UniformPrior(
        const float_type min = 0.0, const float_type max = 1.0,
        const bool adapt = false, const bool srt = false, const int nfmin = 1
    );
    std::string base_name() const override { return "uniform"; }
    std::vector<float_type> polychord_params() const override { return { minval, maxval }; }

    protected:
        Col cube_to_physical(const Col & cube) const override;
        const float_type minval, maxval;
};

// uniform in theta ^ (1 / power), e.g. power = -1 is uniform in 1 / theta
struct PowerUniformPrior : public Prior {
    PowerUniformPrior(
        const float_type min, const float_type max, const float_type power,
        const bool adapt = false, const bool srt = false, const int nfmin = 1
    );
    std::string base_name() const override { return "power_uniform"; }
    std::vector<float_type> polychord_params() const override { return { minval, maxval, power }; }

    protected:
        Col cube_to_physical(const Col & cube) const override;
        const float_type minval, maxval, power;
};

// `half` folds the distribution about mu, keeping the upper half
struct GaussianPrior : public Prior {
    GaussianPrior(
        const float_type sigma = 1.0, const bool half = false, const float_type mu = 0.0,
        const bool adapt = false, const bool srt = false, const int nfmin = 1
    );
    std::string base_name() const override { return half ? "half_gaussian" : "gaussian"; }
    std::vector<float_type> polychord_params() const override { return { mu, sigma }; }

    protected:
        Col cube_to_physical(const Col & cube) const override;
        const float_type sigma;
        const bool half;
        const float_type mu;
};

struct ExponentialPrior : public Prior {
    ExponentialPrior(
        const float_type lambda = 1.0,
        const bool adapt = false, const bool srt = false, const int nfmin = 1
    );
    std::string base_name() const override { return "exponential"; }
    std::vector<float_type> polychord_params() const override { return { lambda }; }

    protected:
        Col cube_to_physical(const Col & cube) const override;
        const float_type lambda;
};

// consecutive blocks of parameters, each with its own prior
struct BlockPrior {
    BlockPrior(
        const std::vector<std::shared_ptr<const Prior>> & priors,
        const std::vector<size_t> & block_sizes
    );

    Col transform(const Col & cube) const;
    size_t nparam() const;

    const std::vector<std::shared_ptr<const Prior>> priors;
    const std::vector<size_t> block_sizes;
};

}

#endif // DYNEST_PRIORS_H
