#include <DyNest/Priors.h>

#include <gsl/gsl_cdf.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace DYN {

Col forced_identifiability(const Col & cube) {
    const Eigen::Index n = cube.size();
    Col theta(n);
    if (n == 0) { return theta; }
    theta[n - 1] = std::pow(cube[n - 1], 1.0 / n);
    for (Eigen::Index i = n - 2; i >= 0; --i) {
        theta[i] = std::pow(cube[i], 1.0 / (i + 1)) * theta[i + 1];
    }
    return theta;
}

Col Prior::adaptive_transform(const Col & cube) const {
    const Eigen::Index nfunc_max = cube.size() - 1;
    if ((nfunc_max < 1) or (nfunc_min < 1) or (nfunc_min > nfunc_max)) {
        std::stringstream err;
        err << "adaptive prior needs 1 <= nfunc_min <= number of block parameters; got nfunc_min = "
            << nfunc_min << " with " << nfunc_max << " block parameters";
        throw std::invalid_argument(err.str());
    }
    Col theta = cube;
    theta[0] = cube[0] * (nfunc_max - nfunc_min + 1) + nfunc_min - 0.5;
    // cube[0] = 1 sits on a rounding edge
    const Eigen::Index nfunc = std::clamp<Eigen::Index>(
        static_cast<Eigen::Index>(std::nearbyint(theta[0])), nfunc_min, nfunc_max
    );
    if (sort) {
        theta.segment(1, nfunc) = forced_identifiability(cube.segment(1, nfunc));
    }
    return theta;
}

Col Prior::transform(const Col & cube) const {
    if (adaptive) {
        if ((cube.size() > 0) and std::isnan(cube[0])) {
            return Col::Constant(cube.size(), std::numeric_limits<float_type>::quiet_NaN());
        }
        Col theta = adaptive_transform(cube);
        theta.tail(theta.size() - 1) = cube_to_physical(theta.tail(theta.size() - 1));
        return theta;
    } else if (sort) {
        return cube_to_physical(forced_identifiability(cube));
    }
    return cube_to_physical(cube);
}

Col Prior::sample(const gsl_rng * rng, const size_t nparam) const {
    Col cube(nparam);
    for (size_t i = 0; i < nparam; ++i) { cube[i] = gsl_rng_uniform(rng); }
    return transform(cube);
}

std::string Prior::polychord_name() const {
    std::string name = base_name();
    if (sort) { name = "sorted_" + name; }
    if (adaptive) { name = "adaptive_" + name; }
    return name;
}

UniformPrior::UniformPrior(
    const float_type min, const float_type max,
    const bool adapt, const bool srt, const int nfmin
) : Prior(adapt, srt, nfmin), minval(min), maxval(max) {
    if (not (min < max)) { throw std::invalid_argument("UniformPrior: min must be below max."); }
}

Col UniformPrior::cube_to_physical(const Col & cube) const {
    return (cube.array() * (maxval - minval) + minval).matrix();
}

PowerUniformPrior::PowerUniformPrior(
    const float_type min, const float_type max, const float_type pwr,
    const bool adapt, const bool srt, const int nfmin
) : Prior(adapt, srt, nfmin), minval(min), maxval(max), power(pwr) {
    if (power == 0) { throw std::invalid_argument("PowerUniformPrior: power must be non-zero."); }
    if (not ((0 < min) and (min < max))) { throw std::invalid_argument("PowerUniformPrior: need 0 < min < max."); }
}

Col PowerUniformPrior::cube_to_physical(const Col & cube) const {
    // (a + u (b - a)) ^ power is increasing in u for either sign of power
    const float_type a = std::pow(minval, 1.0 / power);
    const float_type b = std::pow(maxval, 1.0 / power);
    return (cube.array() * (b - a) + a).pow(power).matrix();
}

GaussianPrior::GaussianPrior(
    const float_type sd, const bool hlf, const float_type mn,
    const bool adapt, const bool srt, const int nfmin
) : Prior(adapt, srt, nfmin), sigma(sd), half(hlf), mu(mn) {
    if (not (sigma > 0)) { throw std::invalid_argument("GaussianPrior: sigma must be positive."); }
}

Col GaussianPrior::cube_to_physical(const Col & cube) const {
    Col theta(cube.size());
    for (Eigen::Index i = 0; i < cube.size(); ++i) {
        const float_type u = half ? 0.5 * (1.0 + cube[i]) : cube[i];
        theta[i] = gsl_cdf_gaussian_Pinv(u, sigma) + mu;
    }
    return theta;
}

ExponentialPrior::ExponentialPrior(
    const float_type lam,
    const bool adapt, const bool srt, const int nfmin
) : Prior(adapt, srt, nfmin), lambda(lam) {
    if (not (lambda > 0)) { throw std::invalid_argument("ExponentialPrior: lambda must be positive."); }
}

Col ExponentialPrior::cube_to_physical(const Col & cube) const {
    Col theta(cube.size());
    for (Eigen::Index i = 0; i < cube.size(); ++i) { theta[i] = gsl_cdf_exponential_Pinv(cube[i], 1.0 / lambda); }
    return theta;
}

BlockPrior::BlockPrior(
    const std::vector<std::shared_ptr<const Prior>> & p,
    const std::vector<size_t> & sizes
) : priors(p), block_sizes(sizes) {
    if (priors.size() != block_sizes.size()) {
        throw std::invalid_argument("BlockPrior: need one block size per prior.");
    }
}

size_t BlockPrior::nparam() const {
    return std::accumulate(block_sizes.begin(), block_sizes.end(), size_t(0));
}

Col BlockPrior::transform(const Col & cube) const {
    if (static_cast<size_t>(cube.size()) != nparam()) {
        std::stringstream err;
        err << "BlockPrior: expected " << nparam() << " coordinates, got " << cube.size();
        throw std::invalid_argument(err.str());
    }
    Col theta(cube.size());
    Eigen::Index start = 0;
    for (size_t b = 0; b < priors.size(); ++b) {
        const Eigen::Index len = block_sizes[b];
        theta.segment(start, len) = priors[b]->transform(cube.segment(start, len));
        start += len;
    }
    return theta;
}

}
