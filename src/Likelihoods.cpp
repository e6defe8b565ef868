#include <DyNest/Likelihoods.h>

#include <gsl/gsl_math.h>
#include <gsl/gsl_sf_gamma.h>
#include <cmath>
#include <stdexcept>

#include <DyNest/NestedRun.h>

namespace DYN {

// non-exported helpers
float_type log_gaussian_pdf(const float_type x, const float_type mu, const float_type sigma) {
    return -0.5 * std::pow((x - mu) / sigma, 2) - std::log(sigma) - 0.5 * std::log(2.0 * M_PI);
}

float_type log_loggamma_pdf(const float_type x, const float_type c, const float_type loc) {
    return c * (x - loc) - std::exp(x - loc) - gsl_sf_lngamma(c);
}

float_type GaussianLikelihood::operator()(const Col & theta) const {
    const float_type dim = theta.size();
    return -theta.squaredNorm() / (2.0 * sigma * sigma) - 0.5 * dim * std::log(2.0 * M_PI * sigma * sigma);
}

float_type GaussianShellLikelihood::operator()(const Col & theta) const {
    const float_type rad = theta.norm();
    return -std::pow(rad - rshell, 2) / (2.0 * sigma * sigma);
}

GaussianMixLikelihood::GaussianMixLikelihood(
    const float_type separation, const std::vector<float_type> & wts, const float_type sd
) : sep(separation), weights(wts), sigma(sd) {
    if (weights.size() != 4) { throw std::invalid_argument("GaussianMixLikelihood: need exactly 4 component weights."); }
}

float_type GaussianMixLikelihood::operator()(const Col & theta) const {
    if (theta.size() < 2) { throw std::invalid_argument("GaussianMixLikelihood: need at least 2 dimensions."); }
    const float_type centres[4][2] = { { 0.0, sep }, { 0.0, -sep }, { sep, 0.0 }, { -sep, 0.0 } };
    Col logls(4);
    for (size_t m = 0; m < 4; ++m) {
        float_type logl = std::log(weights[m]);
        for (Eigen::Index d = 0; d < theta.size(); ++d) {
            const float_type mu = (d < 2) ? centres[m][d] : 0.0;
            logl += log_gaussian_pdf(theta[d], mu, sigma);
        }
        logls[m] = logl;
    }
    return logsumexp(logls);
}

float_type LogGammaMixLikelihood::operator()(const Col & theta) const {
    if (theta.size() < 2) { throw std::invalid_argument("LogGammaMixLikelihood: need at least 2 dimensions."); }
    const float_type log_half = std::log(0.5);
    Col modes(2);
    modes << log_half + log_loggamma_pdf(theta[0], c, 10.0), log_half + log_loggamma_pdf(theta[0], c, -10.0);
    float_type logl = logsumexp(modes);
    modes << log_half + log_gaussian_pdf(theta[1], 10.0, sigma), log_half + log_gaussian_pdf(theta[1], -10.0, sigma);
    logl += logsumexp(modes);

    const Eigen::Index rest = theta.size() - 2;
    const Eigen::Index nlg = rest / 2;
    for (Eigen::Index d = 2; d < 2 + nlg; ++d) { logl += log_loggamma_pdf(theta[d], c, 10.0); }
    for (Eigen::Index d = 2 + nlg; d < theta.size(); ++d) { logl += log_gaussian_pdf(theta[d], 10.0, sigma); }
    return logl;
}

float_type RastriginLikelihood::operator()(const Col & theta) const {
    const float_type dim = theta.size();
    float_type total = A * dim;
    for (Eigen::Index d = 0; d < theta.size(); ++d) {
        total += theta[d] * theta[d] - A * std::cos(2.0 * M_PI * theta[d]);
    }
    return -total;
}

float_type RosenbrockLikelihood::operator()(const Col & theta) const {
    float_type total = 0.0;
    for (Eigen::Index d = 0; d + 1 < theta.size(); ++d) {
        total += std::pow(a - theta[d], 2) + b * std::pow(theta[d + 1] - theta[d] * theta[d], 2);
    }
    return -total;
}

}
