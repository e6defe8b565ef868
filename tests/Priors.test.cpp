#include <DyNest/Priors.h>

#include "testing.h"

#include <cmath>

using namespace DYN;
using namespace std;

bool ascending(const Col & x) {
    for (Eigen::Index i = 1; i < x.size(); ++i) { if (x[i] < x[i - 1]) { return false; } }
    return true;
}

void test_forced_identifiability(gsl_rng * rng) {
    for (size_t rep = 0; rep < 20; ++rep) {
        Col cube(5);
        for (Eigen::Index i = 0; i < cube.size(); ++i) { cube[i] = gsl_rng_uniform(rng); }
        const Col theta = forced_identifiability(cube);
        IS_TRUE(ascending(theta));
        IS_TRUE((theta.minCoeff() >= 0.0) and (theta.maxCoeff() <= 1.0));
    }
    Col ones = Col::Ones(3);
    IS_TRUE(forced_identifiability(ones) == ones);
}

void test_uniform() {
    const UniformPrior prior(-5, 5);
    Col cube(3);
    cube << 0, 0.5, 1;
    Col expected(3);
    expected << -5, 0, 5;
    IS_TRUE(prior.transform(cube) == expected);
    IS_TRUE(prior.polychord_name() == "uniform");
    THROWS(UniformPrior(1, 1), std::invalid_argument);
}

void test_sorted_and_adaptive(gsl_rng * rng) {
    const UniformPrior sorted(-1, 1, false, true);
    IS_TRUE(ascending(sorted.sample(rng, 6)));
    IS_TRUE(sorted.polychord_name() == "sorted_uniform");

    const UniformPrior adaptive(0, 10, true, true, 1);
    IS_TRUE(adaptive.polychord_name() == "adaptive_sorted_uniform");
    Col cube(4);
    cube << 0.99, 0.9, 0.5, 0.1;
    const Col theta = adaptive.transform(cube);
    // the count coordinate ranges over [nfunc_min - 0.5, nfunc_max + 0.5]
    IS_TRUE(approx_equal(theta[0], 0.99 * 3 + 0.5));
    IS_TRUE(ascending(theta.tail(3)));
    IS_TRUE(theta.tail(3).maxCoeff() <= 10.0);

    cube[0] = std::numeric_limits<float_type>::quiet_NaN();
    const Col nans = adaptive.transform(cube);
    IS_TRUE(nans.size() == 4);
    IS_TRUE(nans.array().isNaN().all());

    const UniformPrior too_many(0, 1, true, false, 5);
    cube[0] = 0.5;
    THROWS(too_many.transform(cube), std::invalid_argument);
}

void test_other_priors(gsl_rng * rng) {
    const GaussianPrior half(2.0, true, 1.0);
    IS_TRUE(half.polychord_name() == "half_gaussian");
    for (size_t rep = 0; rep < 20; ++rep) { IS_TRUE(half.sample(rng, 3).minCoeff() >= 1.0); }

    const GaussianPrior gauss(2.0);
    Col mid(1);
    mid << 0.5;
    IS_TRUE(approx_equal(gauss.transform(mid)[0], 0.0));

    const ExponentialPrior expo(2.0);
    Col u(1);
    u << 1.0 - std::exp(-1.0);
    IS_TRUE(approx_equal(expo.transform(u)[0], 0.5));

    const PowerUniformPrior power(1.0, 4.0, 2.0);
    IS_TRUE(approx_equal(power.transform(mid)[0], 2.25));
    THROWS(PowerUniformPrior(0.0, 4.0, 2.0), std::invalid_argument);
    THROWS(GaussianPrior(0.0), std::invalid_argument);
}

void test_block_prior() {
    const BlockPrior bp(
        { make_shared<UniformPrior>(-5, 5), make_shared<ExponentialPrior>(1.0) },
        { 2, 1 }
    );
    IS_TRUE(bp.nparam() == 3);
    Col cube(3);
    cube << 0, 1, 0;
    Col expected(3);
    expected << -5, 5, 0;
    IS_TRUE(bp.transform(cube) == expected);
    THROWS(bp.transform(Col::Zero(2)), std::invalid_argument);
    THROWS(BlockPrior({ make_shared<UniformPrior>() }, { 1, 2 }), std::invalid_argument);
}

int main() {
    gsl_rng * rng = gsl_rng_alloc(gsl_rng_mt19937);
    gsl_rng_set(rng, 42);
    test_forced_identifiability(rng);
    test_uniform();
    test_sorted_and_adaptive(rng);
    test_other_priors(rng);
    test_block_prior();
    gsl_rng_free(rng);
    return TEST_RESULT;
}
