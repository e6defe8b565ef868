#include <DyNest/Importance.h>

#include <gsl/gsl_statistics_double.h>
#include <sstream>
#include <stdexcept>

namespace DYN {

Col z_importance(const Col & w_rel) {
    Col remaining(w_rel.size());
    const float_type total = w_rel.sum();
    float_type cumulative = 0.0;
    for (Eigen::Index i = 0; i < w_rel.size(); ++i) {
        cumulative += w_rel[i];
        remaining[i] = total - cumulative;
    }
    const float_type norm = remaining.sum();
    if (norm > 0) { remaining /= norm; }
    return remaining;
}

Col p_importance(const Mat2D & theta, const Col & w_rel, const bool tuned_dynamic_p) {
    Col imp = w_rel;
    if (tuned_dynamic_p and (theta.cols() > 0) and (w_rel.size() > 1)) {
        // theta is column-major, so the first parameter is contiguous
        const Col theta1 = theta.col(0);
        const float_type mean = gsl_stats_wmean(w_rel.data(), 1, theta1.data(), 1, theta1.size());
        imp = ((theta1.array() - mean).abs() * w_rel.array()).matrix();
    }
    const float_type norm = imp.sum();
    if (norm > 0) { imp /= norm; }
    return imp;
}

Col sample_importance(const Run & run, const float_type dynamic_goal, const bool tuned_dynamic_p) {
    if (not ((0 <= dynamic_goal) and (dynamic_goal <= 1))) {
        std::stringstream err;
        err << "dynamic_goal must be in [0, 1]; got " << dynamic_goal;
        throw std::invalid_argument(err.str());
    }
    if (run.nsamples() == 0) { return Col(); }

    const Col logw = run.logl + get_logx(run.nlive_array);
    const Col w_rel = (logw.array() - logw.maxCoeff()).exp().matrix();

    Col imp = Col::Zero(w_rel.size());
    if (dynamic_goal != 1) { imp += (1 - dynamic_goal) * z_importance(w_rel); }
    if (dynamic_goal != 0) { imp += dynamic_goal * p_importance(run.theta, w_rel, tuned_dynamic_p); }

    const float_type mx = imp.maxCoeff();
    if (mx > 0) {
        imp /= mx;
    } else {
        // a single point has no remaining evidence; it is all there is
        imp.setOnes();
    }
    return imp;
}

}
