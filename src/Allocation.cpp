#include <DyNest/Allocation.h>
#include <DyNest/DynLog.h>
#include <DyNest/Importance.h>

#include <gsl/gsl_filter.h>
#include <gsl/gsl_vector.h>
#include <cmath>
#include <sstream>

using std::stringstream;

namespace DYN {

// tolerance for spotting increases introduced by smoothing
const float_type INCREASE_TOL = 1e-10;

SmoothingFilter gaussian_smoothing(const float_type sigma) {
    if (not (sigma > 0)) {
        stringstream err;
        err << "gaussian_smoothing: sigma must be positive; got " << sigma;
        throw std::invalid_argument(err.str());
    }
    return [sigma](const Col & profile) -> Col {
        const size_t n = profile.size();
        size_t K = 2 * static_cast<size_t>(std::ceil(3.0 * sigma)) + 1;
        if (K > n) { K = (n % 2 == 1) ? n : n - 1; }
        if (K < 3) { return profile; }

        const double alpha = (K - 1) / (2.0 * sigma);
        Col smoothed(n);
        gsl_vector_const_view x = gsl_vector_const_view_array(profile.data(), n);
        gsl_vector_view y = gsl_vector_view_array(smoothed.data(), n);
        gsl_filter_gaussian_workspace * w = gsl_filter_gaussian_alloc(K);
        const int status = gsl_filter_gaussian(GSL_FILTER_END_PADVALUE, alpha, 0, &x.vector, &y.vector, w);
        gsl_filter_gaussian_free(w);
        if (status != GSL_SUCCESS) {
            throw std::runtime_error("gaussian_smoothing: GSL filter failed.");
        }
        return smoothed;
    };
}

// trapezium rule integral of y over x
float_type trapz(const Col & y, const Col & x) {
    float_type total = 0.0;
    for (Eigen::Index i = 1; i < y.size(); ++i) {
        total += 0.5 * (y[i] + y[i - 1]) * (x[i] - x[i - 1]);
    }
    return total;
}

AllocationProfile allocation_profile(const Col & logl, const Col & nlive_allocation) {
    AllocationProfile profile;
    if (nlive_allocation.size() == 0) { return profile; }
    profile.initial_nlive = static_cast<int>(nlive_allocation[0]);
    for (Eigen::Index i = 1; i < nlive_allocation.size(); ++i) {
        if (nlive_allocation[i] == nlive_allocation[i - 1]) { continue; }
        const float_type threshold = logl[i - 1];
        const int nlive = static_cast<int>(nlive_allocation[i]);
        // ties in logl give the same threshold twice; the later population wins
        if (not profile.steps.empty() and (profile.steps.back().first == threshold)) {
            profile.steps.back().second = nlive;
        } else {
            profile.steps.push_back({threshold, nlive});
        }
    }
    return profile;
}

AllocationProfile added_live_profile(const Run & run, const Col & nlive_allocation) {
    if (nlive_allocation.size() != run.nlive_array.size()) {
        stringstream err;
        err << "added_live_profile: allocation has " << nlive_allocation.size() << " points; the run has " << run.nlive_array.size();
        throw std::invalid_argument(err.str());
    }
    const Col added = (nlive_allocation - run.nlive_array).cwiseMax(1.0);
    return allocation_profile(run.logl, added);
}

AllocationInfo allocate(
    const Run & run,
    const size_t samp_tot,
    const float_type dynamic_goal,
    const SmoothingFilter & smoothing_filter,
    std::ostream & os,
    const bool tuned_dynamic_p
) {
    const size_t n = run.nsamples();
    if (n < 2) {
        stringstream err;
        err << "allocate: need at least 2 points to allocate over; the run has " << n;
        throw AllocationError(err.str());
    }
    if (samp_tot <= n) {
        stringstream err;
        err << "allocate: samp_tot = " << samp_tot << " leaves no samples to allocate; the initial run already has " << n;
        throw AllocationError(err.str());
    }

    AllocationInfo info;
    info.samp_tot = samp_tot;
    info.importance = sample_importance(run, dynamic_goal, tuned_dynamic_p);

    const Col neg_logx = -get_logx(run.nlive_array);
    const float_type norm = std::abs(trapz(info.importance, neg_logx));
    if (not (norm > 0)) {
        throw AllocationError("allocate: importance integrates to zero over the run; cannot scale the allocation.");
    }
    const float_type extra = static_cast<float_type>(samp_tot - n);
    const Col unsmoothed = run.nlive_array + info.importance * (extra / norm);

    Col nlives = unsmoothed;
    if (smoothing_filter) {
        nlives = smoothing_filter(unsmoothed);
        if (nlives.size() != unsmoothed.size()) {
            stringstream err;
            err << "allocate: smoothing filter changed the profile length from " << unsmoothed.size() << " to " << nlives.size();
            throw std::invalid_argument(err.str());
        }
        if (dynamic_goal == 0) {
            // evidence allocations only ever decrease with logl
            bool increases = false;
            for (Eigen::Index i = 1; i < nlives.size(); ++i) {
                if (nlives[i] - nlives[i - 1] > INCREASE_TOL) { increases = true; break; }
            }
            if (increases) {
                DynLog::warning(
                    "smoothing made the dynamic_goal=0 live point allocation increase with logl; using the unsmoothed allocation instead.", os
                );
                nlives = unsmoothed;
            }
        }
    }

    info.nlive_allocation_unsmoothed = unsmoothed.array().round().matrix();
    info.nlive_allocation = nlives.array().round().matrix();

    if (info.nlive_allocation[n - 1] > run.nlive_array[n - 1]) {
        stringstream msg;
        msg << "the allocation still adds live points at the final point of the initial run ("
            << info.nlive_allocation[n - 1] << " vs " << run.nlive_array[n - 1]
            << "); the initial run may have stopped before the posterior bulk was resolved.";
        DynLog::warning(msg.str(), os);
    }

    info.peak_start_ind = 0;
    for (size_t i = 0; i < n; ++i) {
        if (info.nlive_allocation[i] > run.nlive_array[i]) { info.peak_start_ind = i; break; }
    }

    info.profile = allocation_profile(run.logl, info.nlive_allocation);
    return info;
}

}
