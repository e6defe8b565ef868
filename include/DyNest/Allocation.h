#ifndef DYNEST_ALLOCATION_H
#define DYNEST_ALLOCATION_H

#include <functional>
#include <iostream>
#include <stdexcept>

#include <DyNest/NestedRun.h>

namespace DYN {

struct AllocationError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Live point population handed to the sampler: start with `initial_nlive`,
// then for each (threshold, nlive) in `steps`, once logl exceeds threshold,
// switch to nlive. Thresholds are strictly ascending.
struct AllocationProfile {
    int initial_nlive = 0;
    NliveSteps steps;
};

// @var importance per point of the initial run, max 1
// @var nlive_allocation_unsmoothed target live points per point, before smoothing and rounding
// @var nlive_allocation what the dynamic run should use; whole numbers
// @var peak_start_ind first point where the allocation exceeds the initial run's own population
// @var samp_tot the sample budget the allocation was scaled to
// @var profile `nlive_allocation`, compressed to the points where it changes
struct AllocationInfo {
    Col importance;
    Col nlive_allocation_unsmoothed;
    Col nlive_allocation;
    size_t peak_start_ind = 0;
    size_t samp_tot = 0;
    AllocationProfile profile;
};

// any transform of a live point profile to another of the same length
typedef std::function<Col(const Col &)> SmoothingFilter;

// Gaussian kernel smoothing, standard deviation `sigma` measured in points.
// The window is truncated at 3 sigma and the ends are padded with the edge
// values.
SmoothingFilter gaussian_smoothing(const float_type sigma);

// Decide how many live points the dynamic run should have as a function of logl.
//
// Extra samples (samp_tot - run.nsamples()) are distributed in proportion to
// `sample_importance`, scaled so the extra live points integrated over -log X
// account for the whole remaining budget, and added to the run's own
// population.
//
// @param run the initial exploratory run
// @param samp_tot total samples wanted in the combined output
// @param dynamic_goal in [0, 1]
// @param smoothing_filter optional; applied before rounding
// @param os where warnings go
// @param tuned_dynamic_p see sample_importance
//
// @throws AllocationError if no budget remains or the run is too short to allocate over
AllocationInfo allocate(
    const Run & run,
    const size_t samp_tot,
    const float_type dynamic_goal,
    const SmoothingFilter & smoothing_filter = nullptr,
    std::ostream & os = std::cerr,
    const bool tuned_dynamic_p = false
);

// compress a whole-number allocation into thresholds for the sampler;
// each change at index i is keyed by logl[i - 1]
AllocationProfile allocation_profile(const Col & logl, const Col & nlive_allocation);

// The profile for a dynamic run that starts from scratch and is combined with
// `run` afterwards: only the live points the allocation adds on top of the
// run's own population, at least 1 everywhere.
AllocationProfile added_live_profile(const Run & run, const Col & nlive_allocation);

}

#endif // DYNEST_ALLOCATION_H
