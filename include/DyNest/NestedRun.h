#ifndef DYNEST_NESTEDRUN_H
#define DYNEST_NESTEDRUN_H

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <DyNest/TypeDefs.h>

namespace DYN {

// PolyChord's default `logzero`; birth contours at or below this are "from the prior"
const float_type LOGZERO = -1e30;

struct RunFormatError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// where a run lives on disk, plus whatever the sampler's stats file told us
struct RunOutput {
    std::string base_dir;
    std::string file_root;
    std::optional<float_type> logZ;
    std::optional<float_type> logZerr;
    std::optional<size_t> ndead;
    std::optional<size_t> nlike;
};

// A nested sampling run, stored as columns ordered by ascending logl.
//
// Conventions:
//  - one row of `theta` per point
//  - `thread_min_max` has one row per thread label: [birth contour, final logl]
//  - a thread alive from the start of the run has birth contour -inf
struct Run {
    Col logl;
    Mat2D theta;
    Coli thread_labels;
    Col nlive_array;
    Mat2D thread_min_max;
    RunOutput output;

    size_t nsamples() const { return logl.size(); }
    size_t ndim() const { return theta.cols(); }
    size_t nthreads() const { return thread_min_max.rows(); }
};

// expected log prior volume at each point, given the live point counts
Col get_logx(const Col & nlive);

// trapezium-rule log weights: logl + log((X_{i-1} - X_{i+1}) / 2)
Col get_logw(const Run & run);

// posterior weights relative to the largest
Col get_w_rel(const Run & run);

float_type log_evidence(const Run & run);

// log(sum(exp(vals))), stable for large magnitudes
float_type logsumexp(const Col & vals);

// number of threads with min < logl[i] <= max, for each i; logl must be ascending
Col nlive_given_threads(const Col & logl, const Mat2D & thread_min_max);

// throws RunFormatError if the bookkeeping invariants of `run` do not hold
void check_ns_run(const Run & run);

// stable ordering of point indices by ascending logl
std::vector<size_t> logl_order(const Col & logl);

}

#endif // DYNEST_NESTEDRUN_H
