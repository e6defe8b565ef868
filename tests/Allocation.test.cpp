#include <DyNest/Allocation.h>

#include "testing.h"
#include "dummy_sampler.h"

using namespace DYN;
using namespace std;

// two threads alive from the start, interleaved: logl = 0, 1, ..., 19
Run interleaved_run() {
    const size_t n = 20;
    Run run;
    run.logl.resize(n);
    run.theta = Mat2D::Zero(n, 2);
    run.thread_labels.resize(n);
    for (size_t i = 0; i < n; ++i) {
        run.logl[i] = i;
        run.thread_labels[i] = i % 2;
    }
    run.thread_min_max.resize(2, 2);
    run.thread_min_max << -std::numeric_limits<float_type>::infinity(), 18,
                          -std::numeric_limits<float_type>::infinity(), 19;
    run.nlive_array = nlive_given_threads(run.logl, run.thread_min_max);
    return run;
}

void test_parameter_goal() {
    const Run run = interleaved_run();
    ostringstream log;
    const AllocationInfo info = allocate(run, 40, 1.0, nullptr, log);
    // posterior mass is still rising at the final point
    IS_TRUE(count_warnings(log.str()) == 1);
    IS_TRUE(info.nlive_allocation == info.nlive_allocation_unsmoothed);
    IS_TRUE(info.samp_tot == 40);
    IS_TRUE(info.peak_start_ind == 13);
    IS_TRUE(info.nlive_allocation[0] == 2);
    IS_TRUE(info.nlive_allocation[18] == 12);
    IS_TRUE(info.nlive_allocation[19] == 11);

    const NliveSteps expected = { {12, 3}, {14, 4}, {15, 6}, {16, 8}, {17, 12}, {18, 11} };
    IS_TRUE(info.profile.initial_nlive == 2);
    IS_TRUE(info.profile.steps == expected);

    // a fresh dynamic run only supplies the points the initial run lacks
    const AllocationProfile added = added_live_profile(run, info.nlive_allocation);
    const NliveSteps expected_added = { {14, 2}, {15, 4}, {16, 6}, {17, 10} };
    IS_TRUE(added.initial_nlive == 1);
    IS_TRUE(added.steps == expected_added);

    THROWS(added_live_profile(run, info.nlive_allocation.head(5)), std::invalid_argument);
}

void test_evidence_goal() {
    const Run run = interleaved_run();
    ostringstream log;
    const AllocationInfo info = allocate(run, 40, 0.0, nullptr, log);
    IS_TRUE(count_warnings(log.str()) == 0);
    IS_TRUE(info.peak_start_ind == 0);
    IS_TRUE(info.nlive_allocation[0] == 4);
    IS_TRUE(info.nlive_allocation[19] == 1);
    for (Eigen::Index i = 1; i < info.nlive_allocation.size(); ++i) {
        IS_TRUE(info.nlive_allocation[i] <= info.nlive_allocation[i - 1]);
    }
}

void test_evidence_goal_rejects_increasing_smoothing() {
    const Run run = dummy_run(2, 10, 2, 0, 1.0);
    const SmoothingFilter ramp = [](const Col & x) -> Col {
        Col y = x;
        for (Eigen::Index i = 0; i < y.size(); ++i) { y[i] += 100 * i; }
        return y;
    };
    ostringstream log;
    const AllocationInfo info = allocate(run, 40, 0.0, ramp, log);
    IS_TRUE(count_warnings(log.str()) == 1);
    IS_TRUE(info.nlive_allocation == info.nlive_allocation_unsmoothed);
}

void test_no_budget() {
    const Run run = dummy_run(2, 10, 2, 0, 1.0);
    ostringstream log;
    THROWS(allocate(run, 1, 1.0, nullptr, log), AllocationError);
    THROWS(allocate(run, 20, 1.0, nullptr, log), AllocationError);
    const Run tiny = dummy_run(1, 1, 2, 0, 1.0);
    THROWS(allocate(tiny, 10, 1.0, nullptr, log), AllocationError);
}

void test_gaussian_smoothing() {
    const SmoothingFilter smooth = gaussian_smoothing(2.0);
    const Col flat = Col::Constant(30, 7.0);
    const Col out = smooth(flat);
    IS_TRUE(out.size() == 30);
    for (Eigen::Index i = 0; i < out.size(); ++i) { IS_TRUE(approx_equal(out[i], 7.0, 1e-10)); }

    Col spike = Col::Zero(31);
    spike[15] = 1.0;
    const Col spread = smooth(spike);
    IS_TRUE(spread[15] < 1.0);
    IS_TRUE(spread[14] > 0.0);
    IS_TRUE(approx_equal(spread[14], spread[16], 1e-12));

    // too short to smooth
    const Col pair = Col::Constant(2, 3.0);
    IS_TRUE(smooth(pair) == pair);

    THROWS(gaussian_smoothing(0.0), std::invalid_argument);

    const Run run = interleaved_run();
    ostringstream log;
    const SmoothingFilter shrink = [](const Col & x) -> Col { return x.head(x.size() - 1); };
    THROWS(allocate(run, 40, 1.0, shrink, log), std::invalid_argument);
}

void test_profile_compression() {
    Col logl(5), alloc(5);
    logl << 1, 2, 3, 4, 5;
    alloc << 3, 3, 5, 5, 2;
    AllocationProfile profile = allocation_profile(logl, alloc);
    IS_TRUE(profile.initial_nlive == 3);
    IS_TRUE((profile.steps == NliveSteps{ {2, 5}, {4, 2} }));

    // equal thresholds keep the later population
    Col tied(4), tied_alloc(4);
    tied << 1, 1, 1, 2;
    tied_alloc << 1, 2, 3, 3;
    profile = allocation_profile(tied, tied_alloc);
    IS_TRUE(profile.initial_nlive == 1);
    IS_TRUE((profile.steps == NliveSteps{ {1, 3} }));
}

int main() {
    test_parameter_goal();
    test_evidence_goal();
    test_evidence_goal_rejects_increasing_smoothing();
    test_no_budget();
    test_gaussian_smoothing();
    test_profile_compression();
    return TEST_RESULT;
}
