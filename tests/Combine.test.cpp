#include <DyNest/Combine.h>

#include "testing.h"
#include "dummy_sampler.h"

using namespace DYN;
using namespace std;

const float_type NEG_INF = -std::numeric_limits<float_type>::infinity();

Run make_run(const vector<float_type> & logl, const vector<int> & labels) {
    const size_t n = logl.size();
    Run run;
    run.logl.resize(n);
    run.theta.resize(n, 1);
    run.thread_labels.resize(n);
    int nthread = 0;
    for (size_t i = 0; i < n; ++i) {
        run.logl[i] = logl[i];
        run.theta(i, 0) = 10 * logl[i];
        run.thread_labels[i] = labels[i];
        nthread = std::max(nthread, labels[i] + 1);
    }
    run.thread_min_max.resize(nthread, 2);
    for (int t = 0; t < nthread; ++t) {
        run.thread_min_max(t, 0) = NEG_INF;
        run.thread_min_max(t, 1) = NEG_INF;
    }
    for (size_t i = 0; i < n; ++i) {
        run.thread_min_max(labels[i], 1) = std::max(run.thread_min_max(labels[i], 1), logl[i]);
    }
    run.nlive_array = nlive_given_threads(run.logl, run.thread_min_max);
    return run;
}

void test_resumed_exact() {
    const Run init = make_run({0, 1, 2, 3}, {0, 1, 0, 1});
    const Run dyn = make_run({0, 1, 2, 4, 5, 6}, {0, 1, 0, 1, 0, 1});
    ostringstream log;
    const Run combined = combine_resumed_dyn_run(init, dyn, 1, log);

    IS_TRUE(count_warnings(log.str()) == 0);
    Col logl(7);
    logl << 0, 1, 2, 3, 4, 5, 6;
    Coli labels(7);
    labels << 0, 1, 0, 2, 1, 0, 1;
    Col nlive(7);
    nlive << 2, 2, 3, 3, 2, 2, 1;
    IS_TRUE(combined.logl == logl);
    IS_TRUE(combined.thread_labels == labels);
    IS_TRUE(combined.nlive_array == nlive);
    // the theta rows follow their points
    IS_TRUE(combined.theta(3, 0) == 30);
    // the init continuation is born where its shared part ended
    IS_TRUE(combined.nthreads() == 3);
    IS_TRUE(combined.thread_min_max(2, 0) == 1);
    IS_TRUE(combined.thread_min_max(2, 1) == 3);
    check_ns_run(combined);
}

void test_resumed_mismatch() {
    const Run init = make_run({0, 1, 2, 3}, {0, 1, 0, 1});
    const Run dyn = make_run({0, 1, 2, 4, 5, 6}, {0, 1, 0, 1, 0, 1});
    ostringstream log;
    const Run combined = combine_resumed_dyn_run(init, dyn, 2, log);
    IS_TRUE(count_warnings(log.str()) == 1);
    IS_TRUE(combined.nsamples() >= dyn.nsamples());
    IS_TRUE(combined.logl.size() == combined.thread_labels.size());
    for (Eigen::Index i = 1; i < combined.logl.size(); ++i) { IS_TRUE(combined.logl[i] >= combined.logl[i - 1]); }
}

void test_resumed_thread_born_later() {
    // thread 2 is born when point 2 dies, after the checkpoint; it is not part
    // of the live set the dynamic run resumed with
    Run init = make_run({0, 1, 2, 3, 4}, {0, 1, 0, 1, 2});
    init.thread_min_max(2, 0) = 2;
    init.nlive_array = nlive_given_threads(init.logl, init.thread_min_max);
    const Run dyn = make_run({0, 1, 2, 5, 6}, {0, 1, 0, 1, 0});
    ostringstream log;
    const Run combined = combine_resumed_dyn_run(init, dyn, 1, log);

    IS_TRUE(count_warnings(log.str()) == 0);
    Coli labels(7);
    labels << 0, 1, 0, 2, 3, 1, 0;
    IS_TRUE(combined.thread_labels == labels);
    IS_TRUE(combined.nthreads() == 4);
    IS_TRUE(combined.thread_min_max(3, 0) == 2);
    check_ns_run(combined);
}

void test_resumed_identical_runs() {
    // a dynamic run that resumed and changed nothing duplicates the initial run
    const Run init = dummy_run(3, 5, 2, 11, 1.0);
    ostringstream log;
    const Run combined = combine_resumed_dyn_run(init, init, 6, log);
    IS_TRUE(count_warnings(log.str()) == 0);

    // threads still alive at the checkpoint each leave a continuation
    size_t alive = 0;
    for (size_t t = 0; t < init.nthreads(); ++t) {
        for (Eigen::Index i = 6; i < init.logl.size(); ++i) {
            if (init.thread_labels[i] == static_cast<int>(t)) { ++alive; break; }
        }
    }
    IS_TRUE(combined.nsamples() == 2 * init.nsamples() - 6 - alive);
    IS_TRUE(combined.nthreads() == init.nthreads() + alive);
    IS_TRUE(combined.nlive_array.head(6) == init.nlive_array.head(6));
    check_ns_run(combined);
}

void test_independent_runs() {
    const Run a = dummy_run(2, 6, 3, 1, 1.0);
    const Run b = dummy_run(3, 4, 3, 2, 1.0);
    const Run combined = combine_runs({a, b});
    IS_TRUE(combined.nsamples() == a.nsamples() + b.nsamples());
    IS_TRUE(combined.nthreads() == 5);
    IS_TRUE(combined.thread_labels.minCoeff() == 0);
    IS_TRUE(combined.thread_labels.maxCoeff() == 4);
    // every thread is alive at the start
    IS_TRUE(combined.nlive_array[0] == 5);
    check_ns_run(combined);

    const Run other_dim = dummy_run(2, 6, 2, 3, 1.0);
    THROWS(combine_runs({a, other_dim}), RunFormatError);
}

int main() {
    test_resumed_exact();
    test_resumed_mismatch();
    test_resumed_thread_born_later();
    test_resumed_identical_runs();
    test_independent_runs();
    return TEST_RESULT;
}
