#include <DyNest/NestedRun.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <sstream>

using std::stringstream;
using std::vector;

namespace DYN {

Col get_logx(const Col & nlive) {
    if ((nlive.size() > 0) and (nlive.minCoeff() <= 0)) {
        throw std::invalid_argument("get_logx: nlive must be positive at every point.");
    }
    Col logx(nlive.size());
    float_type acc = 0.0;
    for (Eigen::Index i = 0; i < nlive.size(); ++i) {
        acc -= 1.0 / nlive[i];
        logx[i] = acc;
    }
    return logx;
}

Col get_logw(const Run & run) {
    const Col logx = get_logx(run.nlive_array);
    const Eigen::Index n = logx.size();
    Col logw(n);
    // X_{-1} = 1 and X_{n} = 0
    for (Eigen::Index i = 0; i < n; ++i) {
        const float_type x_prev = (i == 0) ? 1.0 : std::exp(logx[i - 1]);
        const float_type x_next = (i == n - 1) ? 0.0 : std::exp(logx[i + 1]);
        logw[i] = run.logl[i] + std::log(0.5 * (x_prev - x_next));
    }
    return logw;
}

Col get_w_rel(const Run & run) {
    const Col logw = get_logw(run);
    if (logw.size() == 0) { return logw; }
    return (logw.array() - logw.maxCoeff()).exp().matrix();
}

float_type logsumexp(const Col & vals) {
    if (vals.size() == 0) { return -std::numeric_limits<float_type>::infinity(); }
    const float_type mx = vals.maxCoeff();
    if (not std::isfinite(mx)) { return mx; }
    return mx + std::log((vals.array() - mx).exp().sum());
}

float_type log_evidence(const Run & run) {
    return logsumexp(get_logw(run));
}

Col nlive_given_threads(const Col & logl, const Mat2D & thread_min_max) {
    // logl is ascending, so each thread is live over one contiguous block of points
    const Eigen::Index n = logl.size();
    vector<int> delta(n + 1, 0);
    const float_type * first = logl.data();
    const float_type * last = logl.data() + n;
    for (Eigen::Index t = 0; t < thread_min_max.rows(); ++t) {
        const Eigen::Index start = std::upper_bound(first, last, thread_min_max(t, 0)) - first;
        const Eigen::Index end = std::upper_bound(first, last, thread_min_max(t, 1)) - first;
        if (start < end) {
            delta[start] += 1;
            delta[end] -= 1;
        }
    }
    Col nlive(n);
    int acc = 0;
    for (Eigen::Index i = 0; i < n; ++i) {
        acc += delta[i];
        nlive[i] = acc;
    }
    return nlive;
}

std::vector<size_t> logl_order(const Col & logl) {
    vector<size_t> order(logl.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&logl](const size_t a, const size_t b) { return logl[a] < logl[b]; });
    return order;
}

void check_ns_run(const Run & run) {
    const Eigen::Index n = run.logl.size();
    stringstream err;
    if ((run.thread_labels.size() != n) or (run.nlive_array.size() != n) or (run.theta.rows() != n)) {
        err << "run columns have inconsistent lengths: logl " << n << ", thread_labels " << run.thread_labels.size()
            << ", nlive_array " << run.nlive_array.size() << ", theta rows " << run.theta.rows();
        throw RunFormatError(err.str());
    }
    if (run.thread_min_max.cols() != 2) { throw RunFormatError("thread_min_max must have two columns."); }

    for (Eigen::Index i = 1; i < n; ++i) {
        if (run.logl[i] < run.logl[i - 1]) {
            err << "logl decreases at index " << i << " (" << run.logl[i - 1] << " -> " << run.logl[i] << ")";
            throw RunFormatError(err.str());
        }
    }

    const Eigen::Index nthread = run.thread_min_max.rows();
    vector<Eigen::Index> last_point(nthread, -1);
    for (Eigen::Index i = 0; i < n; ++i) {
        const int lab = run.thread_labels[i];
        if ((lab < 0) or (lab >= nthread)) {
            err << "thread label " << lab << " at index " << i << " outside [0, " << nthread << ")";
            throw RunFormatError(err.str());
        }
        last_point[lab] = i;
    }
    for (Eigen::Index t = 0; t < nthread; ++t) {
        if (last_point[t] < 0) {
            err << "thread " << t << " has no points";
            throw RunFormatError(err.str());
        }
        if (run.thread_min_max(t, 1) != run.logl[last_point[t]]) {
            err << "thread " << t << " max logl " << run.thread_min_max(t, 1) << " != logl of its last point " << run.logl[last_point[t]];
            throw RunFormatError(err.str());
        }
    }

    const Col expected = nlive_given_threads(run.logl, run.thread_min_max);
    for (Eigen::Index i = 0; i < n; ++i) {
        if (expected[i] != run.nlive_array[i]) {
            err << "nlive_array[" << i << "] = " << run.nlive_array[i] << " but " << expected[i] << " threads are live there";
            throw RunFormatError(err.str());
        }
    }
}

}
