#include <DyNest/Combine.h>
#include <DyNest/DynLog.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <sstream>

using std::vector;

namespace DYN {

// gather rows of a merged point list into a Run, sorted by logl
Run assemble_run(const vector<Col> & logls, const vector<const Mat2D *> & thetas, const vector<Coli> & labels, const Mat2D & thread_min_max) {
    Eigen::Index n = 0;
    for (const Col & l : logls) { n += l.size(); }
    const Eigen::Index ndim = thetas.empty() ? 0 : thetas[0]->cols();

    Col logl(n);
    Mat2D theta(n, ndim);
    Coli thread_labels(n);
    Eigen::Index row = 0;
    for (size_t part = 0; part < logls.size(); ++part) {
        if (thetas[part]->cols() != ndim) {
            std::stringstream err;
            err << "cannot combine runs with " << ndim << " and " << thetas[part]->cols() << " parameters";
            throw RunFormatError(err.str());
        }
        const Eigen::Index m = logls[part].size();
        logl.segment(row, m) = logls[part];
        theta.middleRows(row, m) = *thetas[part];
        thread_labels.segment(row, m) = labels[part];
        row += m;
    }

    const vector<size_t> order = logl_order(logl);
    Run run;
    run.logl.resize(n);
    run.theta.resize(n, ndim);
    run.thread_labels.resize(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        run.logl[i] = logl[order[i]];
        run.theta.row(i) = theta.row(order[i]);
        run.thread_labels[i] = thread_labels[order[i]];
    }
    run.thread_min_max = thread_min_max;
    run.nlive_array = nlive_given_threads(run.logl, run.thread_min_max);
    return run;
}

Run combine_runs(const vector<Run> & runs) {
    vector<Col> logls;
    vector<const Mat2D *> thetas;
    vector<Coli> labels;
    Eigen::Index total_threads = 0;
    for (const Run & r : runs) { total_threads += r.nthreads(); }

    Mat2D thread_min_max(total_threads, 2);
    int offset = 0;
    for (const Run & r : runs) {
        logls.push_back(r.logl);
        thetas.push_back(&r.theta);
        labels.push_back((r.thread_labels.array() + offset).matrix());
        thread_min_max.middleRows(offset, r.nthreads()) = r.thread_min_max;
        // labels are 0 .. nthreads - 1, so this is the run's max label + 1
        offset += r.nthreads();
    }
    return assemble_run(logls, thetas, labels, thread_min_max);
}

Run combine_resumed_dyn_run(const Run & init, const Run & dyn, const size_t resume_ndead, std::ostream & os) {
    const size_t n_init = init.nsamples();
    const size_t n_dyn = dyn.nsamples();
    const size_t r = std::min(resume_ndead, n_init);

    // the points of the dead prefix must match one for one
    bool exact = (resume_ndead <= n_init) and (resume_ndead <= n_dyn);
    for (size_t i = 0; exact and (i < r); ++i) {
        exact = (init.logl[i] == dyn.logl[i]) and (init.thread_labels[i] == dyn.thread_labels[i]);
    }

    // live set at the checkpoint: first point at or after r of each thread
    // already born by then (born at or below the last dead contour)
    const float_type last_dead = (r > 0) ? init.logl[r - 1] : -std::numeric_limits<float_type>::infinity();
    vector<Eigen::Index> live_point(init.nthreads(), -1);
    for (size_t i = r; i < n_init; ++i) {
        const int lab = init.thread_labels[i];
        if ((init.thread_min_max(lab, 0) <= last_dead) and (live_point[lab] < 0)) { live_point[lab] = i; }
    }

    vector<bool> drop(n_init, false);
    for (size_t i = 0; i < r; ++i) { drop[i] = true; }
    vector<bool> claimed(n_dyn, false);
    for (const Eigen::Index ind : live_point) {
        if (ind < 0) { continue; }
        bool found = false;
        for (size_t j = r; j < n_dyn; ++j) {
            if (not claimed[j] and (dyn.logl[j] == init.logl[ind]) and (dyn.thread_labels[j] == init.thread_labels[ind])) {
                claimed[j] = true;
                found = true;
                break;
            }
        }
        if (found) {
            drop[ind] = true;
        } else {
            exact = false;
        }
    }

    if (not exact) {
        std::stringstream msg;
        msg << "points shared by the initial and dynamic runs at the resume point (" << resume_ndead
            << " dead) do not match exactly; the combined run is a best-effort merge.";
        DynLog::warning(msg.str(), os);
    }

    // what is left of each initial thread becomes a new thread
    // labels are 0 .. nthreads - 1, so this is the dynamic run's max label + 1
    const int first_new_label = dyn.nthreads();
    std::map<int, int> new_label; // init label -> combined label
    vector<float_type> new_min;
    vector<float_type> new_max;
    vector<float_type> last_dropped(init.nthreads(), std::numeric_limits<float_type>::quiet_NaN());
    vector<Eigen::Index> kept;
    for (size_t i = 0; i < n_init; ++i) {
        const int lab = init.thread_labels[i];
        if (drop[i]) {
            last_dropped[lab] = init.logl[i];
            continue;
        }
        kept.push_back(i);
        if (new_label.count(lab) == 0) {
            new_label[lab] = first_new_label + new_min.size();
            new_min.push_back(std::isnan(last_dropped[lab]) ? init.thread_min_max(lab, 0) : last_dropped[lab]);
            new_max.push_back(init.thread_min_max(lab, 1));
        }
    }

    Col kept_logl(kept.size());
    Mat2D kept_theta(kept.size(), init.ndim());
    Coli kept_labels(kept.size());
    for (size_t k = 0; k < kept.size(); ++k) {
        kept_logl[k] = init.logl[kept[k]];
        kept_theta.row(k) = init.theta.row(kept[k]);
        kept_labels[k] = new_label[init.thread_labels[kept[k]]];
    }

    Mat2D thread_min_max(first_new_label + new_min.size(), 2);
    thread_min_max.topRows(dyn.nthreads()) = dyn.thread_min_max;
    for (size_t t = 0; t < new_min.size(); ++t) {
        thread_min_max(first_new_label + t, 0) = new_min[t];
        thread_min_max(first_new_label + t, 1) = new_max[t];
    }

    return assemble_run({dyn.logl, kept_logl}, {&dyn.theta, &kept_theta}, {dyn.thread_labels, kept_labels}, thread_min_max);
}

}
