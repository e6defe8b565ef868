#include <DyNest/RunIO.h>

#include <gsl/gsl_statistics_double.h>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

using std::endl;
using std::ifstream;
using std::ofstream;
using std::string;
using std::stringstream;
using std::vector;

namespace DYN {

string output_root(const string & base_dir, const string & file_root) {
    return (std::filesystem::path(base_dir) / file_root).string();
}

Mat2D read_matrix_file(const string & filename) {
    ifstream myfile(filename.c_str());
    if (not myfile.is_open()) {
        throw RunFormatError("could not open " + filename);
    }

    vector<vector<float_type>> M;
    string line;
    while (getline(myfile, line)) {
        stringstream ss(line);
        vector<float_type> row;
        string field;
        while (ss >> field) {
            // std::stod reads "inf", "-inf" and fortran-free exponents alike
            try {
                row.push_back(std::stod(field));
            } catch (const std::exception &) {
                throw RunFormatError("could not read '" + field + "' in " + filename + " as a number");
            }
        }
        if (row.empty()) { continue; }
        if (not M.empty() and (row.size() != M[0].size())) {
            stringstream err;
            err << filename << ": row " << M.size() << " has " << row.size() << " columns, expected " << M[0].size();
            throw RunFormatError(err.str());
        }
        M.push_back(row);
    }

    Mat2D X(M.size(), M.empty() ? 0 : M[0].size());
    for (size_t i = 0; i < M.size(); ++i) {
        for (size_t j = 0; j < M[i].size(); ++j) { X(i, j) = M[i][j]; }
    }
    return X;
}

vector<int> birth_inds_given_contours(const Col & logl_birth, const Col & logl) {
    const float_type * first = logl.data();
    const float_type * last = logl.data() + logl.size();
    vector<int> inds(logl_birth.size());
    for (Eigen::Index i = 0; i < logl_birth.size(); ++i) {
        const float_type birth = logl_birth[i];
        if (birth <= LOGZERO) {
            inds[i] = -1;
            continue;
        }
        const float_type * it = std::lower_bound(first, last, birth);
        if ((it != last) and (*it == birth)) {
            inds[i] = it - first;
        } else {
            inds[i] = (it - first) - 1; // largest logl below the contour, or -1
        }
        if (inds[i] >= i) {
            stringstream err;
            err << "point " << i << " (logl " << logl[i] << ") was born on contour " << birth
                << ", which is not below it";
            throw RunFormatError(err.str());
        }
    }
    return inds;
}

Coli threads_given_birth_inds(const vector<int> & birth_inds) {
    const int n = birth_inds.size();
    // children[p + 1] lists the points born on the death of point p, ascending
    vector<vector<int>> children(n + 1);
    for (int i = 0; i < n; ++i) { children[birth_inds[i] + 1].push_back(i); }

    Coli labels = Coli::Constant(n, -1);
    int thread_num = 0;
    for (int parent = -1; parent < n; ++parent) {
        const vector<int> & kids = children[parent + 1];
        for (size_t k = (parent == -1) ? 0 : 1; k < kids.size(); ++k) {
            int ind = kids[k];
            while (true) {
                if (labels[ind] != -1) {
                    stringstream err;
                    err << "point " << ind << " belongs to two threads";
                    throw RunFormatError(err.str());
                }
                labels[ind] = thread_num;
                if (children[ind + 1].empty()) { break; }
                ind = children[ind + 1][0];
            }
            ++thread_num;
        }
    }
    for (int i = 0; i < n; ++i) {
        if (labels[i] == -1) {
            stringstream err;
            err << "point " << i << " is not connected to any thread";
            throw RunFormatError(err.str());
        }
    }
    return labels;
}

Run process_samples_array(const Mat2D & samples) {
    if (samples.cols() < 2) {
        throw RunFormatError("dead-birth samples need at least logl and logl_birth columns.");
    }
    const Eigen::Index ndim = samples.cols() - 2;
    const Col unsorted_logl = samples.col(ndim);
    const vector<size_t> order = logl_order(unsorted_logl);

    const Eigen::Index n = samples.rows();
    Run run;
    run.logl.resize(n);
    run.theta.resize(n, ndim);
    Col logl_birth(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        run.logl[i] = samples(order[i], ndim);
        run.theta.row(i) = samples.row(order[i]).head(ndim);
        logl_birth[i] = samples(order[i], ndim + 1);
    }

    const vector<int> birth_inds = birth_inds_given_contours(logl_birth, run.logl);
    run.thread_labels = threads_given_birth_inds(birth_inds);

    const int nthreads = (n > 0) ? run.thread_labels.maxCoeff() + 1 : 0;
    run.thread_min_max.resize(nthreads, 2);
    vector<bool> started(nthreads, false);
    for (Eigen::Index i = 0; i < n; ++i) {
        const int lab = run.thread_labels[i];
        if (not started[lab]) {
            started[lab] = true;
            run.thread_min_max(lab, 0) = (birth_inds[i] == -1) ? -std::numeric_limits<float_type>::infinity() : run.logl[birth_inds[i]];
        }
        run.thread_min_max(lab, 1) = run.logl[i];
    }
    run.nlive_array = nlive_given_threads(run.logl, run.thread_min_max);
    return run;
}

RunOutput process_polychord_stats(const string & file_root, const string & base_dir) {
    const string filename = output_root(base_dir, file_root) + ".stats";
    ifstream in(filename.c_str());
    if (not in.is_open()) {
        throw RunFormatError("could not open " + filename);
    }

    RunOutput output;
    output.base_dir = base_dir;
    output.file_root = file_root;
    string line;
    while (getline(in, line)) {
        stringstream ss(line);
        string key;
        ss >> key;
        if (key == "log(Z)") {
            string eq, pm;
            float_type logZ, err;
            if (ss >> eq >> logZ >> pm >> err) {
                output.logZ = logZ;
                output.logZerr = err;
            }
        } else if (key == "ndead:") {
            size_t val;
            if (ss >> val) { output.ndead = val; }
        } else if (key == "nlike:") {
            size_t val;
            if (ss >> val) { output.nlike = val; }
        }
    }
    if (not output.ndead) {
        throw RunFormatError(filename + " has no ndead line.");
    }
    return output;
}

Run process_polychord_run(const string & file_root, const string & base_dir) {
    const string root = output_root(base_dir, file_root);
    Run run = process_samples_array(read_matrix_file(root + "_dead-birth.txt"));
    if (std::filesystem::exists(root + ".stats")) {
        run.output = process_polychord_stats(file_root, base_dir);
    } else {
        run.output.base_dir = base_dir;
        run.output.file_root = file_root;
    }
    check_ns_run(run);
    return run;
}

Mat2D run_dead_birth_array(const Run & run) {
    const Eigen::Index n = run.nsamples();
    const Eigen::Index ndim = run.ndim();
    Mat2D samples(n, ndim + 2);
    vector<Eigen::Index> previous(run.nthreads(), -1);
    for (Eigen::Index i = 0; i < n; ++i) {
        const int lab = run.thread_labels[i];
        samples.row(i).head(ndim) = run.theta.row(i);
        samples(i, ndim) = run.logl[i];
        float_type birth = (previous[lab] < 0) ? run.thread_min_max(lab, 0) : run.logl[previous[lab]];
        if (std::isinf(birth) and (birth < 0)) { birth = LOGZERO; }
        samples(i, ndim + 1) = birth;
        previous[lab] = i;
    }
    return samples;
}

// non-exported helper: log evidence error from the information H
float_type log_evidence_error(const Run & run, const Col & logw, const float_type logZ) {
    if (run.nsamples() == 0) { return 0.0; }
    const Col p = (logw.array() - logZ).exp().matrix();
    float_type H = 0.0;
    for (Eigen::Index i = 0; i < p.size(); ++i) {
        if (p[i] > 0) { H += p[i] * (run.logl[i] - logZ); }
    }
    const float_type mean_nlive = run.nlive_array.mean();
    return ((H > 0) and (mean_nlive > 0)) ? std::sqrt(H / mean_nlive) : 0.0;
}

void write_run_output(
    const Run & run,
    const bool write_dead,
    const bool write_stats,
    const bool posteriors,
    const bool stats_means_errs
) {
    const string root = output_root(run.output.base_dir, run.output.file_root);
    if (not run.output.base_dir.empty()) {
        std::filesystem::create_directories(run.output.base_dir);
    }

    if (write_dead) {
        const Mat2D samples = run_dead_birth_array(run);
        ofstream out((root + "_dead-birth.txt").c_str());
        if (not out.is_open()) { throw RunFormatError("could not write " + root + "_dead-birth.txt"); }
        out << std::scientific << std::setprecision(17);
        for (Eigen::Index i = 0; i < samples.rows(); ++i) {
            for (Eigen::Index j = 0; j < samples.cols(); ++j) { out << (j == 0 ? "" : " ") << samples(i, j); }
            out << endl;
        }
    }

    const Col logw = get_logw(run);
    const Col w_rel = (logw.size() > 0) ? Col((logw.array() - logw.maxCoeff()).exp().matrix()) : Col();

    if (write_stats) {
        const float_type logZ = logsumexp(logw);
        ofstream out((root + ".stats").c_str());
        if (not out.is_open()) { throw RunFormatError("could not write " + root + ".stats"); }
        out << "Evidence estimates:" << endl;
        out << "===================" << endl;
        out << "  - The evidence Z is a log-normally distributed, with location and scale parameters mu and sigma." << endl;
        out << "  - We denote this as log(Z) = mu +/- sigma." << endl;
        out << endl;
        out << "Global evidence:" << endl;
        out << "----------------" << endl;
        out << endl;
        out << std::scientific << std::setprecision(5);
        out << "log(Z)       = " << std::setw(13) << logZ << " +/- " << std::setw(12) << log_evidence_error(run, logw, logZ) << endl;
        out << endl;
        out << "Run-time information:" << endl;
        out << "---------------------" << endl;
        out << endl;
        out << " ndead: " << std::setw(12) << run.nsamples() << endl;
        if (run.output.nlike) { out << " nlike: " << std::setw(12) << *run.output.nlike << endl; }
        out << endl;

        if (stats_means_errs and (run.nsamples() > 1)) {
            out << "Dim No.       Mean        Sigma" << endl;
            for (size_t d = 0; d < run.ndim(); ++d) {
                const Col param = run.theta.col(d);
                const float_type mean = gsl_stats_wmean(w_rel.data(), 1, param.data(), 1, param.size());
                const float_type sd = gsl_stats_wsd_m(w_rel.data(), 1, param.data(), 1, param.size(), mean);
                out << std::setw(4) << (d + 1) << "  " << std::setw(12) << mean << " +/- " << std::setw(12) << sd << endl;
            }
        }
    }

    if (posteriors) {
        ofstream out((root + ".txt").c_str());
        if (not out.is_open()) { throw RunFormatError("could not write " + root + ".txt"); }
        out << std::scientific << std::setprecision(17);
        for (Eigen::Index i = 0; i < w_rel.size(); ++i) {
            out << w_rel[i] << " " << -2.0 * run.logl[i];
            for (size_t d = 0; d < run.ndim(); ++d) { out << " " << run.theta(i, d); }
            out << endl;
        }
    }
}

}
