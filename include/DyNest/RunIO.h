#ifndef DYNEST_RUNIO_H
#define DYNEST_RUNIO_H

#include <string>
#include <vector>

#include <DyNest/NestedRun.h>

namespace DYN {

// <base_dir>/<file_root>
std::string output_root(const std::string & base_dir, const std::string & file_root);

// whitespace separated numeric table; throws RunFormatError if missing or ragged
Mat2D read_matrix_file(const std::string & filename);

// For each point (ascending logl), the index of the point whose death set
// its birth contour, or -1 if it was sampled from the whole prior.
// Contours not found exactly are attributed to the nearest lower point.
std::vector<int> birth_inds_given_contours(const Col & logl_birth, const Col & logl);

// Thread label of each point, given birth indexes. Every point born on the
// prior starts a thread; otherwise the first point born on a contour carries
// on the dying point's thread and any later ones start new threads.
Coli threads_given_birth_inds(const std::vector<int> & birth_inds);

// Build a run from dead-birth rows [theta_1 .. theta_d, logl, logl_birth],
// in any order.
Run process_samples_array(const Mat2D & samples);

// read <root>_dead-birth.txt (and <root>.stats when present) and check the result
Run process_polychord_run(const std::string & file_root, const std::string & base_dir);

// log(Z) and its error, ndead and nlike from <root>.stats
RunOutput process_polychord_stats(const std::string & file_root, const std::string & base_dir);

// dead-birth rows for `run`, sorted by logl; births on the prior are written as LOGZERO
Mat2D run_dead_birth_array(const Run & run);

// Write run.output's <root>_dead-birth.txt, and optionally <root>.stats and
// the posterior table <root>.txt (rows [w / max w, -2 logl, theta]).
void write_run_output(
    const Run & run,
    const bool write_dead = true,
    const bool write_stats = true,
    const bool posteriors = false,
    const bool stats_means_errs = true
);

}

#endif // DYNEST_RUNIO_H
