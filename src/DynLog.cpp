#include <DyNest/DynLog.h>
#include <DyNest/Allocation.h>

#include <algorithm>
#include <iomanip>

using std::endl;
using std::setw;

namespace DYN {

void DynLog::warning(const std::string & msg, std::ostream & os) {
    os << "WARNING: " << msg << endl;
}

void DynLog::step_banner(const std::string & step, const std::string & detail, std::ostream & os) {
    os << double_bar << endl << step;
    if (not detail.empty()) { os << ": " << detail; }
    os << endl;
}

void DynLog::run_summary(const std::string & label, const Run & run, std::ostream & os) {
    os << "  " << label << ": " << run.nsamples() << " samples, " << run.nthreads() << " threads, "
       << run.ndim() << " dimensions";
    if (run.nsamples() > 0) {
        os << ", logl in [" << run.logl[0] << ", " << run.logl[run.nsamples() - 1] << "]"
           << ", log(Z) ~ " << log_evidence(run);
    }
    os << endl;
}

void DynLog::allocation_report(
    const Run & init_run,
    const AllocationInfo & info,
    const size_t max_rows,
    std::ostream & os
) {
    const size_t n = init_run.nsamples();
    os << double_bar << endl;
    os << "Allocation: " << info.samp_tot << " samples in total, " << n << " in the initial run; peak starts at point "
       << info.peak_start_ind << endl;
    os << setw(WIDTH) << "index" << setw(WIDTH) << "logl" << setw(WIDTH) << "importance"
       << setw(WIDTH) << "nlive_init" << setw(WIDTH) << "unsmoothed" << setw(WIDTH) << "nlive" << endl;
    const size_t stride = std::max<size_t>(1, (n + max_rows - 1) / std::max<size_t>(1, max_rows));
    for (size_t i = 0; i < n; i += stride) {
        os << setw(WIDTH) << i << setw(WIDTH) << init_run.logl[i] << setw(WIDTH) << info.importance[i]
           << setw(WIDTH) << init_run.nlive_array[i] << setw(WIDTH) << info.nlive_allocation_unsmoothed[i]
           << setw(WIDTH) << info.nlive_allocation[i] << endl;
    }
    os << "  sampler profile: start with " << info.profile.initial_nlive << " live points, "
       << info.profile.steps.size() << " changes" << endl;
}

}
