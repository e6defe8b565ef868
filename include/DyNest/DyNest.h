#ifndef DYNEST_DYNEST_H
#define DYNEST_DYNEST_H

#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

#include <DyNest/Allocation.h>
#include <DyNest/Comm.h>
#include <DyNest/NestedRun.h>
#include <DyNest/Sampler.h>
#include <DyNest/Settings.h>

namespace DYN {

// Steps of a dynamic nested sampling run, performed in this order and never
// revisited. Standard nested sampling (no dynamic goal) stops after INITIAL_RUN.
// VALIDATE: check settings and options, before any file is touched
// INITIAL_RUN: a cheap run with few live points, checkpointed in steps when the dynamic run may resume from it
// ALLOCATE: decide the live point profile of the dynamic run, and where it resumes from
// DYNAMIC_RUN: the steered run
// COMBINE: merge the initial and dynamic runs
// PERSIST: write the combined run
enum STEP { VALIDATE, INITIAL_RUN, ALLOCATE, DYNAMIC_RUN, COMBINE, PERSIST, DONE };

std::ostream& operator<<(std::ostream &os, const STEP &step);

// Orchestration options.
// @var ninit live points in the initial run
// @var init_step dead points between initial run checkpoints; defaults to ninit
// @var nlive_const the constant population whose sample count the combined run matches; defaults to settings.nlive
// @var seed_increment added to a non-negative seed for the dynamic run, so it does not repeat the initial run
// @var smoothing_sigma Gaussian smoothing of the allocation, in points; unset = none
// @var smoothing_filter any other smoothing; takes precedence over smoothing_sigma (not settable from JSON)
// @var stats_means_errs write parameter means and sigmas to the combined .stats file
// @var resume_dyn_run resume the dynamic run from an initial run checkpoint (dynamic_goal > 0 only)
// @var tuned_dynamic_p see sample_importance
// @var verbose 0 = warnings only
struct RunOptions {
    size_t ninit = 10;
    std::optional<size_t> init_step;
    std::optional<size_t> nlive_const;
    int seed_increment = 100;
    std::optional<float_type> smoothing_sigma;
    SmoothingFilter smoothing_filter = nullptr;
    bool stats_means_errs = true;
    bool resume_dyn_run = true;
    bool tuned_dynamic_p = false;
    size_t verbose = 0;

    inline static const std::vector<std::string> KEYS = {
        "ninit", "init_step", "nlive_const", "seed_increment", "smoothing_sigma",
        "stats_means_errs", "resume_dyn_run", "tuned_dynamic_p", "verbose"
    };

    // throws UnrecognizedKeyError
    static RunOptions from_json(const Json::Value & obj);
};

// What a run produced. Only the primary process holds the combined run and
// allocation; `resume_ndead` is set when the dynamic run resumed from the
// initial run.
struct DynResult {
    bool primary = true;
    std::optional<Run> run;
    std::optional<AllocationInfo> allocation;
    std::optional<size_t> resume_ndead;
};

// Latest checkpoint the dynamic run can resume from without skipping the
// part of the run it is meant to add live points to: the largest recorded
// dead point count <= peak_start_ind.
std::optional<size_t> select_resume_step(const std::vector<size_t> & step_ndead, const size_t peak_start_ind);

// Dynamic nested sampling: an initial run, an allocation of live points
// computed from it, a dynamic run with that allocation and the combination of
// both, written under settings base_dir / file_root. Intermediate runs use the
// same root with _init and _dyn suffixes.
//
// Construction performs VALIDATE; run() performs the remaining steps.
// Every process of `comm` (default: this process alone) must construct and
// run() with matching arguments.
class DynamicNS {
    public:
        DynamicNS(
            const SamplerFun & sampler,
            const std::optional<float_type> dynamic_goal,
            const Json::Value & settings_json,
            const RunOptions & options = RunOptions(),
            const Communicator * comm = nullptr,
            std::ostream & os = std::cerr
        );
        DynamicNS(const DynamicNS &) = delete;
        DynamicNS & operator=(const DynamicNS &) = delete;

        DynResult run();

        STEP step() const { return _step; }
        const Settings & settings() const { return _settings; }
        bool primary() const { return _comm->rank() == 0; }
        std::string root() const;

    private:
        void validate(const Json::Value & settings_json);
        void initial_run();
        void allocate_live_points();
        void dynamic_run();
        void combine();
        void persist();
        void advance(const STEP next, const std::string & detail = "");

        // initial run in init_step chunks, keeping each chunk's resume file;
        // fills _step_ndead on the primary
        void run_and_save_resumes(Settings init_settings);
        bool resume_mode() const;
        std::string step_resume_file(const size_t ndead) const;
        void remove_step_resumes() const;

        // Runs `work` on the primary and broadcasts what it leaves in
        // `payload`. If `work` throws, the error is broadcast instead and
        // every rank throws it, so no rank is left waiting on the primary.
        void share_from_primary(Json::Value & payload, const std::function<void(Json::Value &)> & work) const;

        const SamplerFun & _sampler;
        const std::optional<float_type> _dynamic_goal;
        RunOptions _options;
        SerialComm _serial;
        const Communicator * _comm;
        std::ostream & _os;

        STEP _step;
        Settings _settings;
        size_t _init_step;
        size_t _nlive_const;

        std::vector<size_t> _step_ndead;
        Settings _dyn_settings;
        DynResult _result;
        std::optional<Run> _init_run;
};

// run a DynamicNS with options given as JSON
DynResult run_dynamic_ns(
    const SamplerFun & sampler,
    const std::optional<float_type> dynamic_goal,
    const Json::Value & settings_json,
    const Json::Value & options_json = Json::Value(),
    const Communicator * comm = nullptr,
    std::ostream & os = std::cerr
);

}

#endif // DYNEST_DYNEST_H
