#include <DyNest/DyNest.h>
#include <DyNest/Combine.h>
#include <DyNest/DynLog.h>
#include <DyNest/RunIO.h>

#include <algorithm>
#include <exception>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;
using std::endl;
using std::string;
using std::vector;

namespace DYN {

std::ostream& operator<<(std::ostream &os, const STEP &step) {
    switch (step) {
        case VALIDATE: os << "VALIDATE"; break;
        case INITIAL_RUN: os << "INITIAL_RUN"; break;
        case ALLOCATE: os << "ALLOCATE"; break;
        case DYNAMIC_RUN: os << "DYNAMIC_RUN"; break;
        case COMBINE: os << "COMBINE"; break;
        case PERSIST: os << "PERSIST"; break;
        case DONE: os << "DONE"; break;
        default: os << "UNDEFINED DYN::STEP";
    }
    return os;
}

RunOptions RunOptions::from_json(const Json::Value & obj) {
    check_keys(obj, KEYS, "options");
    RunOptions opts;
    if (obj.isNull()) { return opts; }
    opts.ninit = obj.get("ninit", Json::UInt64(opts.ninit)).asUInt64();
    if (obj.isMember("init_step")) { opts.init_step = obj["init_step"].asUInt64(); }
    if (obj.isMember("nlive_const")) { opts.nlive_const = obj["nlive_const"].asUInt64(); }
    opts.seed_increment = obj.get("seed_increment", opts.seed_increment).asInt();
    if (obj.isMember("smoothing_sigma") and not obj["smoothing_sigma"].isNull()) {
        opts.smoothing_sigma = obj["smoothing_sigma"].asDouble();
    }
    opts.stats_means_errs = obj.get("stats_means_errs", opts.stats_means_errs).asBool();
    opts.resume_dyn_run = obj.get("resume_dyn_run", opts.resume_dyn_run).asBool();
    opts.tuned_dynamic_p = obj.get("tuned_dynamic_p", opts.tuned_dynamic_p).asBool();
    opts.verbose = obj.get("verbose", Json::UInt64(opts.verbose)).asUInt64();
    return opts;
}

std::optional<size_t> select_resume_step(const vector<size_t> & step_ndead, const size_t peak_start_ind) {
    std::optional<size_t> chosen;
    for (const size_t ndead : step_ndead) {
        if ((ndead <= peak_start_ind) and (not chosen or (ndead > *chosen))) { chosen = ndead; }
    }
    return chosen;
}

DynamicNS::DynamicNS(
    const SamplerFun & sampler,
    const std::optional<float_type> dynamic_goal,
    const Json::Value & settings_json,
    const RunOptions & options,
    const Communicator * comm,
    std::ostream & os
) : _sampler(sampler), _dynamic_goal(dynamic_goal), _options(options),
    _comm(comm ? comm : &_serial), _os(os), _step(VALIDATE), _init_step(0), _nlive_const(0) {
    validate(settings_json);
}

string DynamicNS::root() const {
    return output_root(_settings.base_dir, _settings.file_root);
}

bool DynamicNS::resume_mode() const {
    return _dynamic_goal and (*_dynamic_goal > 0) and _options.resume_dyn_run;
}

string DynamicNS::step_resume_file(const size_t ndead) const {
    return root() + "_init_" + std::to_string(ndead) + ".resume";
}

void DynamicNS::advance(const STEP next, const string & detail) {
    _step = next;
    if (_options.verbose > 0 and primary()) {
        std::stringstream label;
        label << _step;
        DynLog::step_banner(label.str(), detail, _os);
    }
}

void DynamicNS::validate(const Json::Value & settings_json) {
    _settings = check_settings(settings_json, _os);

    if (_dynamic_goal and not ((0 <= *_dynamic_goal) and (*_dynamic_goal <= 1))) {
        std::stringstream err;
        err << "dynamic_goal must be in [0, 1]; got " << *_dynamic_goal;
        throw std::invalid_argument(err.str());
    }
    if (_options.ninit == 0) { throw std::invalid_argument("ninit must be positive."); }
    _init_step = _options.init_step.value_or(_options.ninit);
    if (_init_step == 0) { throw std::invalid_argument("init_step must be positive."); }
    if (_options.nlive_const) {
        _nlive_const = *_options.nlive_const;
    } else if (_settings.nlive > 0) {
        _nlive_const = _settings.nlive;
    }
    if (_nlive_const == 0) { throw std::invalid_argument("nlive_const must be positive."); }
    if (_options.smoothing_sigma and not _options.smoothing_filter) {
        _options.smoothing_filter = gaussian_smoothing(*_options.smoothing_sigma);
    }

    if ((_comm->size() > 1) and (_settings.seed >= 0)) {
        DynLog::warning("seeded runs are not reproducible when the sampler is spread over more than one process.", _os);
    }
    _result.primary = primary();
}

DynResult DynamicNS::run() {
    if (_step != VALIDATE) {
        std::stringstream err;
        err << "DynamicNS::run called twice (now at step " << _step << ")";
        throw std::logic_error(err.str());
    }
    advance(INITIAL_RUN, _dynamic_goal ? "" : "standard nested sampling");
    initial_run();
    if (not _dynamic_goal) {
        advance(DONE);
        return _result;
    }
    advance(ALLOCATE);
    allocate_live_points();
    advance(DYNAMIC_RUN);
    dynamic_run();
    advance(COMBINE);
    combine();
    advance(PERSIST);
    persist();
    advance(DONE);
    return _result;
}

void DynamicNS::remove_step_resumes() const {
    std::error_code ec;
    for (const size_t ndead : _step_ndead) { fs::remove(step_resume_file(ndead), ec); }
}

static Json::Value error_payload(const string & type, const string & what) {
    Json::Value error;
    error["type"] = type;
    error["what"] = what;
    return error;
}

void DynamicNS::share_from_primary(Json::Value & payload, const std::function<void(Json::Value &)> & work) const {
    std::exception_ptr failure;
    if (primary()) {
        Json::Value error;
        try {
            work(payload);
        } catch (const AllocationError & e) {
            failure = std::current_exception();
            error = error_payload("AllocationError", e.what());
        } catch (const SamplerError & e) {
            failure = std::current_exception();
            error = error_payload("SamplerError", e.what());
        } catch (const RunFormatError & e) {
            failure = std::current_exception();
            error = error_payload("RunFormatError", e.what());
        } catch (const std::exception & e) {
            failure = std::current_exception();
            error = error_payload("runtime_error", e.what());
        }
        if (failure) {
            payload = Json::Value();
            payload["error"] = error;
        }
    }
    _comm->bcast(payload);

    if (failure) { std::rethrow_exception(failure); }
    if (payload.isObject() and payload.isMember("error")) {
        const string type = payload["error"]["type"].asString();
        const string what = "primary process failed: " + payload["error"]["what"].asString();
        if (type == "AllocationError") { throw AllocationError(what); }
        if (type == "SamplerError") { throw SamplerError(what); }
        if (type == "RunFormatError") { throw RunFormatError(what); }
        throw std::runtime_error(what);
    }
}

void DynamicNS::run_and_save_resumes(Settings init_settings) {
    init_settings.write_resume = true;
    const string init_root = output_root(init_settings.base_dir, init_settings.file_root);
    const int user_max_ndead = _settings.max_ndead;
    bool add_points = true;
    size_t nsteps = 0;
    while (add_points) {
        if (nsteps == 1) { init_settings.read_resume = true; }
        int max_ndead = static_cast<int>((nsteps + 1) * _init_step);
        if (user_max_ndead > 0) { max_ndead = std::min(max_ndead, user_max_ndead); }
        init_settings.max_ndead = max_ndead;
        _sampler(init_settings, _comm);
        ++nsteps;

        Json::Value flag;
        share_from_primary(flag, [&](Json::Value & out) {
            try {
                const RunOutput output = process_polychord_stats(init_settings.file_root, init_settings.base_dir);
                const size_t ndead = *output.ndead;
                // PolyChord's ndead includes the final live points
                const size_t step = (ndead > static_cast<size_t>(init_settings.nlive)) ? ndead - init_settings.nlive : 0;
                const bool stalled = (not _step_ndead.empty()) and (step <= _step_ndead.back());
                _step_ndead.push_back(step);

                if (not fs::exists(init_root + ".resume")) {
                    throw SamplerError("sampler did not write " + init_root + ".resume; it is needed to resume the dynamic run.");
                }
                fs::copy_file(init_root + ".resume", step_resume_file(step), fs::copy_options::overwrite_existing);

                bool more = true;
                if (stalled or ((user_max_ndead > 0) and (step >= static_cast<size_t>(user_max_ndead)))) { more = false; }
                if (_options.verbose > 0) { _os << "  checkpoint after " << step << " dead points" << endl; }
                out["add_points"] = more;
            } catch (const std::exception &) {
                remove_step_resumes();
                throw;
            }
        });
        add_points = flag["add_points"].asBool();
    }
}

void DynamicNS::initial_run() {
    Settings init_settings = _settings;
    init_settings.nlives.clear();
    if (not _dynamic_goal) {
        init_settings.nlive = _nlive_const;
        _sampler(init_settings, _comm);
        return;
    }

    init_settings.nlive = _options.ninit;
    init_settings.file_root = _settings.file_root + "_init";
    if (resume_mode()) {
        run_and_save_resumes(init_settings);
    } else {
        _sampler(init_settings, _comm);
    }
}

void DynamicNS::allocate_live_points() {
    Json::Value payload;
    share_from_primary(payload, [&](Json::Value & out) {
        try {
            _init_run = process_polychord_run(_settings.file_root + "_init", _settings.base_dir);
            if (_options.verbose > 0) { DynLog::run_summary("initial run", *_init_run, _os); }

            const size_t samp_tot = _init_run->nsamples() * _nlive_const / _options.ninit;
            AllocationInfo info = allocate(
                *_init_run, samp_tot, *_dynamic_goal, _options.smoothing_filter, _os, _options.tuned_dynamic_p
            );
            if (_options.verbose > 0) { DynLog::allocation_report(*_init_run, info, 20, _os); }

            Settings dyn = _settings;
            dyn.file_root = _settings.file_root + "_dyn";
            dyn.read_resume = false;
            if (dyn.seed >= 0) { dyn.seed += _options.seed_increment; }

            std::optional<size_t> resume_step;
            if (resume_mode()) { resume_step = select_resume_step(_step_ndead, info.peak_start_ind); }
            if (resume_step) {
                fs::copy_file(step_resume_file(*resume_step), root() + "_dyn.resume", fs::copy_options::overwrite_existing);
                dyn.read_resume = true;
                // the checkpoint carries the initial run's population
                dyn.nlive = _options.ninit;
                dyn.nlives = info.profile.steps;
                _result.resume_ndead = *resume_step;
                if (_options.verbose > 0) { _os << "  resuming from the checkpoint after " << *resume_step << " dead points" << endl; }
            } else {
                // a fresh run is combined with the initial run, so it only adds to it
                const AllocationProfile added = added_live_profile(*_init_run, info.nlive_allocation);
                dyn.nlive = added.initial_nlive;
                dyn.nlives = added.steps;
            }
            remove_step_resumes();
            _result.allocation = info;
            out = dyn.to_json();
        } catch (const std::exception &) {
            remove_step_resumes();
            throw;
        }
    });
    _dyn_settings = Settings::from_json(payload);
}

void DynamicNS::dynamic_run() {
    _sampler(_dyn_settings, _comm);
}

void DynamicNS::combine() {
    if (not primary()) { return; }
    const Run dyn_run = process_polychord_run(_dyn_settings.file_root, _dyn_settings.base_dir);
    if (_options.verbose > 0) { DynLog::run_summary("dynamic run", dyn_run, _os); }

    Run combined = _result.resume_ndead
        ? combine_resumed_dyn_run(*_init_run, dyn_run, *_result.resume_ndead, _os)
        : combine_runs({ *_init_run, dyn_run });
    combined.output.base_dir = _settings.base_dir;
    combined.output.file_root = _settings.file_root;
    if (_init_run->output.nlike and dyn_run.output.nlike) {
        combined.output.nlike = *_init_run->output.nlike + *dyn_run.output.nlike;
    }
    combined.output.ndead = combined.nsamples();
    if (_options.verbose > 0) { DynLog::run_summary("combined run", combined, _os); }
    _result.run = combined;
}

void DynamicNS::persist() {
    if (not primary()) { return; }
    write_run_output(*_result.run, true, _settings.write_stats, _settings.posteriors, _options.stats_means_errs);
}

DynResult run_dynamic_ns(
    const SamplerFun & sampler,
    const std::optional<float_type> dynamic_goal,
    const Json::Value & settings_json,
    const Json::Value & options_json,
    const Communicator * comm,
    std::ostream & os
) {
    DynamicNS dns(sampler, dynamic_goal, settings_json, RunOptions::from_json(options_json), comm, os);
    return dns.run();
}

}
