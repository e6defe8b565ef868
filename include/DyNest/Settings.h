#ifndef DYNEST_SETTINGS_H
#define DYNEST_SETTINGS_H

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <json/json.h>

#include <DyNest/TypeDefs.h>

template <NumericType T>
std::vector<T> as_vector(const Json::Value & val) {
    std::vector<T> extracted_vals;
    if (val.isArray()) { for (const Json::Value & jv : val) {
        extracted_vals.push_back( jv.as<T>() ); // NB, jsoncpp handles cast failures
    } } else {
        extracted_vals.push_back( val.as<T>() );
    }
    return extracted_vals;
}

namespace DYN {

struct UnrecognizedKeyError : public std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// throws UnrecognizedKeyError naming every member of `obj` not in `recognized`;
// a null `obj` is treated as empty
void check_keys(
    const Json::Value & obj,
    const std::vector<std::string> & recognized,
    const std::string & context
);

// PolyChord run settings, with PolyChord's defaults.
// `nlives` is the live point profile: empty means constant `nlive`.
struct Settings {
    int nlive = 100;
    NliveSteps nlives = {};
    int num_repeats = 20;
    int nprior = -1;
    bool do_clustering = true;
    int feedback = 1;
    float_type precision_criterion = 0.001;
    float_type logzero = -1e30;
    int max_ndead = -1;
    float_type boost_posterior = 0.0;
    bool posteriors = true;
    bool equals = true;
    bool cluster_posteriors = true;
    bool write_resume = true;
    bool write_paramnames = false;
    bool read_resume = true;
    bool write_stats = true;
    bool write_live = true;
    bool write_dead = true;
    bool write_prior = true;
    float_type compression_factor = std::exp(-1.0);
    std::string base_dir = "chains";
    std::string file_root = "test";
    int seed = -1;

    inline static const std::vector<std::string> KEYS = {
        "nlive", "nlives", "num_repeats", "nprior", "do_clustering", "feedback",
        "precision_criterion", "logzero", "max_ndead", "boost_posterior", "posteriors",
        "equals", "cluster_posteriors", "write_resume", "write_paramnames", "read_resume",
        "write_stats", "write_live", "write_dead", "write_prior", "compression_factor",
        "base_dir", "file_root", "seed"
    };

    // defaults overridden by whatever `obj` sets; throws UnrecognizedKeyError
    static Settings from_json(const Json::Value & obj);

    // every key, fully populated; `nlives` as an array of [logl, nlive] pairs
    Json::Value to_json() const;
};

// Validate caller settings and apply the values dynamic runs depend on:
// read_resume = false (the orchestrator decides when to resume) and
// write_dead = true (dead points are what gets combined). Each caller value
// that conflicts is replaced and reported with one warning.
Settings check_settings(const Json::Value & obj, std::ostream & os = std::cerr);

}

#endif // DYNEST_SETTINGS_H
