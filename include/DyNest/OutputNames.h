#ifndef DYNEST_OUTPUTNAMES_H
#define DYNEST_OUTPUTNAMES_H

#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

#include <DyNest/TypeDefs.h>

namespace DYN {

// Standard file root describing a run's configuration:
// <likelihood>_<prior>_<prior_scale>_dg<goal>[_<ninit>init[_<init_step>is]]_<ndim>d_<nlive_const>nlive_<nrepeats>nrepeats
// with every '.' replaced by '_'. An unset goal (standard nested sampling)
// prints as dgNone with no init parts; goal 0 has no init_step part, as the
// initial run is not split into steps.
// @throws std::invalid_argument if the goal is set but ninit (or, for goal > 0, init_step) is not
std::string settings_root(
    const std::string & likelihood_name,
    const std::string & prior_name,
    const size_t ndim,
    const float_type prior_scale,
    const std::optional<float_type> dynamic_goal,
    const size_t nlive_const,
    const size_t nrepeats,
    const std::optional<size_t> ninit = std::nullopt,
    const std::optional<size_t> init_step = std::nullopt
);

// settings_root arguments as they appear under "naming" in a configuration file
struct RootSpec {
    std::string likelihood;
    std::string prior;
    size_t ndim = 0;
    float_type prior_scale = 1.0;
    std::optional<float_type> dynamic_goal;
    size_t nlive_const = 0;
    size_t nrepeats = 0;
    std::optional<size_t> ninit;
    std::optional<size_t> init_step;

    inline static const std::vector<std::string> KEYS = {
        "likelihood", "prior", "ndim", "prior_scale", "dynamic_goal", "nlive_const", "nrepeats", "ninit", "init_step"
    };

    // throws UnrecognizedKeyError
    static RootSpec from_json(const Json::Value & obj);

    std::string root() const;
};

}

#endif // DYNEST_OUTPUTNAMES_H
