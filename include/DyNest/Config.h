#ifndef DYNEST_CONFIG_H
#define DYNEST_CONFIG_H

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

#include <DyNest/OutputNames.h>
#include <DyNest/Priors.h>
#include <DyNest/TypeDefs.h>

namespace DYN {

// parse a JSON file; throws std::runtime_error if it is missing or malformed
Json::Value read_config(const std::string & conf_filename);

// One prior block, e.g.
//   { "type": "uniform", "nparam": 2, "params": [-10, 10], "sorted": true }
// `params` are in PolyChord's order for the type:
// uniform [min, max], power_uniform [min, max, power], gaussian and
// half_gaussian [mu, sigma], exponential [lambda].
std::shared_ptr<const Prior> parse_prior_block(const Json::Value & block);

// an array of prior blocks, in parameter order
std::shared_ptr<const BlockPrior> parse_prior(const Json::Value & blocks);

// how to drive a compiled sampler (see SamplerExec)
struct SamplerConfig {
    std::string executable;
    std::string mpi_str;
    std::string config_str;
    std::string derived_str;
    int speed = 1;
    std::shared_ptr<const BlockPrior> prior;

    inline static const std::vector<std::string> KEYS = {
        "executable", "mpi_str", "config_str", "derived_str", "speed", "prior"
    };

    std::string prior_str() const;
};

// Configuration file for the dynest command line tool:
// {
//   "settings": { PolyChord settings },
//   "dynamic_goal": 0.25,           (null or absent: standard nested sampling)
//   "options": { RunOptions },
//   "sampler": { SamplerConfig },
//   "naming": { RootSpec }          (optional: derives settings.file_root)
// }
// Unknown keys anywhere are an error.
struct JsonConfig {
    JsonConfig(const std::string & filename) : JsonConfig(read_config(filename)) {}
    JsonConfig(const Json::Value & root);

    Json::Value settings;
    std::optional<float_type> dynamic_goal;
    Json::Value options;
    SamplerConfig sampler;
    std::optional<RootSpec> naming;

    inline static const std::vector<std::string> KEYS = {
        "settings", "dynamic_goal", "options", "sampler", "naming"
    };

    // `settings`, with file_root from `naming` when given
    Json::Value settings_json() const;
};

}

#endif // DYNEST_CONFIG_H
