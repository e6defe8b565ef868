#include <DyNest/Config.h>
#include <DyNest/DyNest.h>
#include <DyNest/PolyChordIni.h>
#include <DyNest/Settings.h>

#include <fstream>
#include <stdexcept>

using std::string;
using std::vector;

namespace DYN {

Json::Value read_config(const string & conf_filename) {
    std::ifstream ifs(conf_filename.c_str());
    if (not ifs.good()) {
        throw std::runtime_error("Config file is not good: " + conf_filename);
    }

    Json::Value root;
    Json::Reader reader;
    if (not reader.parse(ifs, root)) {
        throw std::runtime_error("Failed to parse JSON file: " + conf_filename + "\n" + reader.getFormattedErrorMessages());
    }
    return root;
}

std::shared_ptr<const Prior> parse_prior_block(const Json::Value & block) {
    check_keys(block, { "type", "nparam", "params", "adaptive", "sorted", "nfunc_min" }, "prior block");
    if (not (block.isMember("type") and block.isMember("nparam"))) {
        throw std::invalid_argument("prior block needs `type` and `nparam`.");
    }
    const string type = block["type"].asString();
    const vector<float_type> params = block.isMember("params") ? as_vector<float_type>(block["params"]) : vector<float_type>();
    const bool adaptive = block.get("adaptive", false).asBool();
    const bool sorted = block.get("sorted", false).asBool();
    const int nfunc_min = block.get("nfunc_min", 1).asInt();

    auto need = [&](const size_t n) {
        if (params.size() != n) {
            throw std::invalid_argument("prior block `" + type + "` needs " + std::to_string(n) + " params.");
        }
    };

    if (type == "uniform") {
        need(2);
        return std::make_shared<UniformPrior>(params[0], params[1], adaptive, sorted, nfunc_min);
    } else if (type == "power_uniform") {
        need(3);
        return std::make_shared<PowerUniformPrior>(params[0], params[1], params[2], adaptive, sorted, nfunc_min);
    } else if ((type == "gaussian") or (type == "half_gaussian")) {
        need(2);
        return std::make_shared<GaussianPrior>(params[1], type == "half_gaussian", params[0], adaptive, sorted, nfunc_min);
    } else if (type == "exponential") {
        need(1);
        return std::make_shared<ExponentialPrior>(params[0], adaptive, sorted, nfunc_min);
    }
    throw std::invalid_argument("Unknown prior type `" + type + "`.");
}

std::shared_ptr<const BlockPrior> parse_prior(const Json::Value & blocks) {
    if (not blocks.isArray() or blocks.empty()) {
        throw std::invalid_argument("`prior` must be a non-empty array of prior blocks.");
    }
    vector<std::shared_ptr<const Prior>> priors;
    vector<size_t> sizes;
    for (const Json::Value & block : blocks) {
        priors.push_back(parse_prior_block(block));
        sizes.push_back(block["nparam"].asUInt());
    }
    return std::make_shared<const BlockPrior>(priors, sizes);
}

string SamplerConfig::prior_str() const {
    return prior ? block_prior_to_str(*prior, speed) : "";
}

JsonConfig::JsonConfig(const Json::Value & root) {
    check_keys(root, KEYS, "configuration");
    settings = root.get("settings", Json::Value(Json::objectValue));
    check_keys(settings, Settings::KEYS, "settings");
    if (root.isMember("dynamic_goal") and not root["dynamic_goal"].isNull()) {
        dynamic_goal = root["dynamic_goal"].asDouble();
    }
    options = root.get("options", Json::Value(Json::objectValue));
    check_keys(options, RunOptions::KEYS, "options");

    if (not root.isMember("sampler")) { throw std::invalid_argument("configuration needs a `sampler` section."); }
    const Json::Value & sj = root["sampler"];
    check_keys(sj, SamplerConfig::KEYS, "sampler");
    if (not sj.isMember("executable")) { throw std::invalid_argument("sampler needs an `executable`."); }
    sampler.executable = sj["executable"].asString();
    sampler.mpi_str = sj.get("mpi_str", "").asString();
    sampler.config_str = sj.get("config_str", "").asString();
    sampler.derived_str = sj.get("derived_str", "").asString();
    sampler.speed = sj.get("speed", 1).asInt();
    if (sj.isMember("prior")) { sampler.prior = parse_prior(sj["prior"]); }

    if (root.isMember("naming")) { naming = RootSpec::from_json(root["naming"]); }
}

Json::Value JsonConfig::settings_json() const {
    Json::Value s = settings;
    if (naming) { s["file_root"] = naming->root(); }
    return s;
}

}
