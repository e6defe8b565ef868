#include <DyNest/OutputNames.h>
#include <DyNest/Settings.h>

#include <algorithm>
#include <sstream>
#include <stdexcept>

using std::string;

namespace DYN {

string settings_root(
    const string & likelihood_name,
    const string & prior_name,
    const size_t ndim,
    const float_type prior_scale,
    const std::optional<float_type> dynamic_goal,
    const size_t nlive_const,
    const size_t nrepeats,
    const std::optional<size_t> ninit,
    const std::optional<size_t> init_step
) {
    std::stringstream root;
    root << likelihood_name << "_" << prior_name << "_" << prior_scale << "_dg";
    if (dynamic_goal) {
        if (not ninit) { throw std::invalid_argument("settings_root: ninit is needed when dynamic_goal is set."); }
        root << *dynamic_goal << "_" << *ninit << "init";
        if (*dynamic_goal != 0) {
            if (not init_step) { throw std::invalid_argument("settings_root: init_step is needed when dynamic_goal > 0."); }
            root << "_" << *init_step << "is";
        }
    } else {
        root << "None";
    }
    root << "_" << ndim << "d_" << nlive_const << "nlive_" << nrepeats << "nrepeats";
    string str = root.str();
    std::replace(str.begin(), str.end(), '.', '_');
    return str;
}

RootSpec RootSpec::from_json(const Json::Value & obj) {
    check_keys(obj, KEYS, "naming");
    for (const char * key : { "likelihood", "prior", "ndim", "nlive_const", "nrepeats" }) {
        if (not obj.isMember(key)) { throw std::invalid_argument(string("naming: missing `") + key + "`"); }
    }
    RootSpec spec;
    spec.likelihood = obj["likelihood"].asString();
    spec.prior = obj["prior"].asString();
    spec.ndim = obj["ndim"].asUInt();
    spec.prior_scale = obj.get("prior_scale", spec.prior_scale).asDouble();
    if (obj.isMember("dynamic_goal") and not obj["dynamic_goal"].isNull()) { spec.dynamic_goal = obj["dynamic_goal"].asDouble(); }
    spec.nlive_const = obj["nlive_const"].asUInt();
    spec.nrepeats = obj["nrepeats"].asUInt();
    if (obj.isMember("ninit")) { spec.ninit = obj["ninit"].asUInt(); }
    if (obj.isMember("init_step")) { spec.init_step = obj["init_step"].asUInt(); }
    return spec;
}

string RootSpec::root() const {
    return settings_root(likelihood, prior, ndim, prior_scale, dynamic_goal, nlive_const, nrepeats, ninit, init_step);
}

}
