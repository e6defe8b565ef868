#include <DyNest/Settings.h>
#include <DyNest/DynLog.h>

#include <algorithm>
#include <sstream>

using std::string;
using std::vector;

namespace DYN {

void check_keys(const Json::Value & obj, const vector<string> & recognized, const string & context) {
    if (obj.isNull()) { return; }
    if (not obj.isObject()) {
        throw std::invalid_argument(context + " must be a JSON object.");
    }
    vector<string> unknown;
    for (const string & key : obj.getMemberNames()) {
        if (std::find(recognized.begin(), recognized.end(), key) == recognized.end()) { unknown.push_back(key); }
    }
    if (not unknown.empty()) {
        std::stringstream err;
        err << "Unrecognized " << context << " key(s):";
        for (const string & key : unknown) { err << " `" << key << "`"; }
        throw UnrecognizedKeyError(err.str());
    }
}

Settings Settings::from_json(const Json::Value & obj) {
    check_keys(obj, KEYS, "settings");
    Settings s;
    if (obj.isNull()) { return s; }

    s.nlive = obj.get("nlive", s.nlive).asInt();
    if (obj.isMember("nlives")) {
        for (const Json::Value & step : obj["nlives"]) {
            if (not (step.isArray() and (step.size() == 2))) {
                throw std::invalid_argument("settings `nlives` must be an array of [logl, nlive] pairs.");
            }
            s.nlives.push_back({ step[0].asDouble(), step[1].asInt() });
        }
    }
    s.num_repeats = obj.get("num_repeats", s.num_repeats).asInt();
    s.nprior = obj.get("nprior", s.nprior).asInt();
    s.do_clustering = obj.get("do_clustering", s.do_clustering).asBool();
    s.feedback = obj.get("feedback", s.feedback).asInt();
    s.precision_criterion = obj.get("precision_criterion", s.precision_criterion).asDouble();
    s.logzero = obj.get("logzero", s.logzero).asDouble();
    s.max_ndead = obj.get("max_ndead", s.max_ndead).asInt();
    s.boost_posterior = obj.get("boost_posterior", s.boost_posterior).asDouble();
    s.posteriors = obj.get("posteriors", s.posteriors).asBool();
    s.equals = obj.get("equals", s.equals).asBool();
    s.cluster_posteriors = obj.get("cluster_posteriors", s.cluster_posteriors).asBool();
    s.write_resume = obj.get("write_resume", s.write_resume).asBool();
    s.write_paramnames = obj.get("write_paramnames", s.write_paramnames).asBool();
    s.read_resume = obj.get("read_resume", s.read_resume).asBool();
    s.write_stats = obj.get("write_stats", s.write_stats).asBool();
    s.write_live = obj.get("write_live", s.write_live).asBool();
    s.write_dead = obj.get("write_dead", s.write_dead).asBool();
    s.write_prior = obj.get("write_prior", s.write_prior).asBool();
    s.compression_factor = obj.get("compression_factor", s.compression_factor).asDouble();
    s.base_dir = obj.get("base_dir", s.base_dir).asString();
    s.file_root = obj.get("file_root", s.file_root).asString();
    s.seed = obj.get("seed", s.seed).asInt();
    return s;
}

Json::Value Settings::to_json() const {
    Json::Value obj(Json::objectValue);
    obj["nlive"] = nlive;
    obj["nlives"] = Json::Value(Json::arrayValue);
    for (const auto & step : nlives) {
        Json::Value pair(Json::arrayValue);
        pair.append(step.first);
        pair.append(step.second);
        obj["nlives"].append(pair);
    }
    obj["num_repeats"] = num_repeats;
    obj["nprior"] = nprior;
    obj["do_clustering"] = do_clustering;
    obj["feedback"] = feedback;
    obj["precision_criterion"] = precision_criterion;
    obj["logzero"] = logzero;
    obj["max_ndead"] = max_ndead;
    obj["boost_posterior"] = boost_posterior;
    obj["posteriors"] = posteriors;
    obj["equals"] = equals;
    obj["cluster_posteriors"] = cluster_posteriors;
    obj["write_resume"] = write_resume;
    obj["write_paramnames"] = write_paramnames;
    obj["read_resume"] = read_resume;
    obj["write_stats"] = write_stats;
    obj["write_live"] = write_live;
    obj["write_dead"] = write_dead;
    obj["write_prior"] = write_prior;
    obj["compression_factor"] = compression_factor;
    obj["base_dir"] = base_dir;
    obj["file_root"] = file_root;
    obj["seed"] = seed;
    return obj;
}

Settings check_settings(const Json::Value & obj, std::ostream & os) {
    Settings s = Settings::from_json(obj);
    if (obj.isMember("read_resume") and s.read_resume) {
        DynLog::warning("Settings: read_resume = true is not supported; dynamic runs decide when to resume. Using read_resume = false.", os);
    }
    if (obj.isMember("write_dead") and not s.write_dead) {
        DynLog::warning("Settings: write_dead = false is not supported; dead points are needed to combine runs. Using write_dead = true.", os);
    }
    s.read_resume = false;
    s.write_dead = true;
    return s;
}

}
