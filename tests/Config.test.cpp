#include <DyNest/Config.h>
#include <DyNest/Settings.h>

#include "testing.h"

#include <fstream>

using namespace DYN;
using namespace std;

Json::Value prior_block(const string & type, const vector<double> & params, const int nparam = 1) {
    Json::Value block;
    block["type"] = type;
    block["nparam"] = nparam;
    for (const double p : params) { block["params"].append(p); }
    return block;
}

void test_prior_blocks() {
    auto prior = parse_prior_block(prior_block("uniform", { -10, 10 }));
    IS_TRUE(prior->polychord_name() == "uniform");
    IS_TRUE((prior->polychord_params() == vector<float_type>{ -10, 10 }));

    Json::Value sorted = prior_block("half_gaussian", { 1, 3 });
    sorted["sorted"] = true;
    prior = parse_prior_block(sorted);
    IS_TRUE(prior->polychord_name() == "sorted_half_gaussian");
    IS_TRUE((prior->polychord_params() == vector<float_type>{ 1, 3 }));

    IS_TRUE(parse_prior_block(prior_block("power_uniform", { 1, 10, -1 }))->polychord_name() == "power_uniform");
    IS_TRUE(parse_prior_block(prior_block("exponential", { 2 }))->polychord_name() == "exponential");

    THROWS(parse_prior_block(prior_block("uniform", { 1 })), std::invalid_argument);
    THROWS(parse_prior_block(prior_block("cauchy", { 0, 1 })), std::invalid_argument);
    Json::Value typo = prior_block("uniform", { 0, 1 });
    typo["sort"] = true;
    THROWS(parse_prior_block(typo), UnrecognizedKeyError);

    Json::Value blocks(Json::arrayValue);
    blocks.append(prior_block("uniform", { 0, 1 }, 3));
    blocks.append(prior_block("gaussian", { 0, 1 }, 2));
    const auto bp = parse_prior(blocks);
    IS_TRUE(bp->nparam() == 5);
    IS_TRUE((bp->block_sizes == vector<size_t>{ 3, 2 }));
    THROWS(parse_prior(Json::Value(Json::arrayValue)), std::invalid_argument);
}

Json::Value minimal_config() {
    Json::Value root;
    root["settings"]["nlive"] = 50;
    root["settings"]["file_root"] = "plain";
    root["dynamic_goal"] = 0.5;
    root["options"]["ninit"] = 5;
    root["sampler"]["executable"] = "./gaussian";
    root["sampler"]["prior"].append(prior_block("uniform", { -5, 5 }, 2));
    return root;
}

void test_json_config() {
    const JsonConfig config(minimal_config());
    IS_TRUE(config.dynamic_goal == 0.5);
    IS_TRUE(config.options["ninit"].asInt() == 5);
    IS_TRUE(config.sampler.executable == "./gaussian");
    IS_TRUE(config.sampler.prior_str() ==
        "P : p1 | \\theta_{1} | 1 | uniform | 1 |-5 5\n"
        "P : p2 | \\theta_{2} | 1 | uniform | 1 |-5 5\n");
    IS_TRUE(config.settings_json()["file_root"].asString() == "plain");

    Json::Value named = minimal_config();
    named["naming"]["likelihood"] = "gaussian";
    named["naming"]["prior"] = "uniform";
    named["naming"]["ndim"] = 2;
    named["naming"]["prior_scale"] = 5;
    named["naming"]["dynamic_goal"] = 0.5;
    named["naming"]["nlive_const"] = 50;
    named["naming"]["nrepeats"] = 10;
    named["naming"]["ninit"] = 5;
    named["naming"]["init_step"] = 5;
    IS_TRUE(JsonConfig(named).settings_json()["file_root"].asString() == "gaussian_uniform_5_dg0_5_5init_5is_2d_50nlive_10nrepeats");

    Json::Value unset = minimal_config();
    unset["dynamic_goal"] = Json::Value();
    IS_TRUE(not JsonConfig(unset).dynamic_goal);
}

void test_config_errors(const string & dir) {
    for (const string section : { "", "settings", "options", "sampler" }) {
        Json::Value root = minimal_config();
        if (section.empty()) {
            root["dynamic_goals"] = 1;
        } else {
            root[section]["unknown_key"] = 1;
        }
        THROWS(JsonConfig{root}, UnrecognizedKeyError);
    }

    Json::Value no_sampler = minimal_config();
    no_sampler.removeMember("sampler");
    THROWS(JsonConfig{no_sampler}, std::invalid_argument);

    THROWS(read_config(dir + "/missing.json"), std::runtime_error);
    const string bad = dir + "/bad.json";
    {
        ofstream out(bad.c_str());
        out << "{ \"settings\": ";
    }
    THROWS(read_config(bad), std::runtime_error);
}

int main() {
    const string dir = scratch_dir("config");
    test_prior_blocks();
    test_json_config();
    test_config_errors(dir);
    return TEST_RESULT;
}
