#include <DyNest/Settings.h>

#include "testing.h"

using namespace DYN;
using namespace std;

void test_defaults() {
    const Settings s = Settings::from_json(Json::Value());
    IS_TRUE(s.nlive == 100);
    IS_TRUE(s.nlives.empty());
    IS_TRUE(s.read_resume);
    IS_TRUE(s.base_dir == "chains");
    IS_TRUE(s.seed == -1);
}

void test_from_json() {
    Json::Value obj;
    obj["nlive"] = 25;
    obj["file_root"] = "gaussian";
    obj["precision_criterion"] = 0.01;
    Json::Value step(Json::arrayValue);
    step.append(-20.5);
    step.append(40);
    obj["nlives"].append(step);

    const Settings s = Settings::from_json(obj);
    IS_TRUE(s.nlive == 25);
    IS_TRUE(s.file_root == "gaussian");
    IS_TRUE(s.precision_criterion == 0.01);
    IS_TRUE((s.nlives == NliveSteps{ {-20.5, 40} }));

    // everything written out reads back the same
    const Settings again = Settings::from_json(s.to_json());
    IS_TRUE(again.to_json() == s.to_json());

    obj["nlives"][0].append(3);
    THROWS(Settings::from_json(obj), std::invalid_argument);
}

void test_unrecognized_key() {
    Json::Value obj;
    obj["nlive"] = 25;
    obj["nlive_typo"] = 30;
    THROWS(Settings::from_json(obj), UnrecognizedKeyError);

    ostringstream log;
    THROWS(check_settings(obj, log), UnrecognizedKeyError);

    THROWS(check_keys(Json::Value("a string"), Settings::KEYS, "settings"), std::invalid_argument);
}

void test_mandatory_values() {
    ostringstream log;
    Json::Value obj;
    obj["read_resume"] = true;
    obj["equals"] = true;
    obj["posteriors"] = false;
    Settings s = check_settings(obj, log);
    IS_TRUE(count_warnings(log.str()) == 1);
    IS_TRUE(not s.read_resume);
    IS_TRUE(s.write_dead);
    IS_TRUE(not s.posteriors);

    log.str("");
    obj["write_dead"] = false;
    s = check_settings(obj, log);
    IS_TRUE(count_warnings(log.str()) == 2);
    IS_TRUE(s.write_dead);

    // values that already agree, or are left at PolyChord's defaults, are not reported
    log.str("");
    Json::Value quiet;
    quiet["read_resume"] = false;
    s = check_settings(quiet, log);
    IS_TRUE(count_warnings(log.str()) == 0);
    IS_TRUE(not check_settings(Json::Value(), log).read_resume);
    IS_TRUE(count_warnings(log.str()) == 0);
}

void test_as_vector() {
    Json::Value arr(Json::arrayValue);
    arr.append(1.5);
    arr.append(2.5);
    IS_TRUE((as_vector<double>(arr) == vector<double>{ 1.5, 2.5 }));
    IS_TRUE((as_vector<int>(Json::Value(3)) == vector<int>{ 3 }));
}

int main() {
    test_defaults();
    test_from_json();
    test_unrecognized_key();
    test_mandatory_values();
    test_as_vector();
    return TEST_RESULT;
}
