#ifndef DYNEST_POLYCHORDINI_H
#define DYNEST_POLYCHORDINI_H

#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include <DyNest/Priors.h>
#include <DyNest/Settings.h>

namespace DYN {

// PolyChord .ini values: booleans as T / F, lists space separated
inline std::string format_setting(const bool val) { return val ? "T" : "F"; }

inline std::string format_setting(const std::string & val) { return val; }

template <NumericType T>
std::string format_setting(const T val) {
    std::stringstream ss;
    ss << std::setprecision(17) << val;
    return ss.str();
}

template <NumericType T>
std::string format_setting(const std::vector<T> & vals) {
    std::string str;
    for (size_t i = 0; i < vals.size(); ++i) {
        if (i > 0) { str += " "; }
        str += format_setting(vals[i]);
    }
    return str;
}

// Contents of a PolyChord .ini file: one `key = value` line per setting (a
// live point profile becomes `loglikes` and `nlives` lines), then the extra
// configuration, prior and derived parameter lines verbatim.
std::string ini_string(
    const Settings & settings,
    const std::string & config_str = "",
    const std::string & prior_str = "",
    const std::string & derived_str = ""
);

// One line per parameter p<start_param> .. p<start_param + nparam - 1>:
// "P : p<i> | \theta_{<i>} | <speed> | <name> | <block> | <params>"
std::string get_prior_block_str(
    const std::string & prior_name,
    const std::vector<float_type> & prior_params,
    const size_t nparam,
    const int speed = 1,
    const int block = 1,
    const size_t start_param = 1
);

std::string prior_to_str(
    const Prior & prior,
    const size_t nparam,
    const int speed = 1,
    const int block = 1,
    const size_t start_param = 1
);

// each block of parameters gets its own PolyChord block number, counting from 1
std::string block_prior_to_str(const BlockPrior & bp, const int speed = 1);

}

#endif // DYNEST_POLYCHORDINI_H
