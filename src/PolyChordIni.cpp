#include <DyNest/PolyChordIni.h>

using std::string;
using std::vector;

namespace DYN {

// non-exported helper
void add_line(string & ini, const string & key, const string & value) {
    ini += key + " = " + value + "\n";
}

string ini_string(
    const Settings & settings,
    const string & config_str,
    const string & prior_str,
    const string & derived_str
) {
    string ini;
    add_line(ini, "nlive", format_setting(settings.nlive));
    if (not settings.nlives.empty()) {
        vector<float_type> loglikes;
        vector<int> nlives;
        for (const auto & step : settings.nlives) {
            loglikes.push_back(step.first);
            nlives.push_back(step.second);
        }
        add_line(ini, "loglikes", format_setting(loglikes));
        add_line(ini, "nlives", format_setting(nlives));
    }
    add_line(ini, "num_repeats", format_setting(settings.num_repeats));
    add_line(ini, "nprior", format_setting(settings.nprior));
    add_line(ini, "do_clustering", format_setting(settings.do_clustering));
    add_line(ini, "feedback", format_setting(settings.feedback));
    add_line(ini, "precision_criterion", format_setting(settings.precision_criterion));
    add_line(ini, "logzero", format_setting(settings.logzero));
    add_line(ini, "max_ndead", format_setting(settings.max_ndead));
    add_line(ini, "boost_posterior", format_setting(settings.boost_posterior));
    add_line(ini, "posteriors", format_setting(settings.posteriors));
    add_line(ini, "equals", format_setting(settings.equals));
    add_line(ini, "cluster_posteriors", format_setting(settings.cluster_posteriors));
    add_line(ini, "write_resume", format_setting(settings.write_resume));
    add_line(ini, "write_paramnames", format_setting(settings.write_paramnames));
    add_line(ini, "read_resume", format_setting(settings.read_resume));
    add_line(ini, "write_stats", format_setting(settings.write_stats));
    add_line(ini, "write_live", format_setting(settings.write_live));
    add_line(ini, "write_dead", format_setting(settings.write_dead));
    add_line(ini, "write_prior", format_setting(settings.write_prior));
    add_line(ini, "compression_factor", format_setting(settings.compression_factor));
    add_line(ini, "base_dir", format_setting(settings.base_dir));
    add_line(ini, "file_root", format_setting(settings.file_root));
    add_line(ini, "seed", format_setting(settings.seed));
    ini += config_str;
    ini += prior_str;
    ini += derived_str;
    return ini;
}

string get_prior_block_str(
    const string & prior_name,
    const vector<float_type> & prior_params,
    const size_t nparam,
    const int speed,
    const int block,
    const size_t start_param
) {
    const string params = format_setting(prior_params);
    string block_str;
    for (size_t i = start_param; i < start_param + nparam; ++i) {
        std::stringstream line;
        line << "P : p" << i << " | \\theta_{" << i << "} | " << speed << " | " << prior_name << " | " << block << " |" << params << "\n";
        block_str += line.str();
    }
    return block_str;
}

string prior_to_str(
    const Prior & prior,
    const size_t nparam,
    const int speed,
    const int block,
    const size_t start_param
) {
    return get_prior_block_str(prior.polychord_name(), prior.polychord_params(), nparam, speed, block, start_param);
}

string block_prior_to_str(const BlockPrior & bp, const int speed) {
    string str;
    size_t start = 1;
    for (size_t b = 0; b < bp.priors.size(); ++b) {
        str += prior_to_str(*bp.priors[b], bp.block_sizes[b], speed, b + 1, start);
        start += bp.block_sizes[b];
    }
    return str;
}

}
