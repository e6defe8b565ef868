#ifndef DYNEST_IMPORTANCE_H
#define DYNEST_IMPORTANCE_H

#include <DyNest/NestedRun.h>

namespace DYN {

// Relative importance of each point of `run` for increasing the number of
// live points there.
//
// Evidence importance is the evidence remaining above each point; parameter
// importance is the point's posterior weight. The two are blended linearly:
// dynamic_goal = 0 is evidence only, 1 is parameter estimation only.
//
// @param run any likelihood-sorted run, or part of one (e.g. a single thread)
// @param dynamic_goal in [0, 1]
// @param tuned_dynamic_p also weight parameter importance by |theta_1 - posterior mean|
//
// @return one value per point, in [0, 1], with maximum exactly 1
Col sample_importance(
    const Run & run,
    const float_type dynamic_goal,
    const bool tuned_dynamic_p = false
);

// evidence remaining after each point, normalised to sum to 1
Col z_importance(const Col & w_rel);

// posterior weight, normalised to sum to 1
Col p_importance(
    const Mat2D & theta,
    const Col & w_rel,
    const bool tuned_dynamic_p = false
);

}

#endif // DYNEST_IMPORTANCE_H
