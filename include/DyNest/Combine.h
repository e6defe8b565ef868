#ifndef DYNEST_COMBINE_H
#define DYNEST_COMBINE_H

#include <iostream>
#include <vector>

#include <DyNest/NestedRun.h>

namespace DYN {

// Merge independent runs into one. Thread labels of each run are shifted past
// those already used; points are re-sorted by logl (stable, so ties keep run
// order) and the live point counts rebuilt from the thread bounds.
Run combine_runs(const std::vector<Run> & runs);

// Merge a dynamic run that was resumed from a checkpoint of `init` taken when
// `resume_ndead` points had died.
//
// The points both runs share (everything dead before the checkpoint, plus the
// live points at the checkpoint) are kept once, as the dynamic run's copies.
// The remainder of each initial run thread becomes a new thread, labelled
// after the dynamic run's labels, born on the contour of the last point it
// shared.
//
// If the shared points cannot be matched exactly, one warning goes to `os` and
// the merge falls back to dropping the first `resume_ndead` points of `init`;
// the result is then best-effort.
Run combine_resumed_dyn_run(
    const Run & init,
    const Run & dyn,
    const size_t resume_ndead,
    std::ostream & os = std::cerr
);

}

#endif // DYNEST_COMBINE_H
