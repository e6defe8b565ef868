#ifndef DYNEST_DYNLOG_H
#define DYNEST_DYNLOG_H

#include <iostream>
#include <string>

#include <DyNest/NestedRun.h>

namespace DYN {

struct AllocationInfo; // see Allocation.h

struct DynLog {

    // one line, prefixed "WARNING: "; callers count on one line per condition
    static void warning(
        const std::string & msg,
        std::ostream & os = std::cerr
    );

    static void step_banner(
        const std::string & step,
        const std::string & detail,
        std::ostream & os = std::cerr
    );

    static void run_summary(
        const std::string & label,
        const Run & run,
        std::ostream & os = std::cerr
    );

    // importance and live point targets, thinned to at most `max_rows` lines
    static void allocation_report(
        const Run & init_run,
        const AllocationInfo & info,
        const size_t max_rows = 20,
        std::ostream & os = std::cerr
    );

    inline static const int WIDTH = 12;
    inline static const std::string double_bar = "=========================================================================================";

    private:
        DynLog() {};

};

}

#endif // DYNEST_DYNLOG_H
