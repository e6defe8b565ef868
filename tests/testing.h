#ifndef TESTING_H
#define TESTING_H

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

inline int & test_failures() {
    static int failures = 0;
    return failures;
}

// If macro argument is not true, test is failing
#define IS_TRUE(x) { \
    if (!(x)) { \
        std::cout << __PRETTY_FUNCTION__ << " failed on line " << __LINE__ << std::endl;\
        ++test_failures(); \
    } else { \
        std::cout << __PRETTY_FUNCTION__ << " passed on line " << __LINE__ << std::endl;\
    } \
}

// If the expression does not throw an EXC, test is failing
#define THROWS(expr, EXC) { \
    bool thrown = false; \
    try { expr; } catch (const EXC &) { thrown = true; } \
    IS_TRUE(thrown); \
}

// exit status for main()
#define TEST_RESULT (test_failures() == 0 ? 0 : 1)

inline bool approx_equal(const double a, const double b, const double tol = 1e-12) {
    return std::abs(a - b) <= tol * std::max(1.0, std::abs(b));
}

// number of lines that start "WARNING:"
inline size_t count_warnings(const std::string & log) {
    std::stringstream ss(log);
    std::string line;
    size_t n = 0;
    while (std::getline(ss, line)) { if (line.rfind("WARNING:", 0) == 0) { ++n; } }
    return n;
}

// a fresh, empty directory for one test's files
inline std::string scratch_dir(const std::string & name) {
    const auto dir = std::filesystem::temp_directory_path() / ("dynest_test_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir.string();
}

#endif
