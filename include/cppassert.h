//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once

#include <sstream>
#include <stdexcept>
#include <string>

// Thrown when an internal invariant does not hold.
// Unlike assert, this is not compiled out in release builds.
class assertion_failure : public std::logic_error
{
  public:
    assertion_failure(const std::string &what) : std::logic_error(what)
    {
    }
};

inline void t_assert_fail(const char *expr, const std::string &message, const char *file, int line)
{
    std::ostringstream oss;
    oss << file << ":" << line << ": assertion `" << expr << "` failed. " << message;
    throw assertion_failure(oss.str());
}

#define t_assert(expr, message)                                                                                        \
    do                                                                                                                 \
    {                                                                                                                  \
        if (!(expr))                                                                                                   \
            t_assert_fail(#expr, message, __FILE__, __LINE__);                                                         \
    } while (false)
