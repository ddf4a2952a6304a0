#ifndef __UTILS_HPP__
#define __UTILS_HPP__

#include <cstdint>
#include <string>

/// Local wall-clock time formatted as "YYYY-MM-DD HH:MM:SS". Used to stamp the start and end of a run.
std::string get_timestamp();

/// Describe a failed system call, e.g. "mmap failed: Cannot allocate memory (errno 12)".
std::string describe_errno(const std::string &strCall, int iErrno);

#endif
