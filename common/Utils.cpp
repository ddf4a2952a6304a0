#include <cstring>
#include <ctime>
#include <sstream>

#include "Utils.hpp"

std::string get_timestamp()
{
    std::time_t now = std::time(nullptr);
    struct tm sLocalTime;
    if (localtime_r(&now, &sLocalTime) == nullptr)
    {
        return "-";
    }

    char pcBuffer[32];
    if (std::strftime(pcBuffer, sizeof(pcBuffer), "%Y-%m-%d %H:%M:%S", &sLocalTime) == 0)
    {
        return "-";
    }
    return std::string(pcBuffer);
}

///A quick way to turn errno values from failed system calls into something a user can read.
std::string describe_errno(const std::string &strCall, int iErrno)
{
    std::ostringstream oss;
    oss << strCall << " failed: " << std::strerror(iErrno) << " (errno " << iErrno << ")";
    return oss.str();
}
