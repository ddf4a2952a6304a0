#include "memInfoProbe.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <sys/sysinfo.h>
#include <unistd.h>

MemoryInfo::MemoryInfo():
    u64Total_bytes(0),
    u64Available_bytes(0),
    u64Used_bytes(0),
    dPercentUsed(0.0)
{
}

MemoryInfo make_memory_info(uint64_t u64Total_bytes, uint64_t u64Available_bytes)
{
    MemoryInfo sInfo;
    sInfo.u64Total_bytes = u64Total_bytes;
    sInfo.u64Available_bytes = u64Available_bytes;
    sInfo.u64Used_bytes = (u64Total_bytes > u64Available_bytes) ? u64Total_bytes - u64Available_bytes : 0;
    if (u64Total_bytes != 0)
    {
        sInfo.dPercentUsed = (double)sInfo.u64Used_bytes / (double)u64Total_bytes * 100.0;
    }
    return sInfo;
}

/// Reads MemTotal and MemAvailable. Returns false if either line is missing.
static bool read_proc_meminfo(uint64_t &u64Total_bytes, uint64_t &u64Available_bytes)
{
    std::ifstream meminfoFile("/proc/meminfo");
    if (!meminfoFile.is_open())
    {
        return false;
    }

    bool bHaveTotal = false;
    bool bHaveAvailable = false;
    std::string strLine;
    while (std::getline(meminfoFile, strLine) && !(bHaveTotal && bHaveAvailable))
    {
        std::istringstream lineStream(strLine);
        std::string strKey;
        uint64_t u64Value_kB = 0;
        if (!(lineStream >> strKey >> u64Value_kB))
        {
            continue;
        }
        // Values in /proc/meminfo are always reported in kB
        if (strKey == "MemTotal:")
        {
            u64Total_bytes = u64Value_kB * 1024;
            bHaveTotal = true;
        }
        else if (strKey == "MemAvailable:")
        {
            u64Available_bytes = u64Value_kB * 1024;
            bHaveAvailable = true;
        }
    }
    return bHaveTotal && bHaveAvailable;
}

MemoryInfo probe_memory()
{
    uint64_t u64Total_bytes = 0;
    uint64_t u64Available_bytes = 0;
    if (read_proc_meminfo(u64Total_bytes, u64Available_bytes))
    {
        return make_memory_info(u64Total_bytes, u64Available_bytes);
    }

    // Older kernels do not report MemAvailable. Free plus buffers is the closest sysinfo gets.
    struct sysinfo sSysInfo;
    if (sysinfo(&sSysInfo) == 0)
    {
        uint64_t u64Unit = sSysInfo.mem_unit ? sSysInfo.mem_unit : 1;
        return make_memory_info((uint64_t)sSysInfo.totalram * u64Unit,
                                ((uint64_t)sSysInfo.freeram + (uint64_t)sSysInfo.bufferram) * u64Unit);
    }

    return MemoryInfo();
}

bool is_probe_degraded(const MemoryInfo &sInfo)
{
    return sInfo.u64Total_bytes == 0;
}

uint64_t get_process_rss()
{
    std::ifstream statmFile("/proc/self/statm");
    if (!statmFile.is_open())
    {
        return 0;
    }

    // First field is the total program size, the second is the resident size. Both are in pages.
    uint64_t u64Size_pages = 0;
    uint64_t u64Resident_pages = 0;
    if (!(statmFile >> u64Size_pages >> u64Resident_pages))
    {
        return 0;
    }

    long lPageSize_bytes = sysconf(_SC_PAGESIZE);
    if (lPageSize_bytes <= 0)
    {
        return 0;
    }
    return u64Resident_pages * (uint64_t)lPageSize_bytes;
}
