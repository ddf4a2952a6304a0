#include "reporting.hpp"
#include "allocationPlan.hpp"

#include <iomanip>
#include <sstream>

std::string bytes_to_human(uint64_t u64Bytes)
{
    static const char *pcUnits[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    const size_t ulNumUnits = sizeof(pcUnits) / sizeof(pcUnits[0]);

    double dValue = (double)u64Bytes;
    size_t ulUnit = 0;
    while (dValue >= 1024.0 && ulUnit < ulNumUnits - 1)
    {
        dValue /= 1024.0;
        ulUnit++;
    }

    std::ostringstream oss;
    if (ulUnit == 0)
    {
        oss << u64Bytes << " " << pcUnits[ulUnit];
    }
    else
    {
        oss << std::fixed << std::setprecision(2) << dValue << " " << pcUnits[ulUnit];
    }
    return oss.str();
}

std::string format_mmss(double dSeconds)
{
    int64_t i64Seconds = dSeconds > 0.0 ? (int64_t)dSeconds : 0;
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << i64Seconds / 60 << ":" << std::setw(2) << i64Seconds % 60;
    return oss.str();
}

std::string format_rate(double dRate_GBps)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << dRate_GBps << " GB/s";
    return oss.str();
}

std::string format_checksum(uint32_t u32Checksum)
{
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase << std::setfill('0') << std::setw(8) << u32Checksum;
    return oss.str();
}

std::string format_progress_line(const ProgressSnapshot &sSnapshot, double dDuration_s)
{
    std::ostringstream oss;
    oss << format_mmss(sSnapshot.dElapsed_s) << " / " << format_mmss(dDuration_s)
        << "  Write: " << format_rate(sSnapshot.dInstantaneousWrite_GBps)
        << " | Read: " << format_rate(sSnapshot.dInstantaneousRead_GBps)
        << " | Total: " << format_rate(sSnapshot.dInstantaneousTotal_GBps)
        << " | loops: " << sSnapshot.i64LoopCount;
    return oss.str();
}

std::string progress_csv_header()
{
    return "elapsed_s,remaining_s,loops,inst_write_GBps,inst_read_GBps,inst_total_GBps,avg_write_GBps,avg_read_GBps,checksum";
}

std::string format_progress_csv(const ProgressSnapshot &sSnapshot)
{
    std::ostringstream oss;
    oss << std::setprecision(6) << sSnapshot.dElapsed_s << "," << sSnapshot.dRemaining_s << ","
        << sSnapshot.i64LoopCount << ","
        << sSnapshot.dInstantaneousWrite_GBps << "," << sSnapshot.dInstantaneousRead_GBps << ","
        << sSnapshot.dInstantaneousTotal_GBps << ","
        << sSnapshot.dAverageWrite_GBps << "," << sSnapshot.dAverageRead_GBps << ","
        << format_checksum(sSnapshot.u32RunningChecksum);
    return oss.str();
}

std::vector<std::string> format_result_summary(const BenchmarkResult &oResult, const MemoryInfo &sMemoryAfter,
                                               uint64_t u64ProcessRss_bytes)
{
    std::vector<std::string> lines;
    std::ostringstream oss;

    lines.push_back("Start: " + oResult.strStartedAt);
    lines.push_back("End  : " + oResult.strEndedAt);
    lines.push_back("Allocated RAM: " + bytes_to_human(oResult.u64Allocated_bytes));
    lines.push_back("Loops: " + std::to_string(oResult.i64LoopCount));

    oss << std::fixed << std::setprecision(3);
    oss << "WRITE avg: " << format_rate(oResult.write_GBps()) << "   (data=" << bytes_to_human(oResult.u64Write_bytes)
        << ", time=" << oResult.dWriteTime_s << "s)";
    lines.push_back(oss.str());

    oss.str("");
    oss << "READ  avg: " << format_rate(oResult.read_GBps()) << "   (data=" << bytes_to_human(oResult.u64Read_bytes)
        << ", time=" << oResult.dReadTime_s << "s)";
    lines.push_back(oss.str());

    lines.push_back("TOTAL avg: " + format_rate(oResult.total_GBps()));
    lines.push_back("Checksum: " + format_checksum(oResult.u32Checksum));

    oss.str("");
    oss << std::setprecision(1) << "System RAM used: " << sMemoryAfter.dPercentUsed << "% | available: "
        << bytes_to_human(sMemoryAfter.u64Available_bytes);
    lines.push_back(oss.str());

    lines.push_back("Process RSS: " + bytes_to_human(u64ProcessRss_bytes));

    if (oResult.has_error())
    {
        lines.push_back(std::string("ERROR: ") + error_kind_name(oResult.eErrorKind) + ": " + oResult.strErrorMessage);
    }
    return lines;
}

const char *run_status(const BenchmarkResult &oResult, bool bStopRequested)
{
    if (!oResult.bOk)
    {
        return "FAILED";
    }
    return bStopRequested ? "STOPPED" : "DONE";
}

std::string format_probe_warning(const MemoryInfo &sInfo)
{
    if (!is_probe_degraded(sInfo))
    {
        return std::string();
    }
    return std::string("WARNING: ") + error_kind_name(ERROR_PROBE_DEGRADED)
           + ": Could not read the system memory size, falling back to "
           + bytes_to_human(plan_allocation(sInfo).u64Target_bytes);
}

std::string result_csv_header()
{
    return "ok,error,allocated_bytes,duration_s,loops,write_bytes,read_bytes,write_time_s,read_time_s,"
           "write_GBps,read_GBps,total_GBps,checksum";
}

std::string format_result_csv(const BenchmarkResult &oResult)
{
    std::ostringstream oss;
    oss << (oResult.bOk ? 1 : 0) << "," << error_kind_name(oResult.eErrorKind) << ","
        << oResult.u64Allocated_bytes << "," << oResult.dConfiguredDuration_s << "," << oResult.i64LoopCount << ","
        << oResult.u64Write_bytes << "," << oResult.u64Read_bytes << ","
        << std::setprecision(6) << oResult.dWriteTime_s << "," << oResult.dReadTime_s << ","
        << oResult.write_GBps() << "," << oResult.read_GBps() << "," << oResult.total_GBps() << ","
        << format_checksum(oResult.u32Checksum);
    return oss.str();
}
