#include <stdint.h>
#include <csignal>
#include <iostream>
#include <iomanip>
#include <string>
#include <thread>
#include <chrono>
#include <memory>
#include <vector>
#include <boost/program_options.hpp>
#include <omp.h>

#include "allocationPlan.hpp"
#include "benchmarkRun.hpp"
#include "memInfoProbe.hpp"
#include "memSpeedTest.hpp"
#include "reporting.hpp"
#include "Utils.hpp"

#define DEFAULT_DURATION_MINUTES 1.0
#define DEFAULT_POLL_INTERVAL_MS 120

/// Set from the signal handler, turned into a cancel() by the polling loop
static volatile std::sig_atomic_t g_iStopRequested = 0;

static void on_stop_signal(int)
{
    g_iStopRequested = 1;
}

int main(int argc, char** argv){
    /// Set up command line arguments
    boost::program_options::options_description clDescription("Allowed options");
    clDescription.add_options()
        ("help,h", "Produce help message")
        ("minutes,m", boost::program_options::value<double>()->default_value(DEFAULT_DURATION_MINUTES), "Number of minutes to run the test for")
        ("seconds,s", boost::program_options::value<double>(), "Number of seconds to run the test for. Overrides --minutes")
        ("size_mb,z", boost::program_options::value<int64_t>()->default_value(0), "Size of the buffer in MiB. 0 sizes it to use as close to 100% of RAM as possible")
        ("huge_pages,p", "Back the buffer with huge pages. The OS needs to be configured for them")
        ("csv,c", "Disables all human readable text and instead outputs the data in a csv format for easier exporting to external programs")
        ("poll_ms,i", boost::program_options::value<int64_t>()->default_value(DEFAULT_POLL_INTERVAL_MS), "Milliseconds between checks for progress")
    ;

    boost::program_options::variables_map clVariableMap;
    try
    {
        boost::program_options::store(boost::program_options::parse_command_line(argc, argv, clDescription), clVariableMap);
        boost::program_options::notify(clVariableMap);
    }
    catch (const boost::program_options::error &e)
    {
        std::cout << "ERROR: " << e.what() << std::endl;
        std::cout << clDescription << "\n";
        return -1;
    }

    // Retrieve and sanitise command line arguments
    bool bCsvMode = false;
    if (clVariableMap.count("csv"))
    {
        bCsvMode=true;
    }

    if(!bCsvMode)
    {
        std::cout << "================================================================================" << std::endl;
        std::cout << "RAM Speed Test" << std::endl;
        std::cout << std::endl;
    }

    if (clVariableMap.count("help"))
    {
        std::cout << clDescription << "\n";
        return 1;
    }

    double dDuration_s = clVariableMap["minutes"].as<double>() * 60.0;
    if (clVariableMap.count("seconds"))
    {
        dDuration_s = clVariableMap["seconds"].as<double>();
    }
    if(!(dDuration_s > 0.0)){
        std::cout << "ERROR: Test duration needs to be greater than 0" << std::endl;
        return -1;
    }

    int64_t i64SizeOverride_MiB = clVariableMap["size_mb"].as<int64_t>();
    if(i64SizeOverride_MiB < 0){
        std::cout << "ERROR: Buffer size can not be negative" << std::endl;
        return -1;
    }
    uint64_t u64SizeOverride_bytes = 0;
    if(!mib_to_bytes(i64SizeOverride_MiB, u64SizeOverride_bytes)){
        std::cout << "ERROR: Buffer size of " << i64SizeOverride_MiB << " MiB is too large" << std::endl;
        return -1;
    }

    int64_t i64PollInterval_ms = clVariableMap["poll_ms"].as<int64_t>();
    if(i64PollInterval_ms <= 0){
        std::cout << "ERROR: Poll interval needs to be greater than 0" << std::endl;
        return -1;
    }
    bool bUseHugePages = clVariableMap.count("huge_pages") != 0;

    //Size the buffer
    MemoryInfo sMemoryBefore = probe_memory();
    AllocationPlan sPlan;
    if (i64SizeOverride_MiB > 0)
    {
        sPlan = plan_fixed_allocation(u64SizeOverride_bytes);
    }
    else
    {
        std::string strProbeWarning = format_probe_warning(sMemoryBefore);
        if (!strProbeWarning.empty())
        {
            std::cerr << strProbeWarning << std::endl;
        }
        sPlan = plan_allocation(sMemoryBefore);
    }

    if(!bCsvMode)
    {
        std::cout << "--- START " << get_timestamp() << " ---" << std::endl;
        std::cout << "Target allocation" << (i64SizeOverride_MiB > 0 ? ": " : " (near 100%): ")
                  << bytes_to_human(sPlan.u64Target_bytes) << std::endl;
        std::cout << "System RAM total: " << bytes_to_human(sMemoryBefore.u64Total_bytes)
                  << " | available: " << bytes_to_human(sMemoryBefore.u64Available_bytes) << std::endl;
        std::cout << "Duration: " << std::fixed << std::setprecision(2) << dDuration_s / 60.0 << " minutes" << std::endl;
        std::cout << "Priming threads: " << omp_get_max_threads() << (bUseHugePages ? " | huge pages" : "") << std::endl;
        std::cout << "WARNING: Using nearly all RAM may make the system slow or unresponsive while the test runs" << std::endl;
        std::cout << std::endl;
    }
    else
    {
        std::cout << progress_csv_header() << std::endl;
    }

    std::signal(SIGINT, on_stop_signal);
    std::signal(SIGTERM, on_stop_signal);

    std::unique_ptr<BenchmarkRun> pRun = BenchmarkRun::start(sPlan.u64Target_bytes, dDuration_s, bUseHugePages);
    if (!pRun)
    {
        std::cout << "ERROR: A benchmark is already running" << std::endl;
        return -1;
    }

    //Poll the worker until it reports its terminal result
    BenchmarkResult oResult;
    bool bFinished = false;
    bool bCancelRequested = false;
    while (!bFinished)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(i64PollInterval_ms));
        if (g_iStopRequested && !bCancelRequested)
        {
            bCancelRequested = true;
            pRun->cancel();
            if(!bCsvMode)
            {
                std::cout << "Stopping..." << std::endl;
            }
        }

        std::vector<ChannelMessage> messages = pRun->poll();
        for (size_t i = 0; i < messages.size(); i++)
        {
            if (messages[i].is_terminal())
            {
                oResult = messages[i].oResult;
                bFinished = true;
            }
            else if(!bCsvMode)
            {
                std::cout << format_progress_line(messages[i].sProgress, MemSpeedTest::clamp_duration(dDuration_s)) << std::endl;
            }
            else
            {
                std::cout << format_progress_csv(messages[i].sProgress) << std::endl;
            }
        }
    }
    pRun.reset();

    if(!bCsvMode)
    {
        std::cout << std::endl;
        std::vector<std::string> summary = format_result_summary(oResult, probe_memory(), get_process_rss());
        for (size_t i = 0; i < summary.size(); i++)
        {
            std::cout << summary[i] << std::endl;
        }
        std::cout << std::endl;
        std::cout << "Status: " << run_status(oResult, bCancelRequested) << std::endl;
        std::cout << "================================================================================" << std::endl;
    }
    else
    {
        std::cout << result_csv_header() << std::endl;
        std::cout << format_result_csv(oResult) << std::endl;
    }

    return oResult.has_error() ? 2 : 0;
}
