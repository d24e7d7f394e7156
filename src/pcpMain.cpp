#include <sys/stat.h>
#include <sys/utsname.h>
#include <fcntl.h>
#include <getopt.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>
#include "pcpMain.hpp"
#include "Config.hpp"
#include "CopyScheduler.hpp"
#include "Log.hpp"
#include "ProgressDisplay.hpp"
#include "SizeEstimator.hpp"
#include "Util.hpp"

namespace
{
    struct OsVersion
    {
        std::string osName;
        int32_t majorVersion = -1;
        int32_t minorVersion = -1;
    };

    OsVersion getOsVersion()
    {
        utsname utsname = {};
        uname(&utsname);

        OsVersion version;
        version.osName = utsname.sysname;

        std::string acc;
        for (int32_t i = 0; utsname.release[i] != '\0'; i++)
        {
            char c = utsname.release[i];
            if (isdigit(c))
            {
                acc.push_back(c);
            }
            else if (c == '.' && !acc.empty())
            {
                if (version.majorVersion == -1)
                {
                    version.majorVersion = std::stoi(acc);
                }
                else
                {
                    version.minorVersion = std::stoi(acc);
                    break;
                }
                acc.clear();
            }
            else
            {
                break;
            }
        }

        return version;
    }

    void printUsage(const char* programName)
    {
        fprintf(stderr, "Usage: %s [OPTION]... SOURCE... DEST\n", programName);
        fputs("Copy SOURCE files and directories into the existing directory DEST, several at a time.\n"
              "\n"
              "  -r, --recursive     copy directories and everything in them\n"
              "  -f, --force         overwrite existing files without asking (overrides -i)\n"
              "  -i, --interactive   ask before overwriting an existing top level entry\n", stderr);
        fprintf(stderr, "  -p, --parallel=N    number of sources to copy at once (default %zu, max %zu)\n",
                Config::DEFAULT_PARALLELISM, CopyScheduler::clampConcurrency(SIZE_MAX));
        fputs("  -q, --quiet         no progress display and no log output\n"
              "  -v, --verbose       more log output, can be repeated\n"
              "  -h, --help          show this help\n", stderr);
    }

    bool askOverwrite(const std::string& target)
    {
        fprintf(stderr, "overwrite '%s'? [y/N] ", target.c_str());
        fflush(stderr);

        char answer[64] = {};
        if (!fgets(answer, sizeof(answer), stdin))
            return false;

        return answer[0] == 'y' || answer[0] == 'Y';
    }

    // Sources the scheduler would reject anyway are left out, they'd only add noise to the estimate
    SizeEstimate estimateSources(const std::vector<std::string>& sources, bool recursive)
    {
        SizeEstimate total;
        for (const std::string& source : sources)
        {
            struct stat64 st = {};
            if (stat64(source.c_str(), &st) != 0)
                continue;
            if (S_ISDIR(st.st_mode) && !recursive)
                continue;

            SizeEstimate estimate = estimateSize(source);
            total.fileCount += estimate.fileCount;
            total.totalBytes += estimate.totalBytes;
        }
        return total;
    }
}

int pcpMain(int argc, char** argv)
{
    OsVersion osVersion = getOsVersion();
    if (osVersion.osName != "Linux")
    {
        fprintf(stderr, "How did you even compile this on %s?\n", osVersion.osName.c_str());
        return 1;
    }
    if (osVersion.majorVersion < 5 || (osVersion.majorVersion == 5 && osVersion.minorVersion < 6))
    {
        fputs("Sorry, pcp requires at least Linux 5.6\n", stderr);
        return 1;
    }

    bool recursive = false;
    bool force = false;
    bool interactive = false;
    bool quiet = false;
    int32_t verbosity = 0;
    size_t parallel = Config::DEFAULT_PARALLELISM;

    static const option longOptions[] =
    {
        {"recursive", no_argument, nullptr, 'r'},
        {"force", no_argument, nullptr, 'f'},
        {"interactive", no_argument, nullptr, 'i'},
        {"parallel", required_argument, nullptr, 'p'},
        {"quiet", no_argument, nullptr, 'q'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    // pcpMain can be called more than once in a process (the tests do), so reset getopt
    optind = 1;

    int c = 0;
    while ((c = getopt_long(argc, argv, "rfip:qvh", longOptions, nullptr)) != -1)
    {
        switch (c)
        {
            case 'r':
                recursive = true;
                break;
            case 'f':
                force = true;
                break;
            case 'i':
                interactive = true;
                break;
            case 'p':
            {
                char* end = nullptr;
                errno = 0;
                unsigned long value = strtoul(optarg, &end, 10);
                if (errno != 0 || end == optarg || *end != '\0' || value == 0)
                {
                    fprintf(stderr, "Invalid parallel level \"%s\"\n", optarg);
                    return 1;
                }
                parallel = size_t(value);
                break;
            }
            case 'q':
                quiet = true;
                break;
            case 'v':
                verbosity++;
                break;
            case 'h':
                printUsage(argv[0]);
                return 0;
            default:
                printUsage(argv[0]);
                return 1;
        }
    }

    if (argc - optind < 2)
    {
        printUsage(argv[0]);
        return 1;
    }

    Config::LOG_LEVEL = quiet ? -1 : std::min(int32_t(LogLevel::Warn) + verbosity, int32_t(LogLevel::Debug));

    std::vector<std::string> sources(argv + optind, argv + argc - 1);
    std::string dest = argv[argc - 1];

    {
        struct statx destStat = {};
        int destStatResult = retrySyscall([&]()
        {
            statx(AT_FDCWD, dest.c_str(), 0, STATX_TYPE, &destStat);
        });

        if (destStatResult == ENOENT)
        {
            fprintf(stderr, "Destination path does not exist: \"%s\"\n", dest.c_str());
            return 1;
        }
        if (destStatResult != 0)
        {
            fprintf(stderr, "Failed to stat \"%s\": \"%s\"\n", dest.c_str(), strerror(destStatResult));
            return 1;
        }
        if (!S_ISDIR(destStat.stx_mode))
        {
            fprintf(stderr, "Destination path is not a directory: \"%s\"\n", dest.c_str());
            return 1;
        }
    }

    if (interactive && !force)
    {
        std::vector<std::string> confirmed;
        for (std::string& source : sources)
        {
            std::string target = joinPath(dest, CopyScheduler::targetName(source));
            if (access(target.c_str(), F_OK) == 0 && !askOverwrite(target))
            {
                log_info("Skipping \"%s\"", source.c_str());
                continue;
            }
            confirmed.emplace_back(std::move(source));
        }
        sources.swap(confirmed);
    }

    CopyScheduler scheduler(parallel);
    log_debug("Using parallel level: %zu (requested %zu)", scheduler.getConcurrency(), parallel);

    std::unique_ptr<ProgressDisplay> progressDisplay;
    if (!quiet && (ProgressDisplay::canShow() || logLevelEnabled(LogLevel::Info)))
    {
        SizeEstimate estimate = estimateSources(sources, recursive);
        log_info("Total files to copy: %lu, total size: %s", estimate.fileCount, humanFriendlyFileSize(estimate.totalBytes).c_str());

        if (ProgressDisplay::canShow())
        {
            progressDisplay = std::make_unique<ProgressDisplay>(scheduler, estimate);
            progressDisplay->start();
        }
    }

    bool failed = scheduler.run(sources, dest, recursive);

    if (progressDisplay)
        progressDisplay->stop();

    if (failed)
        log_error("%u of %u entries failed", scheduler.getFailedCount(), scheduler.getFailedCount() + scheduler.getSucceededCount());

    return int(failed);
}
