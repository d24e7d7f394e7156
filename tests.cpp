#include <atomic>
#include <filesystem>
#include <functional>
#include <fcntl.h>
#include <spawn.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>
#include "Assert.hpp"
#include "Config.hpp"
#include "CopyScheduler.hpp"
#include "FileCopier.hpp"
#include "Heap.hpp"
#include "ProgressDisplay.hpp"
#include "SizeEstimator.hpp"
#include "TreeWalker.hpp"
#include "Util.hpp"
#include "pcpMain.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wclobbered"
#pragma GCC diagnostic ignored "-Wunused-function"
#include <acutest.h>
#pragma GCC diagnostic pop

std::string makeTestDir()
{
    char pathTemplate[] = "/tmp/pcp_test_XXXXXX";
    TEST_ASSERT(mkdtemp(pathTemplate) != nullptr);
    return pathTemplate;
}

void writeFile(const std::string& path, const std::string& contents)
{
    FILE* f = fopen(path.c_str(), "wb");
    TEST_ASSERT(f != nullptr);
    if (!contents.empty())
        TEST_ASSERT(fwrite(contents.data(), 1, contents.size(), f) == contents.size());
    TEST_ASSERT(fclose(f) == 0);
}

std::string readWholeFile(const std::string& path)
{
    FILE* f = fopen(path.c_str(), "rb");
    TEST_ASSERT(f != nullptr);

    std::string data;
    char buffer[4096];
    size_t read = 0;
    while ((read = fread(buffer, 1, sizeof(buffer), f)) > 0)
        data.append(buffer, read);

    TEST_ASSERT(ferror(f) == 0);
    TEST_ASSERT(fclose(f) == 0);
    return data;
}

std::string randomContents(size_t size)
{
    std::string data;
    data.resize(size);
    for (size_t i = 0; i < size; i++)
        data[i] = char(rand() & 0xFF);
    return data;
}

bool pathExists(const std::string& path)
{
    struct stat64 st = {};
    return lstat64(path.c_str(), &st) == 0;
}

// Builds the same nested tree wherever it's asked to, with the given root
void createTestTree(const std::string& root)
{
    TEST_ASSERT(std::holds_alternative<nullptr_t>(recursiveMkdir(root + "/subdir/another")));
    TEST_ASSERT(std::holds_alternative<nullptr_t>(recursiveMkdir(root + "/empty")));
    writeFile(root + "/file1.txt", "root file");
    writeFile(root + "/subdir/file2.txt", "nested file");
    writeFile(root + "/subdir/another/file3.txt", "deeply nested");
    writeFile(root + "/subdir/another/zero", "");
}

void assertFoldersEqual(const std::string& a, const std::string& b)
{
    // We just spawn diff, it's a known good implementation
    const char* argv[] = {"/usr/bin/diff", "-r", a.c_str(), b.c_str(), nullptr};

    pid_t pid = 0;
    int err = posix_spawn(&pid, argv[0], nullptr, nullptr, (char**)argv, environ);
    TEST_ASSERT(err == 0);
    TEST_ASSERT(waitpid(pid, &err, 0) != -1);
    TEST_ASSERT(err == 0);
}

void runWithAllPartialModes(const std::function<void(void)>& func)
{
    for (bool partialReads : {false, true})
    {
        for (bool partialWrites : {false, true})
        {
            Config::DEBUG_FORCE_PARTIAL_READS = partialReads;
            Config::DEBUG_FORCE_PARTIAL_WRITES = partialWrites;
            TEST_CASE_("partial reads: %d, partial writes: %d", int(partialReads), int(partialWrites));
            func();
        }
    }

    Config::DEBUG_FORCE_PARTIAL_READS = false;
    Config::DEBUG_FORCE_PARTIAL_WRITES = false;
}

std::string getWorkingDir()
{
    GetCwdResult result = myGetCwd();
    TEST_ASSERT(std::holds_alternative<std::string>(result));
    return std::get<std::string>(result);
}

int callPcpMain(std::vector<std::string> args)
{
    args.insert(args.begin(), "pcp");

    std::vector<char*> argv;
    for (std::string& arg : args)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    return pcpMain(int(args.size()), argv.data());
}

class TestContainer
{
public:
    static void CopySmallFile()
    {
        runWithAllPartialModes([]() {
            std::string base = makeTestDir();
            std::string srcFile = base + "/small";
            std::string destFile = base + "/small_copy";
            writeFile(srcFile, "hello world");

            ProgressCounter taskProgress;
            ProgressCounter runProgress;
            CopyFileResult result = copyFile(srcFile, destFile, &taskProgress, &runProgress);

            TEST_ASSERT(std::holds_alternative<uint64_t>(result));
            TEST_CHECK(std::get<uint64_t>(result) == 11);
            TEST_CHECK(readWholeFile(destFile) == "hello world");
            TEST_CHECK(taskProgress.get() == 11);
            TEST_CHECK(runProgress.get() == 11);

            std::filesystem::remove_all(base);
        });
    }

    static void CopyEmptyFile()
    {
        std::string base = makeTestDir();
        writeFile(base + "/empty", "");

        CopyFileResult result = copyFile(base + "/empty", base + "/empty_copy");

        TEST_ASSERT(std::holds_alternative<uint64_t>(result));
        TEST_CHECK(std::get<uint64_t>(result) == 0);
        TEST_CHECK(pathExists(base + "/empty_copy"));
        TEST_CHECK(readWholeFile(base + "/empty_copy").empty());

        std::filesystem::remove_all(base);
    }

    static void CopyMultiChunkFileSyncsPeriodically()
    {
        runWithAllPartialModes([]() {
            std::string base = makeTestDir();
            std::string contents = randomContents(100000);
            writeFile(base + "/big", contents);

            size_t chunkSize = 4096;
            size_t syncThreshold = chunkSize * 4;
            Heap heap(2, chunkSize);
            FileCopier copier(heap, syncThreshold);

            ProgressCounter progress;
            CopyFileResult result = copier.copyFile(base + "/big", base + "/big_copy", &progress);

            TEST_ASSERT(std::holds_alternative<uint64_t>(result));
            TEST_CHECK(std::get<uint64_t>(result) == contents.size());
            TEST_CHECK(progress.get() == contents.size());
            TEST_CHECK(readWholeFile(base + "/big_copy") == contents);

            // 24 full chunks, a sync after every fourth. Forced short reads make the chunks smaller, so fewer syncs.
            if (Config::DEBUG_FORCE_PARTIAL_READS)
                TEST_CHECK(copier.getDataSyncCount() > 0 && copier.getDataSyncCount() <= 6);
            else
                TEST_CHECK(copier.getDataSyncCount() == 6);

            std::filesystem::remove_all(base);
        });
    }

    static void CopyFileOverwritesExisting()
    {
        std::string base = makeTestDir();
        writeFile(base + "/src", "short");
        writeFile(base + "/dest", "a much longer piece of existing content");

        CopyFileResult result = copyFile(base + "/src", base + "/dest");

        TEST_ASSERT(std::holds_alternative<uint64_t>(result));
        TEST_CHECK(readWholeFile(base + "/dest") == "short");

        std::filesystem::remove_all(base);
    }

    static void CopyFileKeepsPermissions()
    {
        umask(022);

        std::string base = makeTestDir();
        writeFile(base + "/script", "#!/bin/sh\n");
        TEST_ASSERT(chmod((base + "/script").c_str(), 0750) == 0);

        CopyFileResult result = copyFile(base + "/script", base + "/script_copy");
        TEST_ASSERT(std::holds_alternative<uint64_t>(result));

        struct stat64 st = {};
        TEST_ASSERT(stat64((base + "/script_copy").c_str(), &st) == 0);
        TEST_CHECK((st.st_mode & 07777) == 0750);

        std::filesystem::remove_all(base);
    }

    static void CopyFileMissingSourceFails()
    {
        std::string base = makeTestDir();

        CopyFileResult result = copyFile(base + "/does_not_exist", base + "/dest");

        TEST_ASSERT(std::holds_alternative<Error>(result));
        TEST_CHECK(std::get<Error>(result).kind == Error::Kind::Io);
        TEST_CHECK(!pathExists(base + "/dest"));

        std::filesystem::remove_all(base);
    }

    static void CopyFileOntoItselfFails()
    {
        std::string base = makeTestDir();
        writeFile(base + "/file", "precious");

        CopyFileResult result = copyFile(base + "/file", base + "/./file");

        TEST_ASSERT(std::holds_alternative<Error>(result));
        TEST_CHECK(readWholeFile(base + "/file") == "precious");

        std::filesystem::remove_all(base);
    }

    static void CopyNestedDirectory()
    {
        std::string base = makeTestDir();
        createTestTree(base + "/source");

        ProgressCounter progress;
        Result result = copyDirectoryTree(base + "/source", base + "/dest", &progress);

        TEST_ASSERT(std::holds_alternative<nullptr_t>(result));
        assertFoldersEqual(base + "/source", base + "/dest");
        TEST_CHECK(pathExists(base + "/dest/empty"));
        TEST_CHECK(progress.get() == estimateSize(base + "/source").totalBytes);

        std::filesystem::remove_all(base);
    }

    static void CopyEmptyDirectory()
    {
        std::string base = makeTestDir();
        TEST_ASSERT(mkdir((base + "/source").c_str(), S_IRWXU) == 0);

        Result result = copyDirectoryTree(base + "/source", base + "/dest");

        TEST_ASSERT(std::holds_alternative<nullptr_t>(result));
        TEST_CHECK(std::filesystem::is_directory(base + "/dest"));
        TEST_CHECK(std::filesystem::is_empty(base + "/dest"));

        std::filesystem::remove_all(base);
    }

    static void CopyDirectoryIntoItselfFails()
    {
        std::string base = makeTestDir();
        std::string source = base + "/source";
        createTestTree(source);

        for (const std::string& dest : {source + "/sub", source + "/sub/deeper/deepest", source + "/subdir/../x"})
        {
            TEST_CASE(dest.c_str());

            Result result = copyDirectoryTree(source, dest);

            TEST_ASSERT(std::holds_alternative<Error>(result));
            TEST_CHECK(std::get<Error>(result).kind == Error::Kind::DestinationInsideSource);
        }

        // Nothing was created inside the source
        TEST_CHECK(!pathExists(source + "/sub"));
        TEST_CHECK(!pathExists(source + "/x"));

        std::filesystem::remove_all(base);
    }

    static void CopyDirectoryToSiblingSucceeds()
    {
        std::string base = makeTestDir();
        std::string source = base + "/source";
        createTestTree(source);

        // Shares a string prefix with the source, but isn't inside it
        Result result = copyDirectoryTree(source, base + "/source2");
        TEST_ASSERT(std::holds_alternative<nullptr_t>(result));
        assertFoldersEqual(source, base + "/source2");

        result = copyDirectoryTree(source, base + "/elsewhere/nested/dest");
        TEST_ASSERT(std::holds_alternative<nullptr_t>(result));
        assertFoldersEqual(source, base + "/elsewhere/nested/dest");

        std::filesystem::remove_all(base);
    }

    static void CopyDirectoryRelativePaths()
    {
        std::string base = makeTestDir();
        createTestTree(base + "/source");

        std::string workingDirSaved = getWorkingDir();
        TEST_ASSERT(chdir(base.c_str()) == 0);

        Result inside = copyDirectoryTree("source", "./source/../source/inner");
        Result outside = copyDirectoryTree("./source/", "source/../dest");

        TEST_ASSERT(chdir(workingDirSaved.c_str()) == 0);

        TEST_ASSERT(std::holds_alternative<Error>(inside));
        TEST_CHECK(std::get<Error>(inside).kind == Error::Kind::DestinationInsideSource);

        TEST_ASSERT(std::holds_alternative<nullptr_t>(outside));
        assertFoldersEqual(base + "/source", base + "/dest");

        std::filesystem::remove_all(base);
    }

    static void CopyDirectorySkipsSymlinks()
    {
        std::string base = makeTestDir();
        std::string source = base + "/source";
        createTestTree(source);
        TEST_ASSERT(symlink("file1.txt", (source + "/link").c_str()) == 0);
        TEST_ASSERT(symlink("..", (source + "/subdir/loop").c_str()) == 0);

        Result result = copyDirectoryTree(source, base + "/dest");

        TEST_ASSERT(std::holds_alternative<nullptr_t>(result));
        TEST_CHECK(!pathExists(base + "/dest/link"));
        TEST_CHECK(!pathExists(base + "/dest/subdir/loop"));
        TEST_CHECK(readWholeFile(base + "/dest/subdir/another/file3.txt") == "deeply nested");

        std::filesystem::remove_all(base);
    }

    static void NormalizePath()
    {
        TEST_CHECK(normalizePath("a/./b/../c", "/home/user") == "/home/user/a/c");
        TEST_CHECK(normalizePath("/abs/path/", "/ignored") == "/abs/path");
        TEST_CHECK(normalizePath("../../..", "/one/two") == "/");
        TEST_CHECK(normalizePath("/..", "/") == "/");
        TEST_CHECK(normalizePath(".", "/cwd") == "/cwd");
        TEST_CHECK(normalizePath("x//y", "/cwd") == "/cwd/x/y");
    }

    static void IsPathInside()
    {
        TEST_CHECK(isPathInside("/a/b", "/a/b/c"));
        TEST_CHECK(isPathInside("/a/b", "/a/b/c/d/e"));
        TEST_CHECK(isPathInside("/", "/a"));
        TEST_CHECK(!isPathInside("/a/b", "/a/b"));
        TEST_CHECK(!isPathInside("/a/b", "/a/bc"));
        TEST_CHECK(!isPathInside("/a/b", "/a"));
        TEST_CHECK(!isPathInside("/a/b", "/x/y"));
    }

    static void EstimateSize()
    {
        std::string base = makeTestDir();
        std::string root = base + "/size_test_root";
        TEST_ASSERT(std::holds_alternative<nullptr_t>(recursiveMkdir(root + "/sub/deep")));
        writeFile(root + "/file1.txt", "1");
        writeFile(root + "/sub/file2.txt", "22");
        writeFile(root + "/sub/deep/file3.txt", "333");

        SizeEstimate nested = estimateSize(root);
        TEST_CHECK(nested.fileCount == 3);
        TEST_CHECK(nested.totalBytes == 6);

        SizeEstimate single = estimateSize(root + "/sub/deep/file3.txt");
        TEST_CHECK(single.fileCount == 1);
        TEST_CHECK(single.totalBytes == 3);

        TEST_ASSERT(mkdir((base + "/empty").c_str(), S_IRWXU) == 0);
        SizeEstimate empty = estimateSize(base + "/empty");
        TEST_CHECK(empty.fileCount == 0 && empty.totalBytes == 0);

        SizeEstimate missing = estimateSize(base + "/does_not_exist");
        TEST_CHECK(missing.fileCount == 0 && missing.totalBytes == 0);

        std::filesystem::remove_all(base);
    }

    static void RunCopyReportsMissingSource()
    {
        std::string base = makeTestDir();
        TEST_ASSERT(mkdir((base + "/dest").c_str(), S_IRWXU) == 0);
        writeFile(base + "/a", "12345");

        CopyScheduler scheduler(4);
        bool failed = scheduler.run({base + "/a", base + "/b"}, base + "/dest", false);

        TEST_CHECK(failed);
        TEST_CHECK(scheduler.getSucceededCount() == 1);
        TEST_CHECK(scheduler.getFailedCount() == 1);
        TEST_CHECK(readWholeFile(base + "/dest/a") == "12345");
        TEST_CHECK(scheduler.getProgress().get() == 5);

        std::filesystem::remove_all(base);
    }

    static void RunCopyDirectoryNeedsRecursion()
    {
        std::string base = makeTestDir();
        TEST_ASSERT(mkdir((base + "/dest").c_str(), S_IRWXU) == 0);
        createTestTree(base + "/source");

        TEST_CHECK(runCopy({base + "/source"}, base + "/dest", false, 4));
        TEST_CHECK(!pathExists(base + "/dest/source"));

        TEST_CHECK(!runCopy({base + "/source/"}, base + "/dest", true, 4));
        assertFoldersEqual(base + "/source", base + "/dest/source");

        std::filesystem::remove_all(base);
    }

    static void RunCopyConcurrencyDoesNotChangeResult()
    {
        std::string base = makeTestDir();
        std::vector<std::string> sources;
        for (int32_t i = 0; i < 3; i++)
        {
            std::string dir = base + "/input/dir" + std::to_string(i);
            createTestTree(dir);
            writeFile(dir + "/random", randomContents(size_t(5000 * (i + 1))));
            sources.push_back(dir);

            std::string file = base + "/input/file" + std::to_string(i);
            writeFile(file, randomContents(size_t(1000 * (i + 1))));
            sources.push_back(file);
        }
        sources.push_back(base + "/input/missing");

        TEST_ASSERT(mkdir((base + "/serial").c_str(), S_IRWXU) == 0);
        TEST_ASSERT(mkdir((base + "/parallel").c_str(), S_IRWXU) == 0);

        CopyScheduler serial(1);
        CopyScheduler parallel(8);
        bool serialFailed = serial.run(sources, base + "/serial", true);
        bool parallelFailed = parallel.run(sources, base + "/parallel", true);

        TEST_CHECK(serialFailed && parallelFailed);
        TEST_CHECK(serial.getSucceededCount() == 6 && parallel.getSucceededCount() == 6);
        TEST_CHECK(serial.getProgress().get() == parallel.getProgress().get());
        assertFoldersEqual(base + "/serial", base + "/parallel");
        assertFoldersEqual(base + "/input", base + "/parallel");

        std::filesystem::remove_all(base);
    }

    static void RunCopyDuplicateTargetNames()
    {
        std::string base = makeTestDir();
        TEST_ASSERT(mkdir((base + "/a").c_str(), S_IRWXU) == 0);
        TEST_ASSERT(mkdir((base + "/b").c_str(), S_IRWXU) == 0);
        writeFile(base + "/a/data.bin", randomContents(4000));
        writeFile(base + "/b/data.bin", randomContents(3000));
        createTestTree(base + "/x/photos");
        createTestTree(base + "/y/photos");
        writeFile(base + "/y/photos/extra", "only in y");

        std::vector<std::string> sources = {base + "/a/data.bin", base + "/x/photos",
                                            base + "/b/data.bin", base + "/y/photos/"};

        TEST_ASSERT(mkdir((base + "/serial").c_str(), S_IRWXU) == 0);
        TEST_ASSERT(mkdir((base + "/parallel").c_str(), S_IRWXU) == 0);

        CopyScheduler serial(1);
        CopyScheduler parallel(8);
        bool serialFailed = serial.run(sources, base + "/serial", true);
        bool parallelFailed = parallel.run(sources, base + "/parallel", true);

        TEST_CHECK(serialFailed && parallelFailed);
        TEST_CHECK(serial.getSucceededCount() == 2 && parallel.getSucceededCount() == 2);
        TEST_CHECK(serial.getFailedCount() == 2 && parallel.getFailedCount() == 2);
        TEST_CHECK(serial.getProgress().get() == parallel.getProgress().get());
        assertFoldersEqual(base + "/serial", base + "/parallel");

        TEST_CHECK(readWholeFile(base + "/serial/data.bin") == readWholeFile(base + "/a/data.bin"));
        assertFoldersEqual(base + "/x/photos", base + "/serial/photos");
        TEST_CHECK(!pathExists(base + "/serial/photos/extra"));

        std::filesystem::remove_all(base);
    }

    static void RunCopyProgressStartsFromZeroEachRun()
    {
        std::string base = makeTestDir();
        TEST_ASSERT(mkdir((base + "/first").c_str(), S_IRWXU) == 0);
        TEST_ASSERT(mkdir((base + "/second").c_str(), S_IRWXU) == 0);
        writeFile(base + "/big", randomContents(10000));
        writeFile(base + "/small", "1234567");

        CopyScheduler scheduler(2);
        TEST_CHECK(!scheduler.run({base + "/big"}, base + "/first", false));
        TEST_CHECK(scheduler.getProgress().get() == 10000);

        TEST_CHECK(!scheduler.run({base + "/small"}, base + "/second", false));
        TEST_CHECK(scheduler.getProgress().get() == 7);
        TEST_CHECK(scheduler.getSucceededCount() == 1);

        std::filesystem::remove_all(base);
    }

    static void RunCopyWithNothingToDo()
    {
        std::string base = makeTestDir();
        TEST_ASSERT(mkdir((base + "/dest").c_str(), S_IRWXU) == 0);
        TEST_ASSERT(mkdir((base + "/dir").c_str(), S_IRWXU) == 0);

        TEST_CHECK(runCopy({base + "/missing1", base + "/missing2", base + "/dir"}, base + "/dest", false, 2));
        TEST_CHECK(!runCopy({}, base + "/dest", false, 2));
        TEST_CHECK(std::filesystem::is_empty(base + "/dest"));

        std::filesystem::remove_all(base);
    }

    static void RunCopyFileCopiedHook()
    {
        std::string base = makeTestDir();
        TEST_ASSERT(mkdir((base + "/dest").c_str(), S_IRWXU) == 0);
        createTestTree(base + "/source");
        writeFile(base + "/reject_me", "x");

        std::atomic_uint32_t calls = 0;
        CopyScheduler scheduler(2);
        scheduler.setFileCopiedHook([&](const std::string& source, const std::string&, uint64_t) -> Result
        {
            calls++;
            if (pathBasename(source) == "reject_me")
                return Error("verification failed");
            return Success();
        });

        bool failed = scheduler.run({base + "/source", base + "/reject_me"}, base + "/dest", true);

        TEST_CHECK(failed);
        TEST_CHECK(calls == 5);
        TEST_CHECK(scheduler.getFailedCount() == 1);
        assertFoldersEqual(base + "/source", base + "/dest/source");

        std::filesystem::remove_all(base);
    }

    static void ClampConcurrency()
    {
        long cpus = sysconf(_SC_NPROCESSORS_ONLN);
        TEST_ASSERT(cpus > 0);

        TEST_CHECK(CopyScheduler::clampConcurrency(0) == 1);
        TEST_CHECK(CopyScheduler::clampConcurrency(1) == 1);
        TEST_CHECK(CopyScheduler::clampConcurrency(100000) == size_t(cpus));
    }

    static void TargetName()
    {
        TEST_CHECK(CopyScheduler::targetName("dir") == "dir");
        TEST_CHECK(CopyScheduler::targetName("some/dir/") == "dir");
        TEST_CHECK(CopyScheduler::targetName("/abs/file.txt") == "file.txt");
        TEST_CHECK(CopyScheduler::targetName("/abs/dir/.") == "dir");
        TEST_CHECK(CopyScheduler::targetName("/abs/dir/sub/..") == "dir");
    }

    static void TruncateFilename()
    {
        TEST_CHECK(truncateFilename("short.txt", 20) == "short.txt");
        TEST_CHECK(truncateFilename("exactly10!", 10) == "exactly10!");
        TEST_CHECK(truncateFilename("abcdefghijklmnop", 9) == "abc...nop");
        TEST_CHECK(truncateFilename("abcdefghijklmnop", 10) == "abcd...nop");

        std::string longName = "the_start_of_a_really_long_file_name_that_ends_here.tar.gz";
        for (size_t width = 5; width < longName.size(); width++)
        {
            std::string truncated = truncateFilename(longName, width);
            TEST_CHECK(truncated.size() == width);
            TEST_CHECK(truncated.find("...") != std::string::npos);
            TEST_CHECK(truncated.front() == 't' && truncated.back() == 'z');
        }
    }

    static void HumanFriendlyFileSize()
    {
        TEST_CHECK(humanFriendlyFileSize(0) == "0.00 B");
        TEST_CHECK(humanFriendlyFileSize(1536) == "1.50 KiB");
        TEST_CHECK(humanFriendlyFileSize(uint64_t(3) * 1024 * 1024 * 1024) == "3.00 GiB");
    }

    static void ProgressDisplayTruncatesTaskNames()
    {
        CopyScheduler scheduler(1);
        ProgressDisplay display(scheduler, SizeEstimate { 1, 100 });

        std::string longName(100, 'a');
        longName += ".bin";
        std::vector<std::string> lines = display.renderLines(40, 5.0, 0, {CopyScheduler::ActiveTask { longName, 0 }});

        TEST_ASSERT(lines.size() == 3);
        TEST_CHECK(lines[2].size() == 40);
        TEST_CHECK(lines[2].find("...") != std::string::npos);
        TEST_CHECK(lines[2].find(".bin") != std::string::npos);
        TEST_CHECK(lines[0].find("Elapsed: 05s") != std::string::npos);
    }

    static void PcpMainExitCodes()
    {
        std::string base = makeTestDir();
        TEST_ASSERT(mkdir((base + "/dest").c_str(), S_IRWXU) == 0);
        writeFile(base + "/file.txt", "content");
        createTestTree(base + "/source");

        TEST_CHECK(callPcpMain({"-q", base + "/file.txt", base + "/dest"}) == 0);
        TEST_CHECK(readWholeFile(base + "/dest/file.txt") == "content");

        TEST_CHECK(callPcpMain({"-q", base + "/file.txt", base + "/missing", base + "/dest"}) == 1);
        TEST_CHECK(callPcpMain({"-q", base + "/source", base + "/dest"}) == 1);
        TEST_CHECK(callPcpMain({"-q", base + "/file.txt", base + "/no_such_dest"}) == 1);
        TEST_CHECK(callPcpMain({"-q", base + "/source", base + "/file.txt"}) == 1);
        TEST_CHECK(callPcpMain({"-q", "-p", "zero", base + "/file.txt", base + "/dest"}) == 1);
        TEST_CHECK(callPcpMain({base + "/dest"}) == 1);

        TEST_CHECK(callPcpMain({"-q", "-r", "-p", "2", base + "/source", base + "/file.txt", base + "/dest"}) == 0);
        assertFoldersEqual(base + "/source", base + "/dest/source");

        std::filesystem::remove_all(base);
    }
};

TEST_LIST =
{
    {"CopySmallFile", TestContainer::CopySmallFile},
    {"CopyEmptyFile", TestContainer::CopyEmptyFile},
    {"CopyMultiChunkFileSyncsPeriodically", TestContainer::CopyMultiChunkFileSyncsPeriodically},
    {"CopyFileOverwritesExisting", TestContainer::CopyFileOverwritesExisting},
    {"CopyFileKeepsPermissions", TestContainer::CopyFileKeepsPermissions},
    {"CopyFileMissingSourceFails", TestContainer::CopyFileMissingSourceFails},
    {"CopyFileOntoItselfFails", TestContainer::CopyFileOntoItselfFails},
    {"CopyNestedDirectory", TestContainer::CopyNestedDirectory},
    {"CopyEmptyDirectory", TestContainer::CopyEmptyDirectory},
    {"CopyDirectoryIntoItselfFails", TestContainer::CopyDirectoryIntoItselfFails},
    {"CopyDirectoryToSiblingSucceeds", TestContainer::CopyDirectoryToSiblingSucceeds},
    {"CopyDirectoryRelativePaths", TestContainer::CopyDirectoryRelativePaths},
    {"CopyDirectorySkipsSymlinks", TestContainer::CopyDirectorySkipsSymlinks},
    {"NormalizePath", TestContainer::NormalizePath},
    {"IsPathInside", TestContainer::IsPathInside},
    {"EstimateSize", TestContainer::EstimateSize},
    {"RunCopyReportsMissingSource", TestContainer::RunCopyReportsMissingSource},
    {"RunCopyDirectoryNeedsRecursion", TestContainer::RunCopyDirectoryNeedsRecursion},
    {"RunCopyConcurrencyDoesNotChangeResult", TestContainer::RunCopyConcurrencyDoesNotChangeResult},
    {"RunCopyDuplicateTargetNames", TestContainer::RunCopyDuplicateTargetNames},
    {"RunCopyProgressStartsFromZeroEachRun", TestContainer::RunCopyProgressStartsFromZeroEachRun},
    {"RunCopyWithNothingToDo", TestContainer::RunCopyWithNothingToDo},
    {"RunCopyFileCopiedHook", TestContainer::RunCopyFileCopiedHook},
    {"ClampConcurrency", TestContainer::ClampConcurrency},
    {"TargetName", TestContainer::TargetName},
    {"TruncateFilename", TestContainer::TruncateFilename},
    {"HumanFriendlyFileSize", TestContainer::HumanFriendlyFileSize},
    {"ProgressDisplayTruncatesTaskNames", TestContainer::ProgressDisplayTruncatesTaskNames},
    {"PcpMainExitCodes", TestContainer::PcpMainExitCodes},
    {nullptr, nullptr }
};
