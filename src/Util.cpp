#include "Util.hpp"
#include "Assert.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <cstring>
#include <unistd.h>
#include <dirent.h>
#include <iomanip>
#include <sstream>
#include <string_view>
#include <vector>

Result recursiveMkdir(const std::string& path)
{
    using namespace std::string_literals;

    auto mkdirOne = [](const std::string& onePath) -> Result
    {
        int err = retrySyscall([&]()
        {
            mkdir(onePath.c_str(), 0777);
        });

        if (err == EEXIST)
        {
            struct stat64 st = {};
            if (stat64(onePath.c_str(), &st) != 0)
                return Error("Failed to stat \""s + onePath + "\": \""s + strerror(errno) + "\""s);
            if (!S_ISDIR(st.st_mode))
                return Error("Couldn't create directory \""s + onePath + "\": a file with that name already exists"s);
        }
        else if (err != 0)
        {
            return Error("Couldn't create directory \""s + onePath + "\": \""s + strerror(err) + "\""s);
        }

        return Success();
    };

    for (size_t i = 1; i < path.size(); i++)
    {
        if (path[i] == '/' && path[i - 1] != '/')
        {
            Result result = mkdirOne(path.substr(0, i));
            if (std::holds_alternative<Error>(result))
                return result;
        }
    }

    return mkdirOne(path);
}

OpenResult myOpen(const std::string& path, int oflag, mode_t mode)
{
    using namespace std::string_literals;

    int fd = -1;

    for (int32_t tries = 0; tries < 5; tries++)
    {
        fd = open(path.c_str(), oflag, mode);

        if (fd < 0 && (errno == EINTR || errno == EAGAIN))
            continue;

        break;
    }

    if (fd < 0)
        return Error("Couldn't open \""s + path + "\": \""s + strerror(errno) + "\""s);

    return fd;
}

Result myClose(int fd, const std::string& path)
{
    using namespace std::string_literals;

#   ifndef __linux__
#       error "Need to handle EINTR if this is ever ported. See notes here https://www.man7.org/linux/man-pages/man2/close.2.html"
#   endif

    // On Linux the descriptor is released even when close() reports an error, so never retry
    int err = close(fd);

    if (err < 0)
        return Error("Failure on closing file \""s + path + "\": \""s + strerror(errno) + "\""s);

    return Success();
}

Result myStatx(int fd, const std::string& path, int flags, unsigned int mask, struct statx& buf)
{
    int err = retrySyscall([&]()
    {
        statx(fd, path.c_str(), flags, mask, &buf);
    });

    if (err != 0)
        return Error("Failed to stat \"" + path + "\": \"" + strerror(err) + "\"");

    return Success();
}

GetDentsResult myGetDents(int dfd, const std::string& path, void* buffer, size_t bufferSize)
{
    ssize_t retval = 0;
    int err = retrySyscall([&]()
    {
        retval = getdents64(dfd, buffer, bufferSize);
    });

    if (err != 0)
        return Error("Couldn't read directory \"" + path + "\": \"" + strerror(err) + "\"");

    return size_t(retval);
}

GetCwdResult myGetCwd()
{
    std::string workingDir;
    workingDir.resize(256);
    while (true)
    {
        char* ret = getcwd(workingDir.data(), workingDir.size());
        if (ret)
            break;

        if (errno != ERANGE)
            return Error(std::string("Couldn't get the current working directory: \"") + strerror(errno) + "\"");

        workingDir.resize(workingDir.size() * 2);
    }
    workingDir.resize(strlen(workingDir.data()));

    return workingDir;
}

std::string normalizePath(const std::string& path, const std::string& workingDirectory)
{
    std::string joined = (!path.empty() && path[0] == '/') ? path : workingDirectory + "/" + path;

    std::vector<std::string_view> components;

    size_t start = 0;
    while (start <= joined.size())
    {
        size_t end = joined.find('/', start);
        if (end == std::string::npos)
            end = joined.size();

        std::string_view component(joined.data() + start, end - start);

        if (component == "..")
        {
            if (!components.empty())
                components.pop_back();
        }
        else if (!component.empty() && component != ".")
        {
            components.push_back(component);
        }

        start = end + 1;
    }

    if (components.empty())
        return "/";

    std::string normalized;
    for (std::string_view component : components)
    {
        normalized += '/';
        normalized += component;
    }

    return normalized;
}

bool isPathInside(const std::string& parent, const std::string& child)
{
    if (parent == "/")
        return child.size() > 1 && child[0] == '/';

    return child.size() > parent.size() &&
           child.compare(0, parent.size(), parent) == 0 &&
           child[parent.size()] == '/';
}

std::string pathBasename(const std::string& path)
{
    size_t end = path.size();
    while (end > 0 && path[end - 1] == '/')
        end--;

    size_t start = end;
    while (start > 0 && path[start - 1] != '/')
        start--;

    return path.substr(start, end - start);
}

std::string joinPath(const std::string& directory, const std::string& name)
{
    if (directory.empty())
        return name;
    if (directory.back() == '/')
        return directory + name;
    return directory + "/" + name;
}

std::string truncateFilename(const std::string& name, size_t width)
{
    static constexpr std::string_view ellipsis = "...";

    if (name.size() <= width)
        return name;

    if (width <= ellipsis.size())
        return name.substr(0, width);

    size_t keep = width - ellipsis.size();
    size_t front = (keep + 1) / 2;
    size_t back = keep - front;

    std::string truncated = name.substr(0, front);
    truncated += ellipsis;
    truncated += name.substr(name.size() - back);

    debug_assert(truncated.size() == width);
    return truncated;
}

std::string humanFriendlyFileSize(uint64_t bytes)
{
    uint64_t kibibyte = 1024;
    uint64_t mebibyte = kibibyte * 1024;
    uint64_t gibibyte = mebibyte * 1024;
    uint64_t tebibyte = gibibyte * 1024;

    double final = double(bytes);
    std::string unit = "B";

    if (bytes >= tebibyte)
    {
        final = double(bytes) / double(tebibyte);
        unit = "TiB";
    }
    else if (bytes >= gibibyte)
    {
        final = double(bytes) / double(gibibyte);
        unit = "GiB";
    }
    else if (bytes >= mebibyte)
    {
        final = double(bytes) / double(mebibyte);
        unit = "MiB";
    }
    else if (bytes >= kibibyte)
    {
        final = double(bytes) / double(kibibyte);
        unit = "KiB";
    }

    std::stringstream ss;
    ss << std::fixed << std::setprecision(2) << final << " " << unit;
    return ss.str();
}
