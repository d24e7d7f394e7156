#include "SizeEstimator.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <cstring>
#include <vector>
#include "Config.hpp"
#include "ScopedFileDescriptor.hpp"
#include "Util.hpp"

SizeEstimate estimateSize(const std::string& path)
{
    SizeEstimate estimate;

    std::vector<std::string> stack;
    stack.emplace_back(path);

    std::vector<uint8_t> dirBuffer;
    bool topLevel = true;

    while (!stack.empty())
    {
        std::string current = std::move(stack.back());
        stack.pop_back();

        // The top level entry is what the user named, so follow it if it's a link
        struct statx sb = {};
        int statFlags = topLevel ? 0 : AT_SYMLINK_NOFOLLOW;
        topLevel = false;

        if (std::holds_alternative<Error>(myStatx(AT_FDCWD, current, statFlags, STATX_TYPE | STATX_SIZE, sb)))
            continue;

        if (S_ISREG(sb.stx_mode))
        {
            estimate.fileCount++;
            estimate.totalBytes += sb.stx_size;
        }
        else if (S_ISDIR(sb.stx_mode))
        {
            ScopedFileDescriptor dirFd;
            if (std::holds_alternative<Error>(dirFd.open(current, O_RDONLY | O_DIRECTORY | O_CLOEXEC, 0)))
                continue;

            if (dirBuffer.empty())
                dirBuffer.resize(Config::DIRENT_BUFFER_SIZE);

            if (current.back() != '/')
                current += '/';

            while (true)
            {
                GetDentsResult result = myGetDents(dirFd.getFd(), current, dirBuffer.data(), dirBuffer.size());
                if (std::holds_alternative<Error>(result) || std::get<size_t>(result) == 0)
                    break;

                size_t written = std::get<size_t>(result);
                uint8_t* nextPtr = dirBuffer.data();
                while (nextPtr < dirBuffer.data() + written)
                {
                    linux_dirent64* entry = reinterpret_cast<linux_dirent64*>(nextPtr);
                    nextPtr += entry->d_reclen;

                    if (strcmp(entry->d_name, ".") != 0 && strcmp(entry->d_name, "..") != 0)
                        stack.emplace_back(current + entry->d_name);
                }
            }
        }
    }

    return estimate;
}
