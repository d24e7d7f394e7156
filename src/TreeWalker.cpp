#include "TreeWalker.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <dirent.h>
#include <cstring>
#include <vector>
#include "Assert.hpp"
#include "Config.hpp"
#include "Heap.hpp"
#include "Log.hpp"
#include "ScopedFileDescriptor.hpp"

namespace
{
    struct PendingDirectory
    {
        std::string source;
        std::string dest;
    };

    std::string withTrailingSlash(std::string path)
    {
        if (path.empty() || path.back() != '/')
            path += '/';
        return path;
    }

    Result checkNotCopyingIntoSelf(const std::string& from, const std::string& dest, const std::string& workingDirectory)
    {
        std::string fromNormalized = normalizePath(from, workingDirectory);
        std::string destNormalized = normalizePath(dest, workingDirectory);

        if (isPathInside(fromNormalized, destNormalized))
        {
            return Error(Error::Kind::DestinationInsideSource,
                         "Cannot copy a directory into itself: \"" + from + "\" -> \"" + dest + "\"");
        }

        return Success();
    }

    unsigned char typeFromMode(uint16_t mode)
    {
        if (S_ISDIR(mode))
            return DT_DIR;
        if (S_ISREG(mode))
            return DT_REG;
        if (S_ISLNK(mode))
            return DT_LNK;
        if (S_ISFIFO(mode))
            return DT_FIFO;
        if (S_ISCHR(mode))
            return DT_CHR;
        if (S_ISBLK(mode))
            return DT_BLK;
        if (S_ISSOCK(mode))
            return DT_SOCK;
        return DT_UNKNOWN;
    }
}

Result copyDirectoryTree(FileCopier& copier,
                         const std::string& from,
                         const std::string& dest,
                         ProgressCounter* taskProgress,
                         ProgressCounter* runProgress)
{
    std::string workingDirectory;
    {
        GetCwdResult result = myGetCwd();
        if (std::holds_alternative<Error>(result))
            return std::move(std::get<Error>(result));
        workingDirectory = std::move(std::get<std::string>(result));
    }

    std::vector<PendingDirectory> directoryStack;
    directoryStack.push_back(PendingDirectory { withTrailingSlash(from), withTrailingSlash(dest) });

    std::vector<uint8_t> dirBuffer;
    dirBuffer.resize(Config::DIRENT_BUFFER_SIZE);

    while (!directoryStack.empty())
    {
        PendingDirectory current = std::move(directoryStack.back());
        directoryStack.pop_back();

        // Checked again for every subdirectory, not just the top pair: a dest can alias a deeper
        // source directory even when the top level is fine.
        {
            Result result = checkNotCopyingIntoSelf(current.source, current.dest, workingDirectory);
            if (std::holds_alternative<Error>(result))
                return result;
        }

        {
            Result result = recursiveMkdir(current.dest);
            if (std::holds_alternative<Error>(result))
                return result;
        }

        ScopedFileDescriptor currentFd;
        {
            Result result = currentFd.open(current.source, O_RDONLY | O_DIRECTORY | O_CLOEXEC, 0);
            if (std::holds_alternative<Error>(result))
                return result;
        }

        size_t written = 0;
        do
        {
            {
                GetDentsResult result = myGetDents(currentFd.getFd(), current.source, dirBuffer.data(), dirBuffer.size());
                if (std::holds_alternative<Error>(result))
                    return std::move(std::get<Error>(result));

                written = std::get<size_t>(result);
            }

            uint8_t* nextPtr = dirBuffer.data();
            while (nextPtr < dirBuffer.data() + written)
            {
                linux_dirent64* currentEntry = reinterpret_cast<linux_dirent64*>(nextPtr);
                nextPtr += currentEntry->d_reclen;

                if (strcmp(currentEntry->d_name, ".") == 0 || strcmp(currentEntry->d_name, "..") == 0)
                    continue;

                std::string fullPath = current.source + currentEntry->d_name;
                std::string destPath = current.dest + currentEntry->d_name;

                unsigned char type = currentEntry->d_type;

                // Some filesystems don't fill in d_type
                if (type == DT_UNKNOWN)
                {
                    struct statx sb = {};
                    Result result = myStatx(AT_FDCWD, fullPath, AT_SYMLINK_NOFOLLOW, STATX_TYPE, sb);
                    if (std::holds_alternative<Error>(result))
                        return result;

                    type = typeFromMode(sb.stx_mode);
                }

                if (type == DT_DIR)
                {
                    directoryStack.push_back(PendingDirectory { fullPath + '/', destPath + '/' });
                }
                else if (type == DT_REG)
                {
                    CopyFileResult result = copier.copyFile(fullPath, destPath, taskProgress, runProgress);
                    if (std::holds_alternative<Error>(result))
                        return std::move(std::get<Error>(result));

                    log_debug("Copied \"%s\" (%lu bytes)", fullPath.c_str(), std::get<uint64_t>(result));
                }
                else
                {
                    log_warn("Skipping \"%s\": not a regular file or directory", fullPath.c_str());
                }
            }
        } while (written != 0);
    }

    return Success();
}

Result copyDirectoryTree(const std::string& from, const std::string& dest, ProgressCounter* progress)
{
    Heap heap(2, Config::CHUNK_SIZE);
    FileCopier copier(heap);
    return copyDirectoryTree(copier, from, dest, nullptr, progress);
}
