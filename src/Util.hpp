#pragma once
#include <cstddef>
#include <cstdint>
#include <cerrno>
#include <string>
#include <memory>
#include <variant>
#include <functional>
#include <sys/types.h>

struct statx;

class Error
{
public:
    enum class Kind : uint8_t
    {
        SourceNotFound,
        SourceIsDirectoryWithoutRecursion,
        DestinationInsideSource,
        DuplicateTarget,
        Io,
    };

    Kind kind;
    std::unique_ptr<std::string> humanFriendlyErrorMessage;

    Error() = delete;
    explicit Error(std::string&& message): Error(Kind::Io, std::move(message)) {}
    Error(Kind kind, std::string&& message): kind(kind), humanFriendlyErrorMessage(std::make_unique<std::string>(std::move(message))) {}
};

using Result = std::variant<Error, nullptr_t>;
static constexpr nullptr_t Success() { return nullptr; }

[[nodiscard]] Result recursiveMkdir(const std::string& path);

using OpenResult = std::variant<Error, int>;
[[nodiscard]] OpenResult myOpen(const std::string& path, int oflag, mode_t mode);
[[nodiscard]] Result myClose(int fd, const std::string& path);

[[maybe_unused]] static int retrySyscall(const std::function<void(void)>& func)
{
    errno = 0;
    for (int32_t tries = 0; tries < 5; tries++)
    {
        func();

        if (errno == EINTR || errno == EAGAIN)
            continue;

        break;
    }

    return errno;
}

// Taken from the manpage for getdents64() https://man7.org/linux/man-pages/man2/getdents64.2.html
struct linux_dirent64
{
    ino64_t             d_ino;    /* 64-bit inode number */
    off64_t             d_off;    /* 64-bit offset to next structure */
    unsigned short      d_reclen; /* Size of this dirent */
    unsigned char       d_type;   /* File type */
    __extension__ char  d_name[]; /* Filename (null-terminated). __extension__ allows use of flexible array members in g++ (normally only allowed in plain C) */
};

using GetDentsResult = std::variant<Error, size_t>;
[[nodiscard]] GetDentsResult myGetDents(int dfd, const std::string& path, void* buffer, size_t bufferSize);

[[nodiscard]] Result myStatx(int fd, const std::string& path, int flags, unsigned int mask, struct statx& buf);

using GetCwdResult = std::variant<Error, std::string>;
[[nodiscard]] GetCwdResult myGetCwd();

// Makes path absolute against workingDirectory and collapses "." and ".." lexically. Never touches
// the filesystem, so symlinks are not resolved. ".." at the root stays at the root.
std::string normalizePath(const std::string& path, const std::string& workingDirectory);

// Both arguments must already be normalized. True only for a strict descendant, compared by whole
// components: "/a/bc" is not inside "/a/b".
bool isPathInside(const std::string& parent, const std::string& child);

// Last component of path, ignoring trailing slashes. Empty for "/".
std::string pathBasename(const std::string& path);
std::string joinPath(const std::string& directory, const std::string& name);

std::string truncateFilename(const std::string& name, size_t width);
std::string humanFriendlyFileSize(uint64_t bytes);
