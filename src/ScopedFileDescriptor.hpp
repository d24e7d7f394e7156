#pragma once
#include "Util.hpp"

class ScopedFileDescriptor
{
public:
    ScopedFileDescriptor() = default;
    ~ScopedFileDescriptor();

    ScopedFileDescriptor(const ScopedFileDescriptor&) = delete;
    void operator=(const ScopedFileDescriptor&) = delete;

    [[nodiscard]] Result open(const std::string& path, int oflag, mode_t mode);

    // Closing explicitly reports errors that the destructor has to drop, which matters for
    // files we wrote to.
    [[nodiscard]] Result close();

    int getFd() const;

private:
    int fd = -1;
    std::string path;
};
