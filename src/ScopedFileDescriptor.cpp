#include <unistd.h>
#include "ScopedFileDescriptor.hpp"
#include "Assert.hpp"

ScopedFileDescriptor::~ScopedFileDescriptor()
{
    if (this->fd >= 0)
    {
        [[maybe_unused]] int ret = ::close(this->fd);
        debug_assert(ret == 0);
    }
}

Result ScopedFileDescriptor::open(const std::string& _path, int oflag, mode_t mode)
{
    debug_assert(this->fd < 0);

    OpenResult result = myOpen(_path, oflag, mode);
    if (std::holds_alternative<Error>(result))
        return Error(std::move(std::get<Error>(result)));

    this->fd = std::get<int>(result);
    this->path = _path;
    return Success();
}

Result ScopedFileDescriptor::close()
{
    debug_assert(this->fd >= 0);

    int toClose = this->fd;
    this->fd = -1;
    return myClose(toClose, this->path);
}

int ScopedFileDescriptor::getFd() const
{
    debug_assert(this->fd >= 0);
    return this->fd;
}
