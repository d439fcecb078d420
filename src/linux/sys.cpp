#include "sys.hpp"

namespace
{
    // XSI strerror_r
    const char *_strerror_message(int status, const char *buffer)
    {
        return status == 0 ? buffer : nullptr;
    }

    // GNU strerror_r
    const char *_strerror_message(const char *message, const char *)
    {
        return message;
    }
}

namespace sys
{
    io::ErrorKind decode_error_kind(int code)
    {
        switch (code)
        {
        case EBUSY:
        case ETXTBSY:
            return io::ErrorKind::ResourceBusy;
        case EEXIST:
            return io::ErrorKind::AlreadyExists;
        case EFBIG:
            return io::ErrorKind::FileTooLarge;
        case EINTR:
            return io::ErrorKind::Interrupted;
        case EINVAL:
            return io::ErrorKind::InvalidInput;
        case EISDIR:
            return io::ErrorKind::IsADirectory;
        case ELOOP:
            return io::ErrorKind::FilesystemLoop;
        case ENOENT:
            return io::ErrorKind::NotFound;
        case ENOMEM:
            return io::ErrorKind::OutOfMemory;
        case ENOSPC:
        case EDQUOT:
            return io::ErrorKind::StorageFull;
        case ENOSYS:
        case EOPNOTSUPP:
            return io::ErrorKind::Unsupported;
        case ENAMETOOLONG:
            return io::ErrorKind::InvalidFilename;
        case ENOTDIR:
            return io::ErrorKind::NotADirectory;
        case EROFS:
            return io::ErrorKind::ReadOnlyFilesystem;
        case EACCES:
        case EPERM:
            return io::ErrorKind::PermissionDenied;
        default:
            if (code == EAGAIN || code == EWOULDBLOCK)
            {
                return io::ErrorKind::WouldBlock;
            }

            return io::ErrorKind::Other;
        }
    }

    std::string error_string(int code)
    {
        char buffer[256] = {};
        auto message = _strerror_message(strerror_r(code, buffer, sizeof(buffer)), buffer);
        if (message == nullptr || message[0] == '\0')
        {
            return stringify("Unknown error ", code);
        }

        return message;
    }

    int errno_value() noexcept
    {
        return errno;
    }
}
