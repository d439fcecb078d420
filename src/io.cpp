#include "sys.hpp"

namespace
{
    /** @see https://doc.rust-lang.org/std/str/fn.from_utf8.html */
    bool _is_utf8(std::string_view data)
    {
        size_t i = 0;
        while (i < data.size())
        {
            auto byte = static_cast<unsigned char>(data[i]);
            size_t width;
            uint32_t codepoint;
            if (byte < 0x80)
            {
                i++;
                continue;
            }
            else if ((byte & 0xE0) == 0xC0)
            {
                width = 2;
                codepoint = byte & 0x1F;
            }
            else if ((byte & 0xF0) == 0xE0)
            {
                width = 3;
                codepoint = byte & 0x0F;
            }
            else if ((byte & 0xF8) == 0xF0)
            {
                width = 4;
                codepoint = byte & 0x07;
            }
            else
            {
                return false;
            }

            if (i + width > data.size())
            {
                return false;
            }

            for (size_t j = 1; j < width; j++)
            {
                auto next = static_cast<unsigned char>(data[i + j]);
                if ((next & 0xC0) != 0x80)
                {
                    return false;
                }

                codepoint = (codepoint << 6) | (next & 0x3F);
            }

            // Overlong encodings, surrogates and out-of-range code points
            static const uint32_t minimum[] = {0, 0, 0x80, 0x800, 0x10000};
            if (codepoint < minimum[width] || (codepoint >= 0xD800 && codepoint <= 0xDFFF) || codepoint > 0x10FFFF)
            {
                return false;
            }

            i += width;
        }

        return true;
    }
}

namespace io
{
    const char *format_error_kind(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::AlreadyExists:
            return "entity already exists";
        case ErrorKind::FileTooLarge:
            return "file too large";
        case ErrorKind::FilesystemLoop:
            return "filesystem loop or indirection limit (e.g. symlink loop)";
        case ErrorKind::Interrupted:
            return "operation interrupted";
        case ErrorKind::InvalidData:
            return "invalid data";
        case ErrorKind::InvalidFilename:
            return "invalid filename";
        case ErrorKind::InvalidInput:
            return "invalid input parameter";
        case ErrorKind::IsADirectory:
            return "is a directory";
        case ErrorKind::NotADirectory:
            return "not a directory";
        case ErrorKind::NotFound:
            return "entity not found";
        case ErrorKind::Other:
            return "other error";
        case ErrorKind::OutOfMemory:
            return "out of memory";
        case ErrorKind::PermissionDenied:
            return "permission denied";
        case ErrorKind::ReadOnlyFilesystem:
            return "read-only filesystem or storage medium";
        case ErrorKind::ResourceBusy:
            return "resource busy";
        case ErrorKind::StorageFull:
            return "no storage space";
        case ErrorKind::UnexpectedEof:
            return "unexpected end of file";
        case ErrorKind::Unsupported:
            return "unsupported";
        case ErrorKind::WouldBlock:
            return "operation would block";
        default:
            return "unrecognized error";
        }
    }

    Error::Error(ErrorKind kind, std::optional<int> code, std::string &&message)
        : NonConstructible(NonConstructibleTag::TAG), _kind(kind), _code(code), _message(std::move(message)) {}

    Error::Error(ErrorKind kind) : Error(kind, std::nullopt, format_error_kind(kind)) {}

    Error::Error(ErrorKind kind, const std::string &message) : Error(kind, std::nullopt, std::string(message)) {}

    Error Error::other(const std::string &message)
    {
        return Error(ErrorKind::Other, message);
    }

    Error Error::from_raw_os_error(int code)
    {
        return Error(sys::decode_error_kind(code), code, sys::error_string(code));
    }

    Error Error::last_os_error()
    {
        return from_raw_os_error(sys::errno_value());
    }

    ErrorKind Error::kind() const noexcept
    {
        return _kind;
    }

    std::optional<int> Error::raw_os_error() const noexcept
    {
        return _code;
    }

    const char *Error::message() const noexcept
    {
        return _message.c_str();
    }

    Result<size_t> Read::read_to_string(std::string &buffer)
    {
        std::string data;
        char chunk[8192];
        while (true)
        {
            auto result = read(std::span<char>(chunk, sizeof(chunk)));
            if (result.is_err())
            {
                if (result.unwrap_err().kind() == ErrorKind::Interrupted)
                {
                    continue;
                }

                return Result<size_t>::err(std::move(result).into_err());
            }

            auto size = std::move(result).into_ok();
            if (size == 0)
            {
                break;
            }

            data.append(chunk, size);
        }

        if (!_is_utf8(data))
        {
            return Result<size_t>::err(Error(ErrorKind::InvalidData, "stream did not contain valid UTF-8"));
        }

        buffer += data;
        return Result<size_t>::ok(data.size());
    }

    Result<std::monostate> Write::write_all(std::span<const char> buffer)
    {
        while (!buffer.empty())
        {
            auto result = write(buffer);
            if (result.is_err())
            {
                if (result.unwrap_err().kind() == ErrorKind::Interrupted)
                {
                    continue;
                }

                return Result<std::monostate>::err(std::move(result).into_err());
            }

            auto size = std::move(result).into_ok();
            if (size == 0)
            {
                return Result<std::monostate>::err(Error(ErrorKind::Other, "failed to write whole buffer"));
            }

            buffer = buffer.subspan(size);
        }

        return Result<std::monostate>::ok(std::monostate{});
    }
}
