#include "fs.hpp"
#include "sys.hpp"

namespace _fs_impl
{
    NativeFile::NativeFile(int fd) : NonConstructible(NonConstructibleTag::TAG), _fd(fd) {}

    NativeFile::NativeFile(NativeFile &&other) noexcept : NonConstructible(NonConstructibleTag::TAG), _fd(other._fd)
    {
        other._fd = -1;
    }

    NativeFile::~NativeFile()
    {
        if (_fd != -1)
        {
            close(_fd);
        }
    }

    io::Result<NativeFile> NativeFile::open(const path::PathBuf &path, int flags)
    {
        auto fd = SHORT_CIRCUIT(
            NativeFile,
            sys::cvt_r([&path, flags]()
                       { return ::open(path.c_str(), flags | O_CLOEXEC, 0666); }));

        return io::Result<NativeFile>::ok(NativeFile(fd));
    }

    io::Result<size_t> NativeFile::read(std::span<char> buffer)
    {
        if (buffer.empty())
        {
            return io::Result<size_t>::ok(0);
        }

        auto bytes = SHORT_CIRCUIT(size_t, sys::cvt(::read(_fd, buffer.data(), buffer.size())));
        return io::Result<size_t>::ok(static_cast<size_t>(bytes));
    }

    io::Result<size_t> NativeFile::write(std::span<const char> buffer)
    {
        if (buffer.empty())
        {
            return io::Result<size_t>::ok(0);
        }

        auto bytes = SHORT_CIRCUIT(size_t, sys::cvt(::write(_fd, buffer.data(), buffer.size())));
        return io::Result<size_t>::ok(static_cast<size_t>(bytes));
    }

    io::Result<std::monostate> NativeFile::flush()
    {
        SHORT_CIRCUIT(std::monostate, sys::cvt(fsync(_fd)));
        return io::Result<std::monostate>::ok(std::monostate{});
    }
}
