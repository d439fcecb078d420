#pragma once

#include "io.hpp"
#include "path.hpp"

namespace _fs_impl
{
    /** @brief Owner of a file descriptor, closed when dropped. */
    class NativeFile : public NonConstructible
    {
    private:
        int _fd;

        explicit NativeFile(int fd);

    public:
        NativeFile(NativeFile &&other) noexcept;
        ~NativeFile();

        /**
         * @brief `open(2)` the file at `path` with the given access and creation `flags`.
         *
         * `O_CLOEXEC` is always added. New files get mode `0666` before the umask.
         */
        static io::Result<NativeFile> open(const path::PathBuf &path, int flags);

        io::Result<size_t> read(std::span<char> buffer);
        io::Result<size_t> write(std::span<const char> buffer);
        io::Result<std::monostate> flush();
    };
}
