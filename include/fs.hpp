#pragma once

#include "io.hpp"
#include "path.hpp"
#include "result.hpp"

#if defined(__linux__) || defined(__unix__) || defined(__APPLE__)
#include "linux/fs.hpp"
#endif

namespace fs
{
    /**
     * @brief An open file on the filesystem.
     *
     * Failures surface as @ref io::Error values carrying the OS error, ready to be wrapped with
     * `context` by the caller.
     *
     * @see https://doc.rust-lang.org/std/fs/struct.File.html
     */
    class File : public NonConstructible, public io::Read, public io::Write
    {
    private:
        _fs_impl::NativeFile _inner;

        explicit File(_fs_impl::NativeFile &&inner);

    public:
        /** @brief Opens a file in read-only mode. */
        static io::Result<File> open(const path::PathBuf &path);

        /** @brief Opens a file in write-only mode, creating it or truncating what is there. */
        static io::Result<File> create(const path::PathBuf &path);

        io::Result<size_t> read(std::span<char> buffer) override;
        io::Result<size_t> write(std::span<const char> buffer) override;
        io::Result<std::monostate> flush() override;
    };

    /**
     * @brief Reads the entire contents of a file into a string.
     *
     * @see https://doc.rust-lang.org/std/fs/fn.read_to_string.html
     */
    io::Result<std::string> read_to_string(const path::PathBuf &path);

    /**
     * @brief Writes `contents` as the entire contents of a file, replacing it if it exists.
     *
     * @see https://doc.rust-lang.org/std/fs/fn.write.html
     */
    io::Result<std::monostate> write(const path::PathBuf &path, std::string_view contents);
}
