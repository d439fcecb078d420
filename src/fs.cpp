#include "fs.hpp"

namespace fs
{
    File::File(_fs_impl::NativeFile &&inner) : NonConstructible(NonConstructibleTag::TAG), _inner(std::move(inner)) {}

    io::Result<File> File::open(const path::PathBuf &path)
    {
        auto inner = SHORT_CIRCUIT(File, _fs_impl::NativeFile::open(path, O_RDONLY));
        return io::Result<File>::ok(File(std::move(inner)));
    }

    io::Result<File> File::create(const path::PathBuf &path)
    {
        auto inner = SHORT_CIRCUIT(File, _fs_impl::NativeFile::open(path, O_WRONLY | O_CREAT | O_TRUNC));
        return io::Result<File>::ok(File(std::move(inner)));
    }

    io::Result<size_t> File::read(std::span<char> buffer)
    {
        return _inner.read(buffer);
    }

    io::Result<size_t> File::write(std::span<const char> buffer)
    {
        return _inner.write(buffer);
    }

    io::Result<std::monostate> File::flush()
    {
        return _inner.flush();
    }

    io::Result<std::string> read_to_string(const path::PathBuf &path)
    {
        auto file = SHORT_CIRCUIT(std::string, File::open(path));

        std::string contents;
        SHORT_CIRCUIT(std::string, file.read_to_string(contents));
        return io::Result<std::string>::ok(std::move(contents));
    }

    io::Result<std::monostate> write(const path::PathBuf &path, std::string_view contents)
    {
        auto file = SHORT_CIRCUIT(std::monostate, File::create(path));
        return file.write_all(std::span<const char>(contents.data(), contents.size()));
    }
}
