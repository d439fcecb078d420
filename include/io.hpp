#pragma once

#include "error.hpp"
#include "pch.hpp"
#include "result.hpp"

namespace io
{
    /**
     * @brief A list specifying general categories of I/O error.
     *
     * @see https://doc.rust-lang.org/std/io/enum.ErrorKind.html
     */
    enum ErrorKind
    {
        /** @brief An entity was not found, often a file. */
        NotFound,
        /** @brief The operation lacked the necessary privileges to complete. */
        PermissionDenied,
        /** @brief An entity already exists, often a file. */
        AlreadyExists,
        /** @brief The operation needs to block to complete, but was requested not to. */
        WouldBlock,
        /** @brief A filesystem object is, unexpectedly, not a directory. */
        NotADirectory,
        /** @brief The filesystem object is, unexpectedly, a directory. */
        IsADirectory,
        /** @brief A write was attempted on a read-only filesystem or medium. */
        ReadOnlyFilesystem,
        /** @brief Too many levels of symbolic links. */
        FilesystemLoop,
        /** @brief A parameter was incorrect. */
        InvalidInput,
        /** @brief Data not valid for the operation were encountered. */
        InvalidData,
        /** @brief A filename was invalid or too long. */
        InvalidFilename,
        /** @brief The underlying storage is full. */
        StorageFull,
        /** @brief File larger than allowed or supported. */
        FileTooLarge,
        /** @brief Resource is busy. */
        ResourceBusy,
        /** @brief This operation was interrupted. */
        Interrupted,
        /** @brief This operation is unsupported on this platform. */
        Unsupported,
        /** @brief An "end of file" was reached prematurely. */
        UnexpectedEof,
        /** @brief Allocating memory for the operation failed. */
        OutOfMemory,
        /** @brief A custom error that does not fall under any other I/O error kind. */
        Other,
    };

    const char *format_error_kind(ErrorKind kind);

    /**
     * @brief The error type for I/O operations of the @ref Read, @ref Write, and associated interfaces.
     *
     * OS errors display the text reported by the operating system, e.g. `No such file or directory`.
     *
     * @see https://doc.rust-lang.org/std/io/struct.Error.html
     */
    class Error : public NonConstructible, public error::Error
    {
    private:
        ErrorKind _kind;
        std::optional<int> _code;
        std::string _message;

        explicit Error(ErrorKind kind, std::optional<int> code, std::string &&message);

    public:
        /** @brief Creates a new I/O error from a known kind of error, described by the kind itself. */
        explicit Error(ErrorKind kind);

        /** @brief Creates a new I/O error from a known kind of error as well as an arbitrary error payload. */
        explicit Error(ErrorKind kind, const std::string &message);

        /** @brief Creates a new I/O error from an arbitrary error payload. */
        static Error other(const std::string &message);

        /** @brief Creates a new instance of an @ref Error from a particular OS error code. */
        static Error from_raw_os_error(int code);

        /** @brief Returns an error representing the last OS error which occurred. */
        static Error last_os_error();

        ErrorKind kind() const noexcept;

        /** @brief The OS error code this error was created from, if any. */
        std::optional<int> raw_os_error() const noexcept;

        const char *message() const noexcept override;
    };

    template <typename T>
    using Result = result::Result<T, Error>;

    class Read
    {
    public:
        virtual ~Read() = default;

        virtual Result<size_t> read(std::span<char> buffer) = 0;

        /**
         * @brief Read all bytes until EOF and append them to `buffer`.
         *
         * Fails with @ref ErrorKind::InvalidData if the data is not valid UTF-8, in which case
         * `buffer` is left untouched.
         *
         * @see https://doc.rust-lang.org/std/io/trait.Read.html#method.read_to_string
         */
        Result<size_t> read_to_string(std::string &buffer);
    };

    class Write
    {
    public:
        virtual ~Write() = default;

        virtual Result<size_t> write(std::span<const char> buffer) = 0;
        virtual Result<std::monostate> flush() = 0;

        /** @see https://doc.rust-lang.org/std/io/trait.Write.html#method.write_all */
        Result<std::monostate> write_all(std::span<const char> buffer);
    };
}
