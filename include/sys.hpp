#pragma once

#include "io.hpp"

namespace sys
{
    /** @brief Map an OS error code to the matching @ref io::ErrorKind. */
    io::ErrorKind decode_error_kind(int code);

    /** @brief The description the OS gives for an error code. */
    std::string error_string(int code);

    /** @brief The error code of the last failed OS call on this thread. */
    int errno_value() noexcept;

    /**
     * @brief Turns the `-1` failure sentinel of a libc call into @ref io::Error::last_os_error.
     *
     * @see https://github.com/rust-lang/rust/blob/8182085617878610473f0b88f07fc9803f4b4960/library/std/src/sys/pal/unix/mod.rs#L300-L303
     */
    template <std::signed_integral T>
    io::Result<T> cvt(T value)
    {
        if (value == -1)
        {
            return io::Result<T>::err(io::Error::last_os_error());
        }

        return io::Result<T>::ok(std::move(value));
    }

    /** @brief Like @ref cvt, but repeats `call` for as long as it is interrupted by a signal. */
    template <std::invocable F>
    auto cvt_r(F &&call)
    {
        while (true)
        {
            auto result = cvt(std::invoke(call));
            if (result.is_ok() || result.unwrap_err().kind() != io::ErrorKind::Interrupted)
            {
                return result;
            }
        }
    }
}
