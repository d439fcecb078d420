#pragma once

#include "error.hpp"
#include "pch.hpp"
#include "result.hpp"

namespace num
{
    /**
     * @brief Enum to store the various types of errors that can cause parsing an integer to fail.
     *
     * @see https://doc.rust-lang.org/std/num/enum.IntErrorKind.html
     */
    enum IntErrorKind
    {
        /** @brief Value being parsed is empty. */
        Empty,
        /** @brief Contains an invalid digit in its context. */
        InvalidDigit,
        /** @brief Integer is too large to store in target integer type. */
        PosOverflow,
        /** @brief Integer is too small to store in target integer type. */
        NegOverflow,
    };

    /**
     * @brief An error which can be returned when parsing an integer.
     *
     * @see https://doc.rust-lang.org/std/num/struct.ParseIntError.html
     */
    class ParseIntError : public NonConstructible, public error::Error
    {
    private:
        IntErrorKind _kind;

    public:
        explicit ParseIntError(IntErrorKind kind);

        IntErrorKind kind() const noexcept;
        const char *message() const noexcept override;
    };

    template <typename T>
    using Result = result::Result<T, ParseIntError>;

    namespace _impl
    {
        /**
         * @brief Parse `digits` (sign already stripped) as a magnitude no greater than `limit`.
         *
         * Overflow is reported at the first digit that takes the value past `limit`, before any
         * later digit is inspected.
         */
        Result<uint64_t> parse_magnitude(std::string_view digits, uint64_t limit, bool negative);
    }

    /**
     * @brief Parses a decimal integer, with an optional leading `+` (or `-` for signed types).
     *
     * Surrounding whitespace is not accepted; trim the input first.
     *
     * @see https://doc.rust-lang.org/std/primitive.i32.html#method.from_str_radix
     */
    template <std::integral T>
        requires(!std::same_as<T, bool>)
    Result<T> parse(std::string_view src)
    {
        if (src.empty())
        {
            return Result<T>::err(ParseIntError(IntErrorKind::Empty));
        }

        bool negative = false;
        if (src.front() == '+' || src.front() == '-')
        {
            negative = src.front() == '-';
            src.remove_prefix(1);
            if (src.empty())
            {
                return Result<T>::err(ParseIntError(IntErrorKind::InvalidDigit));
            }
        }

        if (negative && !std::is_signed_v<T>)
        {
            return Result<T>::err(ParseIntError(IntErrorKind::InvalidDigit));
        }

        // |min| is one greater than max
        auto limit = static_cast<uint64_t>(std::numeric_limits<T>::max()) + (negative ? 1 : 0);
        auto magnitude = SHORT_CIRCUIT(T, _impl::parse_magnitude(src, limit, negative));
        if (negative)
        {
            if (magnitude == limit)
            {
                return Result<T>::ok(std::numeric_limits<T>::min());
            }

            return Result<T>::ok(static_cast<T>(-static_cast<T>(magnitude)));
        }

        return Result<T>::ok(static_cast<T>(magnitude));
    }

    /**
     * @brief Trims ASCII whitespace from both ends of `src`.
     *
     * Unlike Rust's `str::trim`, other Unicode whitespace (U+00A0, U+2028, ...) is kept.
     */
    std::string_view trim(std::string_view src) noexcept;
}
