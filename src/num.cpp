#include "num.hpp"

namespace num
{
    ParseIntError::ParseIntError(IntErrorKind kind) : NonConstructible(NonConstructibleTag::TAG), _kind(kind) {}

    IntErrorKind ParseIntError::kind() const noexcept
    {
        return _kind;
    }

    const char *ParseIntError::message() const noexcept
    {
        switch (_kind)
        {
        case IntErrorKind::Empty:
            return "cannot parse integer from empty string";
        case IntErrorKind::InvalidDigit:
            return "invalid digit found in string";
        case IntErrorKind::PosOverflow:
            return "number too large to fit in target type";
        case IntErrorKind::NegOverflow:
            return "number too small to fit in target type";
        default:
            return "unrecognized error";
        }
    }

    namespace _impl
    {
        Result<uint64_t> parse_magnitude(std::string_view digits, uint64_t limit, bool negative)
        {
            uint64_t value = 0;
            for (auto c : digits)
            {
                if (c < '0' || c > '9')
                {
                    return Result<uint64_t>::err(ParseIntError(IntErrorKind::InvalidDigit));
                }

                auto digit = static_cast<uint64_t>(c - '0');
                if (value > (limit - digit) / 10)
                {
                    return Result<uint64_t>::err(ParseIntError(negative ? IntErrorKind::NegOverflow : IntErrorKind::PosOverflow));
                }

                value = value * 10 + digit;
            }

            return Result<uint64_t>::ok(std::move(value));
        }
    }

    std::string_view trim(std::string_view src) noexcept
    {
        const char *whitespace = " \t\n\v\f\r";
        auto begin = src.find_first_not_of(whitespace);
        if (begin == std::string_view::npos)
        {
            return std::string_view();
        }

        auto end = src.find_last_not_of(whitespace);
        return src.substr(begin, end - begin + 1);
    }
}
