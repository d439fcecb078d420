#pragma once

#include <concepts>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <source_location>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#if defined(__linux__) || defined(__unix__) || defined(__APPLE__)

#define _FILE_OFFSET_BITS 64

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

#endif

/**
 * @brief A tag type used to control explicit construction of @ref NonConstructible.
 */
struct NonConstructibleTag final
{
private:
    explicit constexpr NonConstructibleTag() noexcept = default;

public:
    /**
     * @brief A singleton tag instance used to construct @ref NonConstructible types.
     */
    static const NonConstructibleTag TAG;
};

inline const NonConstructibleTag NonConstructibleTag::TAG{};

/**
 * @brief A base class that disables C++'s implicit constructors and copy semantics.
 *
 * Errors and results are passed around by ownership: every value has exactly one owner,
 * and handing it to the caller (or to a wrapping error) moves it.
 *
 * This @ref NonConstructible base class disables:
 * - Implicit default construction
 * - Copy construction and copy assignment
 *
 * But allows:
 * - Explicit construction by derived types
 * - Move semantics (move construction and move assignment)
 *
 * Example:
 * @code
 * struct MyData : NonConstructible {
 *     int x;
 *     explicit MyData(int value) : NonConstructible(NonConstructibleTag::TAG), x(value) {}
 * };
 *
 * int main() {
 *     MyData a{42};
 *     // MyData b;             // error: deleted default constructor
 *     // MyData c = a;         // error: copy constructor deleted
 *     MyData d = std::move(a); // move is allowed
 * }
 * @endcode
 */
class NonConstructible
{
public:
    /** @brief Disable implicit default construction */
    NonConstructible() = delete;
    /** @brief Disable copying */
    NonConstructible(const NonConstructible &) = delete;
    /** @brief Disable copy assignment */
    NonConstructible &operator=(const NonConstructible &) = delete;
    /** @brief Allow moving */
    NonConstructible(NonConstructible &&) noexcept = default;
    /** @brief Allow move assignment */
    NonConstructible &operator=(NonConstructible &&) noexcept = default;

protected:
    /**
     * @brief Protected constructor - derived types can explicitly construct.
     *
     * Pass @ref NonConstructibleTag::TAG as the only parameter.
     */
    explicit NonConstructible(NonConstructibleTag) noexcept {}
};

/**
 * @brief Types that can be written to an output stream.
 *
 * Anything satisfying this concept can be used as the context of an error.
 */
template <typename T>
concept Displayable = requires(std::ostream &os, const T &value) {
    { os << value } -> std::convertible_to<std::ostream &>;
};

/**
 * @brief Concatenate the stream representation of all arguments.
 *
 * @see https://doc.rust-lang.org/std/string/trait.ToString.html
 */
template <Displayable... Args>
std::string stringify(const Args &...args)
{
    std::ostringstream stream;
    (stream << ... << args);
    return stream.str();
}
