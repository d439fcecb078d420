#pragma once

#include "error.hpp"

namespace error
{
    /**
     * @brief An error that wraps all other error types for a nicer output at exit.
     *
     * Return it from the function driving the program (see @ref terminate). Its rendering is
     * the wrapped error followed by one `Caused by: ` line per cause:
     *
     * @code
     * Unable to get value from file
     * Caused by: Could not open file
     * Caused by: No such file or directory
     * @endcode
     *
     * @see https://docs.rs/easy-error/latest/easy_error/struct.Terminator.html
     */
    class Terminator : public NonConstructible
    {
    private:
        std::unique_ptr<Error> _inner;

    public:
        /** @brief Wrap any error. */
        template <Owned E>
        Terminator(E &&err)
            : NonConstructible(NonConstructibleTag::TAG),
              _inner(std::make_unique<std::remove_cvref_t<E>>(std::move(err))) {}

        /** @brief Render the whole chain, one error per line. A moved-from terminator renders as nothing. */
        std::string render() const;

        friend std::ostream &operator<<(std::ostream &os, const Terminator &terminator);
    };

    /**
     * @brief Run the entry point of a program and turn its outcome into an exit status.
     *
     * `entry` returns a @ref result::Result whose error converts to @ref Terminator. On failure,
     * `Error: ` followed by the rendered chain is written to `os` and `EXIT_FAILURE` is returned.
     */
    template <typename F>
    int terminate(F &&entry, std::ostream &os)
    {
        auto result = std::invoke(std::forward<F>(entry));
        if (result.is_ok())
        {
            return EXIT_SUCCESS;
        }

        Terminator terminator(std::move(result).into_err());
        os << "Error: " << terminator << std::flush;
        return EXIT_FAILURE;
    }

    template <typename F>
    int terminate(F &&entry)
    {
        return terminate(std::forward<F>(entry), std::cerr);
    }
}
