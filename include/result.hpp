#pragma once

#include "error.hpp"
#include "pch.hpp"
#include "terminator.hpp"

#define SHORT_CIRCUIT(value_type, expr) ({                             \
    auto _result = (expr);                                             \
    if (_result.is_err())                                              \
    {                                                                  \
        return result::Result<                                         \
            value_type,                                                \
            std::remove_reference_t<decltype(_result.unwrap_err())>>:: \
            err(std::move(_result).into_err());                        \
    }                                                                  \
    std::move(_result).into_ok();                                      \
})

namespace result
{
    /**
     * @brief A type that represents either success or failure.
     *
     * @see https://doc.rust-lang.org/std/result/enum.Result.html
     */
    template <typename T, typename E>
    class Result : public NonConstructible
    {
    private:
        std::variant<T, E> _data;

        explicit Result(T &&value) : NonConstructible(NonConstructibleTag::TAG), _data(std::in_place_index<0>, std::move(value)) {}
        explicit Result(E &&error) : NonConstructible(NonConstructibleTag::TAG), _data(std::in_place_index<1>, std::move(error)) {}

    public:
        using Value = T;
        using Error = E;

        static Result ok(T &&value) { return Result(std::move(value)); }
        static Result err(E &&error) { return Result(std::move(error)); }

        bool is_ok() const noexcept { return _data.index() == 0; }
        bool is_err() const noexcept { return _data.index() == 1; }

        T into_ok() && { return std::get<0>(std::move(_data)); }
        E into_err() && { return std::get<1>(std::move(_data)); }

        T &unwrap()
        {
            if (!is_ok())
            {
                throw std::runtime_error("called unwrap() on Err");
            }
            return std::get<0>(_data);
        }

        const T &unwrap() const
        {
            if (!is_ok())
            {
                throw std::runtime_error("called unwrap() on Err");
            }
            return std::get<0>(_data);
        }

        E &unwrap_err()
        {
            if (!is_err())
            {
                throw std::runtime_error("called unwrap_err() on Ok");
            }
            return std::get<1>(_data);
        }

        const E &unwrap_err() const
        {
            if (!is_err())
            {
                throw std::runtime_error("called unwrap_err() on Ok");
            }
            return std::get<1>(_data);
        }

        template <typename FT, typename FE>
        std::variant<std::invoke_result_t<FT, T &>, std::invoke_result_t<FE, E &>> match(FT &&on_ok, FE &&on_err)
        {
            using Output = std::variant<std::invoke_result_t<FT, T &>, std::invoke_result_t<FE, E &>>;
            if (is_ok())
            {
                return Output(std::in_place_index<0>, std::invoke(std::forward<FT>(on_ok), std::get<0>(_data)));
            }
            else
            {
                return Output(std::in_place_index<1>, std::invoke(std::forward<FE>(on_err), std::get<1>(_data)));
            }
        }

        /**
         * @brief Adds some context to the error.
         *
         * On failure the error becomes the cause of a new @ref error::ContextError. The context is
         * evaluated eagerly; prefer @ref with_context when building it is expensive.
         *
         * @see https://docs.rs/easy-error/latest/easy_error/trait.ResultExt.html#tymethod.context
         */
        template <Displayable C>
            requires std::derived_from<E, error::Error>
        Result<T, error::ContextError> context(
            const C &context,
            std::source_location location = std::source_location::current()) &&
        {
            if (is_ok())
            {
                return Result<T, error::ContextError>::ok(std::get<0>(std::move(_data)));
            }

            return Result<T, error::ContextError>::err(
                error::ContextError(context, std::get<1>(std::move(_data)), location));
        }

        /**
         * @brief Adds context to the error, evaluating the context function only if there is an error.
         *
         * @see https://docs.rs/easy-error/latest/easy_error/trait.ResultExt.html#tymethod.with_context
         */
        template <std::invocable F>
            requires std::derived_from<E, error::Error> && Displayable<std::invoke_result_t<F>>
        Result<T, error::ContextError> with_context(
            F &&context_fn,
            std::source_location location = std::source_location::current()) &&
        {
            if (is_ok())
            {
                return Result<T, error::ContextError>::ok(std::get<0>(std::move(_data)));
            }

            return Result<T, error::ContextError>::err(
                error::ContextError(std::invoke(std::forward<F>(context_fn)), std::get<1>(std::move(_data)), location));
        }

        /** @brief Wraps the error for display at the program's exit. */
        Result<T, error::Terminator> into_terminator() &&
            requires std::derived_from<E, error::Error>
        {
            if (is_ok())
            {
                return Result<T, error::Terminator>::ok(std::get<0>(std::move(_data)));
            }

            return Result<T, error::Terminator>::err(error::Terminator(std::get<1>(std::move(_data))));
        }
    };
}

namespace error
{
    /** @brief A result whose failure is an @ref ContextError. */
    template <typename T>
    using Result = result::Result<T, ContextError>;

    /**
     * @brief A failed result carrying a new error built from `context`.
     *
     * Return it directly, or combine it with `SHORT_CIRCUIT`.
     *
     * @see https://docs.rs/easy-error/latest/easy_error/macro.bail.html
     */
    template <typename T = std::monostate, Displayable C>
    Result<T> bail(const C &context, std::source_location location = std::source_location::current())
    {
        return Result<T>::err(err_msg(context, location));
    }

    /**
     * @brief Succeeds if `condition` holds, otherwise fails with an error built from `context`.
     *
     * @see https://docs.rs/easy-error/latest/easy_error/macro.ensure.html
     */
    template <Displayable C>
    Result<std::monostate> ensure(bool condition, const C &context, std::source_location location = std::source_location::current())
    {
        if (!condition)
        {
            return bail(context, location);
        }

        return Result<std::monostate>::ok(std::monostate{});
    }
}
