#pragma once

#include "pch.hpp"

namespace error
{
    /**
     * @brief Abstract base class for custom errors.
     *
     * Typically, errors appear as the second template parameter to @ref result::Result<T, E>.
     * An error has a human-readable message and may expose one further error that caused it.
     *
     * @see https://doc.rust-lang.org/std/error/trait.Error.html
     */
    class Error : public std::exception
    {
    public:
        /**
         * @brief Default destructor for error struct.
         */
        virtual ~Error() = default;

        /**
         * @brief Returns a human-readable description of the error.
         *
         * The description never includes the text of the underlying cause.
         *
         * @return A C-style string describing the error.
         */
        virtual const char *message() const noexcept = 0;

        /**
         * @brief Returns the underlying cause of this error, if any.
         *
         * The returned pointer is borrowed from this error and lives as long as it does.
         *
         * @return A pointer to the source error, or `nullptr` if there is no underlying cause.
         */
        virtual const Error *source() const noexcept;

        /**
         * @brief Format the error to output streams.
         *
         * Only @ref message is written; walk the chain with @ref iter_causes to see the causes.
         */
        friend std::ostream &operator<<(std::ostream &os, const Error &err);

        virtual const char *what() const noexcept override;
    };

    /** @brief Concrete error types that can be moved into an owning wrapper. */
    template <typename E>
    concept Owned = std::derived_from<std::remove_cvref_t<E>, Error> && !std::is_lvalue_reference_v<E>;

    /**
     * @brief An iterator over the causes of an error.
     *
     * The chain starts at the immediate cause of the error it was created from; the error
     * itself is not part of the chain. Each step performs exactly one @ref Error::source lookup.
     *
     * Chains built from owned causes are acyclic. An error type that reports itself as its
     * own source makes the iteration endless.
     */
    class Causes
    {
    private:
        const Error *_cause;

    public:
        class iterator
        {
        private:
            const Error *_current;

        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = Error;
            using difference_type = std::ptrdiff_t;
            using pointer = const Error *;
            using reference = const Error &;

            iterator() noexcept;
            explicit iterator(const Error *current) noexcept;

            reference operator*() const noexcept;
            pointer operator->() const noexcept;
            iterator &operator++() noexcept;
            iterator operator++(int) noexcept;

            bool operator==(const iterator &other) const noexcept = default;
        };

        explicit Causes(const Error *first) noexcept;

        /**
         * @brief Returns the next cause and advances to its own source.
         *
         * @return The next cause, or `nullptr` once the chain is exhausted (and on every call after that).
         */
        const Error *next() noexcept;

        /** @brief Iterate over the remaining causes, starting at the current position. */
        iterator begin() const noexcept;
        iterator end() const noexcept;
    };

    /**
     * @brief Returns an iterator over the causes of an error.
     *
     * @see https://docs.rs/easy-error/latest/easy_error/fn.iter_causes.html
     */
    Causes iter_causes(const Error &err) noexcept;

    /**
     * @brief An error that is a human-targeted string plus an optional cause.
     *
     * The cause is owned by the error and erased to @ref Error. The call-site that created the
     * error is always recorded; it only shows up in @ref message when the library is built with
     * `EASYERR_TRACK_CALLER`.
     */
    class ContextError : public NonConstructible, public Error
    {
    private:
        std::string _context;
        std::unique_ptr<Error> _cause;
        std::source_location _location;
        std::string _message;

        explicit ContextError(std::string &&context, std::unique_ptr<Error> &&cause, std::source_location location);

    public:
        /** @brief Create a new error with no cause. */
        template <Displayable C>
        explicit ContextError(const C &context, std::source_location location = std::source_location::current())
            : ContextError(stringify(context), nullptr, location) {}

        /** @brief Create a new error with the given cause. */
        template <Displayable C, Owned E>
        explicit ContextError(const C &context, E &&cause, std::source_location location = std::source_location::current())
            : ContextError(stringify(context), std::make_unique<std::remove_cvref_t<E>>(std::move(cause)), location) {}

        /** @brief The human-targeted context, without any location. */
        const std::string &context() const noexcept;

        /** @brief The place where this error was created. */
        const std::source_location &location() const noexcept;

        /** @brief Iterates over the causes of the error. */
        Causes iter_causes() const noexcept;

        const char *message() const noexcept override;
        const Error *source() const noexcept override;
    };

    /**
     * @brief Creates an error message from the provided context.
     *
     * Use @ref stringify to build the context out of several values.
     *
     * @see https://docs.rs/easy-error/latest/easy_error/fn.err_msg.html
     */
    template <Displayable C>
    ContextError err_msg(const C &context, std::source_location location = std::source_location::current())
    {
        return ContextError(context, location);
    }

    /**
     * @brief Adapts a C++ exception to the @ref Error interface.
     *
     * The message is the exception's `what()`. If the exception was thrown with
     * `std::throw_with_nested`, the nested exception becomes the @ref source.
     */
    class ExceptionError : public NonConstructible, public Error
    {
    private:
        std::exception_ptr _exception;
        std::string _message;
        std::unique_ptr<ExceptionError> _nested;

    public:
        explicit ExceptionError(std::exception_ptr exception);

        /** @brief Capture the exception currently being handled. */
        static ExceptionError current();

        /** @brief The captured exception, for callers that want to rethrow it. */
        const std::exception_ptr &exception() const noexcept;

        const char *message() const noexcept override;
        const Error *source() const noexcept override;
    };
}
