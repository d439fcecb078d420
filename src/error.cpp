#include "error.hpp"

namespace error
{
    const Error *Error::source() const noexcept
    {
        return nullptr;
    }

    const char *Error::what() const noexcept
    {
        return message();
    }

    std::ostream &operator<<(std::ostream &os, const Error &err)
    {
        return os << err.message();
    }

    Causes::iterator::iterator() noexcept : _current(nullptr) {}

    Causes::iterator::iterator(const Error *current) noexcept : _current(current) {}

    Causes::iterator::reference Causes::iterator::operator*() const noexcept
    {
        return *_current;
    }

    Causes::iterator::pointer Causes::iterator::operator->() const noexcept
    {
        return _current;
    }

    Causes::iterator &Causes::iterator::operator++() noexcept
    {
        _current = _current->source();
        return *this;
    }

    Causes::iterator Causes::iterator::operator++(int) noexcept
    {
        auto old = *this;
        ++*this;
        return old;
    }

    Causes::Causes(const Error *first) noexcept : _cause(first) {}

    const Error *Causes::next() noexcept
    {
        auto cause = _cause;
        if (cause != nullptr)
        {
            _cause = cause->source();
        }

        return cause;
    }

    Causes::iterator Causes::begin() const noexcept
    {
        return iterator(_cause);
    }

    Causes::iterator Causes::end() const noexcept
    {
        return iterator();
    }

    Causes iter_causes(const Error &err) noexcept
    {
        return Causes(err.source());
    }

    ContextError::ContextError(std::string &&context, std::unique_ptr<Error> &&cause, std::source_location location)
        : NonConstructible(NonConstructibleTag::TAG),
          _context(std::move(context)),
          _cause(std::move(cause)),
          _location(location),
          _message(_context)
    {
#ifdef EASYERR_TRACK_CALLER
        _message += stringify(" (", _location.file_name(), ":", _location.line(), ")");
#endif
    }

    const std::string &ContextError::context() const noexcept
    {
        return _context;
    }

    const std::source_location &ContextError::location() const noexcept
    {
        return _location;
    }

    Causes ContextError::iter_causes() const noexcept
    {
        return error::iter_causes(*this);
    }

    const char *ContextError::message() const noexcept
    {
        return _message.c_str();
    }

    const Error *ContextError::source() const noexcept
    {
        return _cause.get();
    }

    ExceptionError::ExceptionError(std::exception_ptr exception)
        : NonConstructible(NonConstructibleTag::TAG), _exception(std::move(exception))
    {
        if (!_exception)
        {
            _message = "no exception";
            return;
        }

        try
        {
            std::rethrow_exception(_exception);
        }
        catch (const std::exception &e)
        {
            _message = e.what();

            try
            {
                std::rethrow_if_nested(e);
            }
            catch (...)
            {
                // The nested exception becomes the next link of the chain.
                _nested = std::make_unique<ExceptionError>(std::current_exception());
            }
        }
        catch (...)
        {
            _message = "unknown exception";
        }
    }

    ExceptionError ExceptionError::current()
    {
        return ExceptionError(std::current_exception());
    }

    const std::exception_ptr &ExceptionError::exception() const noexcept
    {
        return _exception;
    }

    const char *ExceptionError::message() const noexcept
    {
        return _message.c_str();
    }

    const Error *ExceptionError::source() const noexcept
    {
        return _nested.get();
    }
}
