#pragma once

#include "error.hpp"

/** @brief The message a context error is expected to display for `context`. */
inline std::string displayed(const std::string &context, const error::ContextError &err)
{
#ifdef EASYERR_TRACK_CALLER
    return stringify(context, " (", err.location().file_name(), ":", err.location().line(), ")");
#else
    (void)err;
    return context;
#endif
}

/** @brief A leaf error with a fixed message, standing in for an error from another library. */
class LeafError : public NonConstructible, public error::Error
{
private:
    std::string _message;

public:
    explicit LeafError(const std::string &message) : NonConstructible(NonConstructibleTag::TAG), _message(message) {}

    const char *message() const noexcept override
    {
        return _message.c_str();
    }
};

/** @brief An error that claims to be its own source. */
class SelfSourcedError : public NonConstructible, public error::Error
{
public:
    SelfSourcedError() : NonConstructible(NonConstructibleTag::TAG) {}

    const char *message() const noexcept override
    {
        return "again";
    }

    const error::Error *source() const noexcept override
    {
        return this;
    }
};
