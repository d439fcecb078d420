#include "terminator.hpp"

namespace error
{
    std::string Terminator::render() const
    {
        std::ostringstream stream;
        stream << *this;
        return stream.str();
    }

    std::ostream &operator<<(std::ostream &os, const Terminator &terminator)
    {
        if (terminator._inner == nullptr)
        {
            return os;
        }

        os << *terminator._inner << '\n';
        for (const auto &cause : iter_causes(*terminator._inner))
        {
            os << "Caused by: " << cause << '\n';
        }

        return os;
    }
}
