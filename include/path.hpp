#pragma once

#include "pch.hpp"

namespace path
{
    /**
     * @brief An owned, mutable path.
     *
     * @see https://doc.rust-lang.org/std/path/struct.PathBuf.html
     */
    using PathBuf = std::filesystem::path;
}
