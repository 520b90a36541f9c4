#pragma once


/*
    -------------
    Mimic logging
    -------------
    Mimic writes its diagnostics through an spdlog logger named "mimic".

    - If the application registered a logger under that name before the
      first library call, it is used as-is
    - Otherwise a colored stderr logger is created on first use
    - `set_logger(...)` replaces the library logger at any time; passing
      nullptr restores the default

    Levels used by the library:
        * debug - detected formatting, file reads and writes
        * warn  - use of deprecated functions
        * error - failed file reads and writes
*/

#include <memory>

#include <spdlog/spdlog.h>

#include "mimic/config.hpp"

namespace Mimic {

    /// @brief Returns the logger used by the library
    [[nodiscard]] MIMIC_API std::shared_ptr<spdlog::logger> logger();

    /// @brief Routes library diagnostics to @p l (nullptr restores the default)
    MIMIC_API void set_logger(std::shared_ptr<spdlog::logger> l);

} // namespace Mimic
