#ifndef CAMSIM_UTILS_LOGGING_HPP_
#define CAMSIM_UTILS_LOGGING_HPP_

//
// Copyright (C) 2025  HiPES - Universidade Federal do Paraná
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.
//

/**
 * @file logging.hpp
 * @details Macros related to logging. Errors and warnings go to stderr,
 * everything else to stdout. Debug messages vanish in release builds.
 */

#include <cstdio>

#define CAMSIM_ERROR_PRINTF(...)      \
    {                                 \
        fprintf(stderr, "[ERROR] ");  \
        fprintf(stderr, __VA_ARGS__); \
    }

#define CAMSIM_WARNING_PRINTF(...)     \
    {                                  \
        fprintf(stderr, "[WARNING] "); \
        fprintf(stderr, __VA_ARGS__);  \
    }

#define CAMSIM_LOG_PRINTF(...) \
    { printf(__VA_ARGS__); }

#ifndef NDEBUG
#define CAMSIM_DEBUG_PRINTF(...) \
    {                            \
        printf("[DEBUG] ");      \
        printf(__VA_ARGS__);     \
    }
#else
#define CAMSIM_DEBUG_PRINTF(...) \
    do {                         \
    } while (0)
#endif  // CAMSIM_DEBUG_PRINTF

#endif  // CAMSIM_UTILS_LOGGING_HPP_
