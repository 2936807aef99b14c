#ifndef CAMSIM_HPP_
#define CAMSIM_HPP_

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
 * @file camsim.hpp
 * @details This header has all public API components may want to use. Some
 * things are actually imported from other headers.
 */

#include <cstring>

// These pragmas make clangd don't warn about unused includes when using just
// camsim.hpp to include the below files.
#include "config/config.hpp"           // IWYU pragma: export
#include "engine/component.hpp"        // IWYU pragma: export
#include "engine/default_packets.hpp"  // IWYU pragma: export
#include "engine/linkable.hpp"         // IWYU pragma: export
#include "utils/logging.hpp"           // IWYU pragma: export

#define COMPONENT(type) \
    if (!strcmp(name, #type)) return new type

#endif  // CAMSIM_HPP_
