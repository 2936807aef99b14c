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
 * @file std_components.cpp
 * @brief Declaration of the std components.
 */

#include <camsim.hpp>
#include <std_components/channels/buffered_channel.hpp>
#include <std_components/channels/cached_channel.hpp>
#include <std_components/memory/backing_memory.hpp>
#include <std_components/misc/traffic_generator.hpp>

Linkable* CreateDefaultComponentByClass(const char* name) {
    COMPONENT(CachedChannel);
    COMPONENT(BufferedChannel);
    COMPONENT(BackingMemory);
    COMPONENT(TrafficGenerator);

    return NULL;
}
