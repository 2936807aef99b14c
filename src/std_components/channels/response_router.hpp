#ifndef CAMSIM_STD_COMPONENTS_CHANNELS_RESPONSE_ROUTER_HPP_
#define CAMSIM_STD_COMPONENTS_CHANNELS_RESPONSE_ROUTER_HPP_

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
 * @file response_router.hpp
 * @brief Remembers which upstream connection issued each request id.
 */

#include <map>

/**
 * @details An id belongs to a single connection while it has answers to
 * come. The same connection may have more than one answer pending for an id
 * (a hit and a miss of the same id), so a count is kept.
 */
class ResponseRouter {
  private:
    struct Route {
        int connection;
        int pending;
    };

    std::map<unsigned long, Route> routes;

  public:
    /** @brief False if another connection owns the id right now. */
    bool CanClaim(unsigned long id, int connection) const;

    void Claim(unsigned long id, int connection);

    /** @returns The connection owning the id, or -1. */
    int Owner(unsigned long id) const;

    /** @brief One answer for the id was delivered. */
    void Release(unsigned long id);

    inline bool IsEmpty() const { return this->routes.empty(); }
};

#ifndef NDEBUG
int TestResponseRouter();
#endif

#endif  // CAMSIM_STD_COMPONENTS_CHANNELS_RESPONSE_ROUTER_HPP_
