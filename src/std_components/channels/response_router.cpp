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
 * @file response_router.cpp
 * @brief Implementation of the ResponseRouter.
 */

#include "response_router.hpp"

#include <utils/logging.hpp>

bool ResponseRouter::CanClaim(unsigned long id, int connection) const {
    std::map<unsigned long, Route>::const_iterator it = this->routes.find(id);
    return it == this->routes.end() || it->second.connection == connection;
}

void ResponseRouter::Claim(unsigned long id, int connection) {
    std::map<unsigned long, Route>::iterator it = this->routes.find(id);
    if (it == this->routes.end()) {
        Route route;
        route.connection = connection;
        route.pending = 1;
        this->routes[id] = route;
    } else {
        it->second.pending += 1;
    }
}

int ResponseRouter::Owner(unsigned long id) const {
    std::map<unsigned long, Route>::const_iterator it = this->routes.find(id);
    if (it == this->routes.end()) return -1;
    return it->second.connection;
}

void ResponseRouter::Release(unsigned long id) {
    std::map<unsigned long, Route>::iterator it = this->routes.find(id);
    if (it == this->routes.end()) return;
    it->second.pending -= 1;
    if (it->second.pending == 0) this->routes.erase(it);
}

#ifndef NDEBUG

int TestResponseRouter() {
    ResponseRouter router;

    if (router.Owner(5) != -1 || !router.CanClaim(5, 1)) {
        CAMSIM_ERROR_PRINTF("TestResponseRouter %s:%d empty router\n",
                            __FILE__, __LINE__);
        return 1;
    }

    router.Claim(5, 1);
    router.Claim(5, 1);
    if (router.Owner(5) != 1 || router.CanClaim(5, 0) ||
        !router.CanClaim(5, 1)) {
        CAMSIM_ERROR_PRINTF("TestResponseRouter %s:%d bad ownership\n",
                            __FILE__, __LINE__);
        return 1;
    }

    // Two answers pending: the first release keeps the route.
    router.Release(5);
    if (router.Owner(5) != 1) {
        CAMSIM_ERROR_PRINTF("TestResponseRouter %s:%d route lost early\n",
                            __FILE__, __LINE__);
        return 1;
    }
    router.Release(5);
    if (router.Owner(5) != -1 || !router.IsEmpty() || !router.CanClaim(5, 0)) {
        CAMSIM_ERROR_PRINTF("TestResponseRouter %s:%d route not released\n",
                            __FILE__, __LINE__);
        return 1;
    }

    // Releasing an unknown id is harmless.
    router.Release(9);
    return router.IsEmpty() ? 0 : 1;
}

#endif  // NDEBUG
