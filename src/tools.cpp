/*
    This file is part of tgm-library

    This library is free software; you can redistribute it and/or
    modify it under the terms of the GNU Lesser General Public
    License as published by the Free Software Foundation; either
    version 2.1 of the License, or (at your option) any later version.

    This library is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
    Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public
    License along with this library; if not, write to the Free Software
    Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA

    Copyright Topology LP 2017
*/

#include "tools.h"

#include "crypto/crypto_rand.h"
#include "tgm/tgm_log.h"
#include "tgm/tgm_random.h"

#include <cstring>
#include <stdexcept>

void tgm_secure_random(unsigned char* s, int l)
{
    if (TGMC_rand_bytes(s, l) <= 0) {
        TGM_ERROR("failed to get " << l << " random bytes");
        throw std::runtime_error("secure random generator failure");
    }
}

int64_t tgm_random_id()
{
    uint64_t value = 0;
    tgm_secure_random(reinterpret_cast<unsigned char*>(&value), sizeof(value));
    return static_cast<int64_t>(value & 0x7fffffffffffffffULL);
}

std::pair<std::string, std::string> tgm_split_path(const std::string& path)
{
    auto slash_pos = path.rfind('/');
    if (slash_pos == std::string::npos) {
        return std::make_pair(std::string(), path);
    }

    std::string head = path.substr(0, slash_pos + 1);
    std::string tail = path.substr(slash_pos + 1);

    if (head.find_first_not_of('/') != std::string::npos) {
        auto last = head.find_last_not_of('/');
        head.erase(last + 1);
    }

    return std::make_pair(head, tail);
}
