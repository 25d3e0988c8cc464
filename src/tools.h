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

#ifndef __TGM_TOOLS_H__
#define __TGM_TOOLS_H__

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

// Throws std::runtime_error when the generator can't be seeded.
void tgm_secure_random(unsigned char* s, int l);

static inline double tgm_get_system_time()
{
    return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now().time_since_epoch()).count() * 1e-9;
}

// Splits at the last slash into (head, tail). head loses its trailing slashes unless it is only slashes.
std::pair<std::string, std::string> tgm_split_path(const std::string& path);

#endif
