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

#include "tgm/tgm_log.h"

#include <mutex>

static std::mutex g_log_mutex;
static tgm_log_function g_log_function;
static tgm_log_level g_log_level = tgm_log_level::level_notice;

void tgm_init_log(const tgm_log_function& log_function, tgm_log_level level)
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_function = log_function;
    g_log_level = level;
}

bool tgm_log_enabled(tgm_log_level level)
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return level <= g_log_level && g_log_function;
}

// The sink runs outside the lock and may log again.
void tgm_log(const std::string& str, tgm_log_level level)
{
    tgm_log_function log_function;
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        if (level > g_log_level) {
            return;
        }
        log_function = g_log_function;
    }

    if (log_function) {
        log_function(str, level);
    }
}
