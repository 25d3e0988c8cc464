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

#pragma once

#include <cassert>
#include <cstdint>
#include <functional>
#include <string>
#include <sstream>

enum class tgm_log_level {
    level_error = 0,
    level_warning = 1,
    level_notice = 2,
    level_debug = 6,
};

using tgm_log_function = std::function<void(const std::string& log, tgm_log_level level)>;
void tgm_init_log(const tgm_log_function& log_function, tgm_log_level level);
void tgm_log(const std::string& str, tgm_log_level level);
bool tgm_log_enabled(tgm_log_level level);

constexpr int32_t tgm_basename_index(const char* const path, const int32_t index = 0, const int32_t slash_index = -1) {
    return path[index]
        ? (path[index] == '/' ? tgm_basename_index(path, index + 1, index) : tgm_basename_index(path, index + 1, slash_index))
        : (slash_index + 1);
}

#define TGM_STRINGIZE_DETAIL(x) #x
#define TGM_STRINGIZE(x) TGM_STRINGIZE_DETAIL(x)

#define __TGM_FILELINE__ ({ static const int32_t basename_idx = tgm_basename_index(__FILE__); \
        static_assert (basename_idx >= 0, "compile-time basename"); \
        __FILE__ ":" TGM_STRINGIZE(__LINE__) + basename_idx; })

#define TGM_LOG_AT(LEVEL, X) do { if (tgm_log_enabled(LEVEL)) { std::ostringstream str_stream; \
                    str_stream << "[" << __TGM_FILELINE__ << "] [" << __FUNCTION__ << "] " << X ; \
                    tgm_log(str_stream.str(), LEVEL);} } while (false)

#ifndef NDEBUG
#define TGM_DEBUG(X) TGM_LOG_AT(tgm_log_level::level_debug, X)
#else
#define TGM_DEBUG(X)
#endif

#define TGM_NOTICE(X) TGM_LOG_AT(tgm_log_level::level_notice, X)
#define TGM_WARNING(X) TGM_LOG_AT(tgm_log_level::level_warning, X)
#define TGM_ERROR(X) TGM_LOG_AT(tgm_log_level::level_error, X)

#define TGM_ASSERT(x) assert(x)
