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

#ifndef __TGM_DOWNLOAD_TARGET_H__
#define __TGM_DOWNLOAD_TARGET_H__

#include "tgm_download_config.h"
#include "tgm_file_data.h"
#include "tgm_file_location.h"

#include <boost/optional.hpp>

#include <cstdint>
#include <string>

struct tgm_download_target {
    std::string directory;
    std::string file_name;

    std::string path() const;
};

/*
 * Splits requested_path into directory and file name. A missing file name
 * falls back to the one the media came with, or is synthesized from the
 * media type, date, mime type and suffix. A missing directory becomes the
 * configured download directory and relative directories are resolved
 * against the configured base directory. Never touches the filesystem.
 */
tgm_download_target tgm_resolve_download_target(const tgm_download_config& config,
        const std::string& requested_path, const tgm_file_data& data, int64_t suffix, double now);

// <label>_<YYYY-MM-DD_HH-MM-SS>_<suffix><extension>, with date falling back to now when unknown or zero.
std::string tgm_synthesize_file_name(tgm_media_type type, const boost::optional<std::string>& mime_type,
        const boost::optional<int64_t>& date, int64_t suffix, double now);

std::string tgm_media_type_label(tgm_media_type type);

// With the leading dot.
std::string tgm_default_extension(tgm_media_type type);

// Local time, second precision.
std::string tgm_format_file_date(int64_t timestamp);

#endif
