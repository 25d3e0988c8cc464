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

#include "tgm/tgm_download_target.h"

#include "tgm/tgm_log.h"
#include "tgm/tgm_mime_type.h"
#include "tools.h"

#include <boost/filesystem.hpp>

#include <ctime>
#include <sstream>

std::string tgm_download_target::path() const
{
    return (boost::filesystem::path(directory) / file_name).string();
}

std::string tgm_media_type_label(tgm_media_type type)
{
    switch (type) {
    case tgm_media_type::photo_thumbnail:
    case tgm_media_type::chat_photo:
    case tgm_media_type::photo:
    case tgm_media_type::document_thumbnail:
        return "photo";
    case tgm_media_type::voice:
    case tgm_media_type::audio:
        return "audio";
    case tgm_media_type::video:
    case tgm_media_type::animation:
    case tgm_media_type::video_note:
        return "video";
    case tgm_media_type::document:
        return "document";
    case tgm_media_type::sticker:
        return "sticker";
    }

    return "unknown";
}

std::string tgm_default_extension(tgm_media_type type)
{
    switch (type) {
    case tgm_media_type::photo_thumbnail:
    case tgm_media_type::chat_photo:
    case tgm_media_type::photo:
    case tgm_media_type::document_thumbnail:
        return ".jpg";
    case tgm_media_type::voice:
        return ".ogg";
    case tgm_media_type::video:
    case tgm_media_type::animation:
    case tgm_media_type::video_note:
        return ".mp4";
    case tgm_media_type::document:
        return ".zip";
    case tgm_media_type::sticker:
        return ".webp";
    case tgm_media_type::audio:
        return ".mp3";
    }

    return ".unknown";
}

std::string tgm_format_file_date(int64_t timestamp)
{
    std::time_t time = static_cast<std::time_t>(timestamp);
    struct tm local_time;
    if (!localtime_r(&time, &local_time)) {
        TGM_WARNING("can't convert timestamp " << timestamp << " to local time");
        return std::to_string(timestamp);
    }

    char buffer[32];
    size_t length = strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", &local_time);
    return std::string(buffer, length);
}

std::string tgm_synthesize_file_name(tgm_media_type type, const boost::optional<std::string>& mime_type,
        const boost::optional<int64_t>& date, int64_t suffix, double now)
{
    std::string extension;
    if (mime_type && !mime_type->empty()) {
        extension = tgm_extension_by_mime_type(*mime_type);
        if (!extension.empty()) {
            extension = "." + extension;
        }
    }
    if (extension.empty()) {
        extension = tgm_default_extension(type);
    }

    int64_t timestamp = (date && *date) ? *date : static_cast<int64_t>(now);

    std::ostringstream stream;
    stream << tgm_media_type_label(type) << "_" << tgm_format_file_date(timestamp) << "_" << suffix << extension;
    return stream.str();
}

tgm_download_target tgm_resolve_download_target(const tgm_download_config& config,
        const std::string& requested_path, const tgm_file_data& data, int64_t suffix, double now)
{
    auto split = tgm_split_path(requested_path);

    tgm_download_target target;
    target.directory = split.first;
    target.file_name = split.second;

    if (target.file_name.empty() && data.file_name) {
        target.file_name = *data.file_name;
    }

    if (target.directory.empty()) {
        target.directory = config.download_directory();
    }

    boost::filesystem::path directory(target.directory);
    if (!directory.is_absolute()) {
        directory = boost::filesystem::path(config.base_directory()) / directory;
    }
    target.directory = directory.string();

    if (target.file_name.empty()) {
        target.file_name = tgm_synthesize_file_name(data.file_id.media_type, data.mime_type, data.date, suffix, now);
        TGM_DEBUG("synthesized file name " << target.file_name << " for " << data.file_id.media_type);
    }

    return target;
}
