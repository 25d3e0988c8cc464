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

#include "tgm/tgm_mime_type.h"

#include <algorithm>
#include <cctype>
#include <map>

static const std::string s_default_mime_type("application/octet-stream");

// The first extension listed for a mime type is the one we save files with.
static const std::map<std::string, std::string> s_mime_to_extension = {
    { "application/epub+zip", "epub" },
    { "application/gzip", "gz" },
    { "application/json", "json" },
    { "application/msword", "doc" },
    { "application/pdf", "pdf" },
    { "application/vnd.android.package-archive", "apk" },
    { "application/vnd.ms-excel", "xls" },
    { "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet", "xlsx" },
    { "application/vnd.openxmlformats-officedocument.wordprocessingml.document", "docx" },
    { "application/x-7z-compressed", "7z" },
    { "application/x-rar-compressed", "rar" },
    { "application/x-tar", "tar" },
    { "application/x-tgsticker", "tgs" },
    { "application/zip", "zip" },
    { "audio/aac", "aac" },
    { "audio/flac", "flac" },
    { "audio/mp4", "m4a" },
    { "audio/mpeg", "mp3" },
    { "audio/ogg", "ogg" },
    { "audio/opus", "opus" },
    { "audio/x-wav", "wav" },
    { "image/bmp", "bmp" },
    { "image/gif", "gif" },
    { "image/jpeg", "jpg" },
    { "image/png", "png" },
    { "image/svg+xml", "svg" },
    { "image/tiff", "tiff" },
    { "image/webp", "webp" },
    { "text/csv", "csv" },
    { "text/html", "html" },
    { "text/plain", "txt" },
    { "video/mp4", "mp4" },
    { "video/mpeg", "mpeg" },
    { "video/quicktime", "mov" },
    { "video/webm", "webm" },
    { "video/x-matroska", "mkv" },
    { "video/x-msvideo", "avi" },
};

static const std::map<std::string, std::string> s_extension_to_mime = [] {
    std::map<std::string, std::string> extension_to_mime;
    for (const auto& it: s_mime_to_extension) {
        extension_to_mime.insert(std::make_pair(it.second, it.first));
    }
    extension_to_mime.insert(std::make_pair("jpeg", "image/jpeg"));
    extension_to_mime.insert(std::make_pair("htm", "text/html"));
    extension_to_mime.insert(std::make_pair("oga", "audio/ogg"));
    extension_to_mime.insert(std::make_pair("tif", "image/tiff"));
    extension_to_mime.insert(std::make_pair("wav", "audio/x-wav"));
    return extension_to_mime;
}();

static std::string to_lower(const std::string& str)
{
    std::string lower(str.size(), 0);
    std::transform(str.begin(), str.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

std::string tgm_extension_by_mime_type(const std::string& mime_type)
{
    auto it = s_mime_to_extension.find(to_lower(mime_type));
    if (it != s_mime_to_extension.end()) {
        return it->second;
    }
    return std::string();
}

std::string tgm_mime_type_by_filename(const std::string& filename)
{
    auto dot_pos = filename.rfind('.');
    if (dot_pos == std::string::npos || dot_pos == filename.size() - 1) {
       return s_default_mime_type;
    }
    return tgm_mime_type_by_extension(filename.substr(dot_pos + 1));
}

std::string tgm_mime_type_by_extension(const std::string& extension)
{
    auto it = s_extension_to_mime.find(to_lower(extension));
    if (it != s_extension_to_mime.end()) {
        return it->second;
    }

    return s_default_mime_type;
}
