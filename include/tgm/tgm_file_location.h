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

#ifndef __TGM_FILE_LOCATION_H__
#define __TGM_FILE_LOCATION_H__

#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

// The numeric values are part of the file id wire format.
enum class tgm_media_type: int32_t
{
    photo_thumbnail = 0,
    chat_photo = 1,
    photo = 2,
    voice = 3,
    video = 4,
    document = 5,
    sticker = 8,
    audio = 9,
    animation = 10,
    video_note = 13,
    document_thumbnail = 14,
};

bool tgm_is_valid_media_type(int32_t value);

inline static std::string to_string(tgm_media_type type)
{
    switch (type) {
    case tgm_media_type::photo_thumbnail:
        return "photo_thumbnail";
    case tgm_media_type::chat_photo:
        return "chat_photo";
    case tgm_media_type::photo:
        return "photo";
    case tgm_media_type::voice:
        return "voice";
    case tgm_media_type::video:
        return "video";
    case tgm_media_type::document:
        return "document";
    case tgm_media_type::sticker:
        return "sticker";
    case tgm_media_type::audio:
        return "audio";
    case tgm_media_type::animation:
        return "animation";
    case tgm_media_type::video_note:
        return "video_note";
    case tgm_media_type::document_thumbnail:
        return "document_thumbnail";
    }

    assert(false);
    return "unknown";
}

inline static std::ostream& operator<<(std::ostream& os, tgm_media_type type)
{
    os << to_string(type);
    return os;
}

enum class tgm_file_location_type
{
    chat_photo,     // media type 1
    photo,          // media types 0, 2, 14
    document,       // media types 3, 4, 5, 8, 9, 10, 13
};

tgm_file_location_type tgm_file_location_type_for(tgm_media_type type);

struct tgm_file_location {
    tgm_file_location(): dc_id(0) { }
    virtual ~tgm_file_location() { }
    virtual tgm_file_location_type type() const = 0;

    int32_t dc_id;
};

struct tgm_chat_photo_location: public tgm_file_location {
    tgm_chat_photo_location()
        : peer_id(0)
        , volume_id(0)
        , local_id(0)
        , is_big(false)
    { }

    virtual tgm_file_location_type type() const override { return tgm_file_location_type::chat_photo; }

    int64_t peer_id;
    int64_t volume_id;
    int32_t local_id;
    bool is_big;
};

struct tgm_photo_location: public tgm_file_location {
    tgm_photo_location()
        : document_id(0)
        , access_hash(0)
        , thumb_size(0)
    { }

    virtual tgm_file_location_type type() const override { return tgm_file_location_type::photo; }

    int64_t document_id;
    int64_t access_hash;
    char thumb_size;
};

struct tgm_document_location: public tgm_file_location {
    tgm_document_location()
        : document_id(0)
        , access_hash(0)
    { }

    virtual tgm_file_location_type type() const override { return tgm_file_location_type::document; }

    int64_t document_id;
    int64_t access_hash;
};

#endif
