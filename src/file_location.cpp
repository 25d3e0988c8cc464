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

#include "tgm/tgm_file_location.h"

bool tgm_is_valid_media_type(int32_t value)
{
    switch (value) {
    case static_cast<int32_t>(tgm_media_type::photo_thumbnail):
    case static_cast<int32_t>(tgm_media_type::chat_photo):
    case static_cast<int32_t>(tgm_media_type::photo):
    case static_cast<int32_t>(tgm_media_type::voice):
    case static_cast<int32_t>(tgm_media_type::video):
    case static_cast<int32_t>(tgm_media_type::document):
    case static_cast<int32_t>(tgm_media_type::sticker):
    case static_cast<int32_t>(tgm_media_type::audio):
    case static_cast<int32_t>(tgm_media_type::animation):
    case static_cast<int32_t>(tgm_media_type::video_note):
    case static_cast<int32_t>(tgm_media_type::document_thumbnail):
        return true;
    default:
        return false;
    }
}

tgm_file_location_type tgm_file_location_type_for(tgm_media_type type)
{
    switch (type) {
    case tgm_media_type::chat_photo:
        return tgm_file_location_type::chat_photo;
    case tgm_media_type::photo_thumbnail:
    case tgm_media_type::photo:
    case tgm_media_type::document_thumbnail:
        return tgm_file_location_type::photo;
    case tgm_media_type::voice:
    case tgm_media_type::video:
    case tgm_media_type::document:
    case tgm_media_type::sticker:
    case tgm_media_type::audio:
    case tgm_media_type::animation:
    case tgm_media_type::video_note:
        return tgm_file_location_type::document;
    }

    assert(false);
    return tgm_file_location_type::document;
}
