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

#ifndef __TGM_FILE_ID_H__
#define __TGM_FILE_ID_H__

#include "tgm_file_location.h"

#include <cstddef>
#include <memory>
#include <string>

/*
 * A decoded file id. The location always matches the media type:
 * chat photos carry a tgm_chat_photo_location, photos and thumbnails a
 * tgm_photo_location and every other media type a tgm_document_location.
 */
struct tgm_file_id {
    tgm_file_id()
        : media_type(tgm_media_type::document)
    { }

    tgm_file_id(tgm_media_type type, const std::shared_ptr<const tgm_file_location>& location)
        : media_type(type)
        , location(location)
    { }

    tgm_media_type media_type;
    std::shared_ptr<const tgm_file_location> location;

    // Null unless the location is of the requested kind.
    const tgm_chat_photo_location* chat_photo_location() const;
    const tgm_photo_location* photo_location() const;
    const tgm_document_location* document_location() const;
};

// Number of bytes of the binary record, the leading media type included.
size_t tgm_file_id_record_size(tgm_file_location_type type);

// Throws tgm_invalid_file_id on any malformed input.
tgm_file_id tgm_decode_file_id(const std::string& file_id);

// Throws std::invalid_argument if the location doesn't match the media type.
std::string tgm_encode_file_id(const tgm_file_id& file_id);

#endif
