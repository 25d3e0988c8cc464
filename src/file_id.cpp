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

#include "tgm/tgm_file_id.h"

#include "crypto/crypto_base64.h"
#include "file_id_buffer.h"
#include "tgm/tgm_error.h"
#include "tgm/tgm_log.h"

#include <cassert>
#include <stdexcept>

namespace tgm {
namespace impl {

// Appended after the packed record, not part of it.
static constexpr char FILE_ID_VERSION_MARKER = 0x02;

static constexpr size_t CHAT_PHOTO_RECORD_SIZE = 4 + 4 + 8 + 8 + 4 + 1;
static constexpr size_t PHOTO_RECORD_SIZE = 4 + 4 + 8 + 8 + 1;
static constexpr size_t DOCUMENT_RECORD_SIZE = 4 + 4 + 8 + 8;

/*
 * Runs of zero bytes are stored as a 0x00 byte followed by the run length.
 * The byte after a 0x00 is always taken as the count, even when it is the
 * trailing marker.
 */
static std::string unpack_zero_runs(const std::string& packed)
{
    if (packed.empty() || packed.back() != FILE_ID_VERSION_MARKER) {
        throw file_id_format_error("file id version marker is missing");
    }

    std::string record;
    record.reserve(packed.size() * 2);
    for (size_t i = 0; i + 1 < packed.size(); ++i) {
        if (packed[i] != 0) {
            record.push_back(packed[i]);
        } else {
            record.append(static_cast<unsigned char>(packed[i + 1]), '\0');
            ++i;
        }
    }
    return record;
}

static std::string pack_zero_runs(const std::string& record)
{
    std::string packed;
    packed.reserve(record.size() + 2);
    unsigned char zeros = 0;
    for (char c: record) {
        if (c == 0) {
            if (zeros == 0xff) {
                packed.push_back('\0');
                packed.push_back(static_cast<char>(zeros));
                zeros = 0;
            }
            ++zeros;
            continue;
        }
        if (zeros) {
            packed.push_back('\0');
            packed.push_back(static_cast<char>(zeros));
            zeros = 0;
        }
        packed.push_back(c);
    }
    if (zeros) {
        packed.push_back('\0');
        packed.push_back(static_cast<char>(zeros));
    }
    packed.push_back(FILE_ID_VERSION_MARKER);
    return packed;
}

static std::shared_ptr<tgm_file_location> fetch_location(file_id_in_buffer& in, tgm_file_location_type type)
{
    switch (type) {
    case tgm_file_location_type::chat_photo: {
        auto location = std::make_shared<tgm_chat_photo_location>();
        location->dc_id = in.fetch_i32();
        location->peer_id = in.fetch_i64();
        location->volume_id = in.fetch_i64();
        location->local_id = in.fetch_i32();
        location->is_big = in.fetch_bool();
        return location;
    }
    case tgm_file_location_type::photo: {
        auto location = std::make_shared<tgm_photo_location>();
        location->dc_id = in.fetch_i32();
        location->document_id = in.fetch_i64();
        location->access_hash = in.fetch_i64();
        location->thumb_size = in.fetch_char();
        return location;
    }
    case tgm_file_location_type::document: {
        auto location = std::make_shared<tgm_document_location>();
        location->dc_id = in.fetch_i32();
        location->document_id = in.fetch_i64();
        location->access_hash = in.fetch_i64();
        return location;
    }
    }

    throw file_id_format_error("unknown file location type");
}

static tgm_file_id decode_file_id(const std::string& text)
{
    std::string packed;
    if (!TGMC_base64url_decode(text, packed)) {
        throw file_id_format_error("file id is not valid url-safe base64");
    }

    std::string record = unpack_zero_runs(packed);
    file_id_in_buffer in(record);

    int32_t tag = in.fetch_i32();
    if (!tgm_is_valid_media_type(tag)) {
        throw file_id_format_error("unknown media type " + std::to_string(tag));
    }

    tgm_media_type media_type = static_cast<tgm_media_type>(tag);
    tgm_file_location_type location_type = tgm_file_location_type_for(media_type);
    if (record.size() != tgm_file_id_record_size(location_type)) {
        throw file_id_format_error("file id record size " + std::to_string(record.size())
                + " doesn't match media type " + to_string(media_type));
    }

    tgm_file_id file_id(media_type, fetch_location(in, location_type));
    TGM_ASSERT(in.remaining() == 0);
    return file_id;
}

}
}

const tgm_chat_photo_location* tgm_file_id::chat_photo_location() const
{
    if (!location || location->type() != tgm_file_location_type::chat_photo) {
        return nullptr;
    }
    return static_cast<const tgm_chat_photo_location*>(location.get());
}

const tgm_photo_location* tgm_file_id::photo_location() const
{
    if (!location || location->type() != tgm_file_location_type::photo) {
        return nullptr;
    }
    return static_cast<const tgm_photo_location*>(location.get());
}

const tgm_document_location* tgm_file_id::document_location() const
{
    if (!location || location->type() != tgm_file_location_type::document) {
        return nullptr;
    }
    return static_cast<const tgm_document_location*>(location.get());
}

size_t tgm_file_id_record_size(tgm_file_location_type type)
{
    switch (type) {
    case tgm_file_location_type::chat_photo:
        return tgm::impl::CHAT_PHOTO_RECORD_SIZE;
    case tgm_file_location_type::photo:
        return tgm::impl::PHOTO_RECORD_SIZE;
    case tgm_file_location_type::document:
        return tgm::impl::DOCUMENT_RECORD_SIZE;
    }

    assert(false);
    return 0;
}

tgm_file_id tgm_decode_file_id(const std::string& file_id)
{
    try {
        return tgm::impl::decode_file_id(file_id);
    } catch (const tgm::impl::file_id_format_error& e) {
        TGM_DEBUG("can't decode file id " << file_id << ": " << e.what());
        throw tgm_invalid_file_id(file_id);
    }
}

std::string tgm_encode_file_id(const tgm_file_id& file_id)
{
    if (!file_id.location || file_id.location->type() != tgm_file_location_type_for(file_id.media_type)) {
        throw std::invalid_argument("file location doesn't match media type " + to_string(file_id.media_type));
    }

    tgm::impl::file_id_out_buffer out;
    out.out_i32(static_cast<int32_t>(file_id.media_type));
    out.out_i32(file_id.location->dc_id);

    if (auto location = file_id.chat_photo_location()) {
        out.out_i64(location->peer_id);
        out.out_i64(location->volume_id);
        out.out_i32(location->local_id);
        out.out_bool(location->is_big);
    } else if (auto location = file_id.photo_location()) {
        out.out_i64(location->document_id);
        out.out_i64(location->access_hash);
        out.out_char(location->thumb_size);
    } else if (auto location = file_id.document_location()) {
        out.out_i64(location->document_id);
        out.out_i64(location->access_hash);
    }

    TGM_ASSERT(out.data().size() == tgm_file_id_record_size(file_id.location->type()));
    return TGMC_base64url_encode(tgm::impl::pack_zero_runs(out.data()));
}
