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

#include <boost/optional.hpp>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>

// A downloadable media object as seen in a message: audio, document, photo, etc.
struct tgm_media {
    tgm_media() { }
    explicit tgm_media(const std::string& id): file_id(id) { }

    std::string file_id;
    boost::optional<std::string> file_name;
    boost::optional<int64_t> file_size;
    boost::optional<std::string> mime_type;
    boost::optional<int64_t> date;
};

struct tgm_message {
    std::shared_ptr<tgm_media> audio;
    std::shared_ptr<tgm_media> document;
    std::shared_ptr<tgm_media> photo;
    std::shared_ptr<tgm_media> sticker;
    std::shared_ptr<tgm_media> animation;
    std::shared_ptr<tgm_media> video;
    std::shared_ptr<tgm_media> voice;
    std::shared_ptr<tgm_media> video_note;

    // First media present in the order above, null if there is none.
    std::shared_ptr<tgm_media> downloadable_media() const
    {
        for (const auto* media: { &audio, &document, &photo, &sticker, &animation, &video, &voice, &video_note }) {
            if (*media) {
                return *media;
            }
        }
        return nullptr;
    }
};

// What a download can be started from: a message, one of its media, or a bare file id.
class tgm_media_reference
{
public:
    tgm_media_reference(const std::shared_ptr<tgm_message>& message)
        : m_media(message ? message->downloadable_media() : nullptr)
    { }

    tgm_media_reference(const std::shared_ptr<tgm_media>& media)
        : m_media(media)
    { }

    tgm_media_reference(const std::string& file_id)
        : m_file_id(file_id)
    { }

    tgm_media_reference(const char* file_id)
        : m_file_id(file_id ? boost::optional<std::string>(std::string(file_id)) : boost::none)
    { }

    // At most one of them is set, none if there is nothing to download.
    const std::shared_ptr<tgm_media>& media() const { return m_media; }
    const boost::optional<std::string>& file_id() const { return m_file_id; }

private:
    std::shared_ptr<tgm_media> m_media;
    boost::optional<std::string> m_file_id;
};
