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

#include "tgm_file_id.h"
#include "tgm_media.h"

#include <boost/optional.hpp>

#include <cstdint>
#include <string>

// Everything a worker needs to fetch a file: where it lives and what we already know about it.
struct tgm_file_data {
    tgm_file_id file_id;
    boost::optional<std::string> file_name;
    boost::optional<int64_t> file_size;
    boost::optional<std::string> mime_type;
    boost::optional<int64_t> date;
};

// Throw tgm_invalid_file_id. Metadata of the media is copied as is.
tgm_file_data tgm_make_file_data(const std::string& file_id);
tgm_file_data tgm_make_file_data(const tgm_media& media);

// Also throws tgm_no_downloadable_media if the reference is empty.
tgm_file_data tgm_make_file_data(const tgm_media_reference& reference);
