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

#include "tgm/tgm_file_data.h"

#include "tgm/tgm_error.h"
#include "tgm/tgm_log.h"

tgm_file_data tgm_make_file_data(const std::string& file_id)
{
    tgm_file_data data;
    data.file_id = tgm_decode_file_id(file_id);
    return data;
}

tgm_file_data tgm_make_file_data(const tgm_media& media)
{
    tgm_file_data data;
    data.file_id = tgm_decode_file_id(media.file_id);
    data.file_name = media.file_name;
    data.file_size = media.file_size;
    data.mime_type = media.mime_type;
    data.date = media.date;
    return data;
}

tgm_file_data tgm_make_file_data(const tgm_media_reference& reference)
{
    if (reference.media()) {
        return tgm_make_file_data(*reference.media());
    }

    if (reference.file_id()) {
        return tgm_make_file_data(*reference.file_id());
    }

    TGM_WARNING("nothing to download in the media reference");
    throw tgm_no_downloadable_media();
}
