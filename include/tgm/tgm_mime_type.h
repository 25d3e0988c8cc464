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

#ifndef __TGM_MIME_TYPE_H__
#define __TGM_MIME_TYPE_H__

#include <string>

// Lookups are case insensitive. Unknown types map to application/octet-stream.
std::string tgm_mime_type_by_filename(const std::string& filename);
std::string tgm_mime_type_by_extension(const std::string& extension);

// Extension without the leading dot, empty if the mime type is unknown.
std::string tgm_extension_by_mime_type(const std::string& mime_type);

#endif
