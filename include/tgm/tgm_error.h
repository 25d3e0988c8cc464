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

#ifndef __TGM_ERROR_H__
#define __TGM_ERROR_H__

#include <stdexcept>
#include <string>

// Thrown when a message or media reference carries nothing that can be downloaded.
class tgm_no_downloadable_media: public std::runtime_error
{
public:
    tgm_no_downloadable_media()
        : std::runtime_error("this message doesn't contain any downloadable media")
    { }
};

// Thrown for every file id decoding failure, textual or binary.
class tgm_invalid_file_id: public std::runtime_error
{
public:
    explicit tgm_invalid_file_id(const std::string& file_id)
        : std::runtime_error("invalid file id: " + file_id)
        , m_file_id(file_id)
    { }

    const std::string& file_id() const { return m_file_id; }

private:
    std::string m_file_id;
};

#endif
