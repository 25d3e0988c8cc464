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

#include "tgm/tgm_download_config.h"

#include <boost/filesystem.hpp>

tgm_download_config::tgm_download_config()
    : m_base_directory(boost::filesystem::current_path().string())
    , m_download_directory(TGM_DEFAULT_DOWNLOAD_DIRECTORY)
{
}

tgm_download_config::tgm_download_config(const std::string& base_directory, const std::string& download_directory)
    : m_base_directory(base_directory)
    , m_download_directory(download_directory)
{
}
