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

#include "tgm/tgm_download_request.h"

#include <boost/filesystem.hpp>

tgm_download_request::tgm_download_request(const tgm_file_data& data, const tgm_download_target& target,
        const tgm_progress_callback& progress, const std::shared_ptr<void>& progress_args)
    : m_data(data)
    , m_directory(target.directory)
    , m_file_name(target.file_name)
    , m_result(std::make_shared<tgm_download_result>())
    , m_progress(progress)
    , m_progress_args(progress_args)
{
}

std::string tgm_download_request::path() const
{
    return (boost::filesystem::path(m_directory) / m_file_name).string();
}

void tgm_download_request::report_progress(int64_t current, int64_t total) const
{
    if (m_progress) {
        m_progress(current, total, m_progress_args);
    }
}
