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

#include "tgm_download_result.h"
#include "tgm_download_target.h"
#include "tgm_file_data.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

// The args are whatever the caller passed along with the callback, handed back untouched.
using tgm_progress_callback = std::function<void(int64_t current, int64_t total, const std::shared_ptr<void>& args)>;

/*
 * One unit of work for the download workers. A worker fetches data into
 * directory/file_name, calls report_progress() as bytes arrive and finally
 * resolves the result with the absolute path, or as absent when the
 * transfer failed or was stopped.
 */
class tgm_download_request
{
public:
    tgm_download_request(const tgm_file_data& data, const tgm_download_target& target,
            const tgm_progress_callback& progress, const std::shared_ptr<void>& progress_args);

    const tgm_file_data& data() const { return m_data; }
    const std::string& directory() const { return m_directory; }
    const std::string& file_name() const { return m_file_name; }
    std::string path() const;

    const std::shared_ptr<tgm_download_result>& result() const { return m_result; }

    void report_progress(int64_t current, int64_t total) const;

private:
    tgm_file_data m_data;
    std::string m_directory;
    std::string m_file_name;
    std::shared_ptr<tgm_download_result> m_result;
    tgm_progress_callback m_progress;
    std::shared_ptr<void> m_progress_args;
};
