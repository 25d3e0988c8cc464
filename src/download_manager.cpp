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

#include "download_manager.h"

#include "tgm/tgm_download_queue.h"
#include "tgm/tgm_download_target.h"
#include "tgm/tgm_file_data.h"
#include "tgm/tgm_log.h"
#include "tgm/tgm_random.h"
#include "tools.h"

#include <stdexcept>

std::shared_ptr<tgm_download_manager> tgm_download_manager::create(boost::asio::io_service& io_service,
        const std::shared_ptr<tgm_download_queue>& queue,
        const tgm_download_config& config)
{
    if (!queue) {
        throw std::invalid_argument("a download queue is required");
    }
    return std::make_shared<tgm::impl::download_manager>(io_service, queue, config);
}

namespace tgm {
namespace impl {

std::shared_ptr<tgm_download_request> download_manager::create_request(const tgm_media_reference& media,
        const std::string& file_name,
        const tgm_progress_callback& progress,
        const std::shared_ptr<void>& progress_args) const
{
    tgm_file_data data = tgm_make_file_data(media);
    tgm_download_target target = tgm_resolve_download_target(m_config, file_name, data,
            tgm_random_id(), tgm_get_system_time());
    return std::make_shared<tgm_download_request>(data, target, progress, progress_args);
}

std::shared_ptr<tgm_download_result> download_manager::submit_download(const tgm_media_reference& media,
        const std::string& file_name,
        const tgm_progress_callback& progress,
        const std::shared_ptr<void>& progress_args)
{
    auto request = create_request(media, file_name, progress, progress_args);
    TGM_DEBUG("queueing download of " << request->data().file_id.media_type << " to " << request->path());
    m_queue->push(request);
    return request->result();
}

boost::optional<std::string> download_manager::download_media(const tgm_media_reference& media,
        const std::string& file_name, bool block,
        const tgm_progress_callback& progress,
        const std::shared_ptr<void>& progress_args)
{
    auto result = submit_download(media, file_name, progress, progress_args);
    if (!block) {
        return boost::none;
    }

    auto path = result->wait();
    if (!path) {
        TGM_NOTICE("download finished without a file");
    }
    return path;
}

void download_manager::download_media_async(const tgm_media_reference& media,
        const std::string& file_name,
        const tgm_download_completion& completion,
        const tgm_progress_callback& progress,
        const std::shared_ptr<void>& progress_args)
{
    auto result = submit_download(media, file_name, progress, progress_args);
    if (!completion) {
        return;
    }

    boost::asio::io_service* io_service = &m_io_service;
    result->on_resolved([io_service, completion](const boost::optional<std::string>& path) {
        io_service->post(std::bind(completion, path));
    });
}

}
}
