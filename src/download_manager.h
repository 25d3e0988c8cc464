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

#include "tgm/tgm_download_manager.h"

#include <memory>

namespace tgm {
namespace impl {

class download_manager: public std::enable_shared_from_this<download_manager>, public tgm_download_manager
{
public:
    download_manager(boost::asio::io_service& io_service,
            const std::shared_ptr<tgm_download_queue>& queue,
            const tgm_download_config& config)
        : m_io_service(io_service)
        , m_queue(queue)
        , m_config(config)
    { }

    virtual const tgm_download_config& config() const override { return m_config; }
    virtual boost::optional<std::string> download_media(const tgm_media_reference& media,
            const std::string& file_name, bool block,
            const tgm_progress_callback& progress,
            const std::shared_ptr<void>& progress_args) override;
    virtual std::shared_ptr<tgm_download_result> submit_download(const tgm_media_reference& media,
            const std::string& file_name,
            const tgm_progress_callback& progress,
            const std::shared_ptr<void>& progress_args) override;
    virtual void download_media_async(const tgm_media_reference& media,
            const std::string& file_name,
            const tgm_download_completion& completion,
            const tgm_progress_callback& progress,
            const std::shared_ptr<void>& progress_args) override;

private:
    std::shared_ptr<tgm_download_request> create_request(const tgm_media_reference& media,
            const std::string& file_name,
            const tgm_progress_callback& progress,
            const std::shared_ptr<void>& progress_args) const;

private:
    boost::asio::io_service& m_io_service;
    std::shared_ptr<tgm_download_queue> m_queue;
    tgm_download_config m_config;
};

}
}
