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

#ifndef __TGM_DOWNLOAD_MANAGER_H__
#define __TGM_DOWNLOAD_MANAGER_H__

#include "tgm_download_config.h"
#include "tgm_download_request.h"
#include "tgm_download_result.h"
#include "tgm_media.h"

#include <boost/asio/io_service.hpp>
#include <boost/optional.hpp>

#include <functional>
#include <memory>
#include <string>

class tgm_download_queue;

using tgm_download_completion = std::function<void(const boost::optional<std::string>& path)>;

/*
 * Turns a media reference into a download request and queues it for the
 * download workers. All entry points throw tgm_no_downloadable_media or
 * tgm_invalid_file_id before queueing anything; once queued, the outcome
 * is either the absolute path of the file or boost::none.
 *
 * file_name is a path: "dir/" only picks the directory, "dir/name" both,
 * "name" only the name. Missing pieces come from the configuration, the
 * media's own file name, or a generated one.
 */
class tgm_download_manager
{
public:
    virtual ~tgm_download_manager() { }

    // Completions of download_media_async() are posted to io_service.
    static std::shared_ptr<tgm_download_manager> create(boost::asio::io_service& io_service,
            const std::shared_ptr<tgm_download_queue>& queue,
            const tgm_download_config& config = tgm_download_config());

    virtual const tgm_download_config& config() const = 0;

    // With block the call waits for the worker and returns its result, otherwise it returns boost::none right away.
    // Blocking parks the calling thread; code running on an io_service thread uses download_media_async() instead.
    virtual boost::optional<std::string> download_media(const tgm_media_reference& media,
            const std::string& file_name = TGM_DEFAULT_DOWNLOAD_DIRECTORY,
            bool block = true,
            const tgm_progress_callback& progress = nullptr,
            const std::shared_ptr<void>& progress_args = nullptr) = 0;

    // Never blocks. The returned result is resolved by the worker.
    virtual std::shared_ptr<tgm_download_result> submit_download(const tgm_media_reference& media,
            const std::string& file_name = TGM_DEFAULT_DOWNLOAD_DIRECTORY,
            const tgm_progress_callback& progress = nullptr,
            const std::shared_ptr<void>& progress_args = nullptr) = 0;

    // Does not block. completion is posted to the io_service given to create(), never run on the worker's
    // thread. That io_service must outlive every pending async download.
    virtual void download_media_async(const tgm_media_reference& media,
            const std::string& file_name,
            const tgm_download_completion& completion,
            const tgm_progress_callback& progress = nullptr,
            const std::shared_ptr<void>& progress_args = nullptr) = 0;
};

#endif
