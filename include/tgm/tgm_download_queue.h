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

#ifndef __TGM_DOWNLOAD_QUEUE_H__
#define __TGM_DOWNLOAD_QUEUE_H__

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>

class tgm_download_request;

// Where the dispatcher hands requests over to the download workers.
class tgm_download_queue
{
public:
    virtual ~tgm_download_queue() { }

    // Must not block, whatever the number of concurrent callers.
    virtual void push(const std::shared_ptr<tgm_download_request>& request) = 0;
};

class tgm_unbounded_download_queue: public tgm_download_queue
{
public:
    tgm_unbounded_download_queue() = default;
    tgm_unbounded_download_queue(const tgm_unbounded_download_queue&) = delete;
    tgm_unbounded_download_queue& operator=(const tgm_unbounded_download_queue&) = delete;

    virtual void push(const std::shared_ptr<tgm_download_request>& request) override;

    // Null if the queue is empty.
    std::shared_ptr<tgm_download_request> try_pop();
    std::shared_ptr<tgm_download_request> wait_and_pop();
    // Null on timeout.
    std::shared_ptr<tgm_download_request> wait_for_and_pop(std::chrono::milliseconds timeout);

    size_t size() const;
    bool empty() const;

private:
    std::shared_ptr<tgm_download_request> pop_front();

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::deque<std::shared_ptr<tgm_download_request>> m_requests;
};

#endif
