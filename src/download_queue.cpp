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

#include "tgm/tgm_download_queue.h"

#include "tgm/tgm_download_request.h"

void tgm_unbounded_download_queue::push(const std::shared_ptr<tgm_download_request>& request)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_requests.push_back(request);
    }
    m_condition.notify_one();
}

std::shared_ptr<tgm_download_request> tgm_unbounded_download_queue::pop_front()
{
    auto request = std::move(m_requests.front());
    m_requests.pop_front();
    return request;
}

std::shared_ptr<tgm_download_request> tgm_unbounded_download_queue::try_pop()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_requests.empty()) {
        return nullptr;
    }
    return pop_front();
}

std::shared_ptr<tgm_download_request> tgm_unbounded_download_queue::wait_and_pop()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_condition.wait(lock, [this] { return !m_requests.empty(); });
    return pop_front();
}

std::shared_ptr<tgm_download_request> tgm_unbounded_download_queue::wait_for_and_pop(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_condition.wait_for(lock, timeout, [this] { return !m_requests.empty(); })) {
        return nullptr;
    }
    return pop_front();
}

size_t tgm_unbounded_download_queue::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_requests.size();
}

bool tgm_unbounded_download_queue::empty() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_requests.empty();
}
