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

#include "tgm/tgm_download_result.h"

#include "tgm/tgm_log.h"

tgm_download_result::tgm_download_result()
    : m_state(tgm_download_state::pending)
{
}

bool tgm_download_result::resolve(const std::string& path)
{
    return set(tgm_download_state::completed, path);
}

bool tgm_download_result::resolve_absent()
{
    return set(tgm_download_state::absent, boost::none);
}

bool tgm_download_result::set(tgm_download_state state, const boost::optional<std::string>& path)
{
    std::vector<resolved_callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != tgm_download_state::pending) {
            TGM_WARNING("download result already " << m_state << ", ignoring " << state);
            return false;
        }
        m_path = path;
        m_state = state;
        callbacks.swap(m_callbacks);
    }

    m_condition.notify_all();

    for (const auto& callback: callbacks) {
        callback(path);
    }

    return true;
}

tgm_download_state tgm_download_result::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

boost::optional<std::string> tgm_download_result::try_get() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_path;
}

boost::optional<std::string> tgm_download_result::wait() const
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_condition.wait(lock, [this] { return m_state != tgm_download_state::pending; });
    return m_path;
}

bool tgm_download_result::wait_for(std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_condition.wait_for(lock, timeout, [this] { return m_state != tgm_download_state::pending; });
}

void tgm_download_result::on_resolved(const resolved_callback& callback)
{
    if (!callback) {
        return;
    }

    boost::optional<std::string> path;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == tgm_download_state::pending) {
            m_callbacks.push_back(callback);
            return;
        }
        path = m_path;
    }

    callback(path);
}
