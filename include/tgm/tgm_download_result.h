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

#ifndef __TGM_DOWNLOAD_RESULT_H__
#define __TGM_DOWNLOAD_RESULT_H__

#include <boost/optional.hpp>

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

enum class tgm_download_state
{
    pending,
    completed,  // resolved to a path
    absent,     // resolved without a file: failed or stopped
};

inline static std::string to_string(tgm_download_state state)
{
    switch (state) {
    case tgm_download_state::pending:
        return "pending";
    case tgm_download_state::completed:
        return "completed";
    case tgm_download_state::absent:
        return "absent";
    }

    assert(false);
    return "unknown";
}

inline static std::ostream& operator<<(std::ostream& os, tgm_download_state state)
{
    os << to_string(state);
    return os;
}

/*
 * The outcome of one download. Written once by the worker through resolve()
 * or resolve_absent(), which store the value before waking anybody up;
 * read by the dispatcher through wait(), try_get() or on_resolved().
 */
class tgm_download_result
{
public:
    using resolved_callback = std::function<void(const boost::optional<std::string>& path)>;

    tgm_download_result();

    // Only the first resolution counts. Returns false if the result was already resolved.
    bool resolve(const std::string& path);
    bool resolve_absent();

    tgm_download_state state() const;
    bool is_resolved() const { return state() != tgm_download_state::pending; }

    // boost::none while pending or when resolved to absent; check state() to tell them apart.
    boost::optional<std::string> try_get() const;

    // Blocks until resolved.
    boost::optional<std::string> wait() const;

    // Returns false on timeout.
    bool wait_for(std::chrono::milliseconds timeout) const;

    // Called exactly once with the final value, right away if already resolved.
    void on_resolved(const resolved_callback& callback);

private:
    bool set(tgm_download_state state, const boost::optional<std::string>& path);

private:
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_condition;
    tgm_download_state m_state;
    boost::optional<std::string> m_path;
    std::vector<resolved_callback> m_callbacks;
};

#endif
