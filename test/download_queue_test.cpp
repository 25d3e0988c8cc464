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

#include <gtest/gtest.h>

#include <set>
#include <thread>
#include <vector>

namespace {

std::shared_ptr<tgm_download_request> make_request(const std::string& file_name)
{
    tgm_file_data data;
    data.file_id = tgm_file_id(tgm_media_type::document, std::make_shared<tgm_document_location>());
    tgm_download_target target;
    target.directory = "/tmp";
    target.file_name = file_name;
    return std::make_shared<tgm_download_request>(data, target, nullptr, nullptr);
}

}

TEST(download_queue, pops_in_push_order)
{
    tgm_unbounded_download_queue queue;
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(nullptr, queue.try_pop());

    queue.push(make_request("a"));
    queue.push(make_request("b"));
    EXPECT_EQ(2u, queue.size());

    EXPECT_EQ("a", queue.try_pop()->file_name());
    EXPECT_EQ("b", queue.wait_and_pop()->file_name());
    EXPECT_TRUE(queue.empty());
}

TEST(download_queue, wait_for_and_pop_times_out)
{
    tgm_unbounded_download_queue queue;
    EXPECT_EQ(nullptr, queue.wait_for_and_pop(std::chrono::milliseconds(10)));
}

TEST(download_queue, wakes_waiting_worker)
{
    tgm_unbounded_download_queue queue;
    std::shared_ptr<tgm_download_request> popped;
    std::thread worker([&] {
        popped = queue.wait_and_pop();
    });

    queue.push(make_request("late"));
    worker.join();
    ASSERT_NE(nullptr, popped);
    EXPECT_EQ("late", popped->file_name());
}

TEST(download_queue, concurrent_producers_lose_nothing)
{
    tgm_unbounded_download_queue queue;
    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&queue, p] {
            for (int i = 0; i < 250; ++i) {
                queue.push(make_request(std::to_string(p) + "_" + std::to_string(i)));
            }
        });
    }
    for (auto& producer: producers) {
        producer.join();
    }

    EXPECT_EQ(1000u, queue.size());
    std::set<std::string> names;
    while (auto request = queue.try_pop()) {
        names.insert(request->file_name());
    }
    EXPECT_EQ(1000u, names.size());
}

TEST(download_request, forwards_progress_with_args)
{
    auto args = std::make_shared<int>(7);
    std::vector<std::pair<int64_t, int64_t>> reports;
    std::shared_ptr<void> seen_args;

    tgm_file_data data;
    data.file_id = tgm_file_id(tgm_media_type::video, std::make_shared<tgm_document_location>());
    tgm_download_target target;
    target.directory = "/tmp/videos";
    target.file_name = "v.mp4";
    tgm_download_request request(data, target,
            [&](int64_t current, int64_t total, const std::shared_ptr<void>& progress_args) {
                reports.emplace_back(current, total);
                seen_args = progress_args;
            }, args);

    request.report_progress(512, 1024);
    request.report_progress(1024, 1024);

    ASSERT_EQ(2u, reports.size());
    EXPECT_EQ(512, reports[0].first);
    EXPECT_EQ(1024, reports[1].second);
    EXPECT_EQ(args, seen_args);
    EXPECT_EQ("/tmp/videos/v.mp4", request.path());
    EXPECT_EQ(tgm_download_state::pending, request.result()->state());
}

TEST(download_request, progress_without_callback_is_ignored)
{
    auto request = make_request("quiet");
    request->report_progress(1, 2);
    EXPECT_FALSE(request->result()->is_resolved());
}
