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

#include "tgm/tgm_download_manager.h"
#include "tgm/tgm_download_queue.h"
#include "tgm/tgm_error.h"

#include <gtest/gtest.h>

#include <thread>

namespace {

const std::string VOICE_FILE_ID = "AwADBAADywT7cR8BAAL7_________wI";
const std::string PHOTO_FILE_ID = "AgADAQADYwAHTQAHeAI";

class download_manager_test: public ::testing::Test
{
protected:
    download_manager_test()
        : m_queue(std::make_shared<tgm_unbounded_download_queue>())
        , m_manager(tgm_download_manager::create(m_io_service, m_queue, tgm_download_config("/srv/bot")))
    { }

    // Plays the download worker: takes one request and resolves it.
    std::thread serve_one(bool succeed)
    {
        auto queue = m_queue;
        return std::thread([queue, succeed] {
            auto request = queue->wait_and_pop();
            request->report_progress(50, 100);
            if (succeed) {
                request->result()->resolve(request->path());
            } else {
                request->result()->resolve_absent();
            }
        });
    }

    boost::asio::io_service m_io_service;
    std::shared_ptr<tgm_unbounded_download_queue> m_queue;
    std::shared_ptr<tgm_download_manager> m_manager;
};

}

TEST_F(download_manager_test, create_requires_a_queue)
{
    EXPECT_THROW(tgm_download_manager::create(m_io_service, nullptr), std::invalid_argument);
}

TEST_F(download_manager_test, config_is_kept)
{
    EXPECT_EQ("/srv/bot", m_manager->config().base_directory());
    EXPECT_EQ(TGM_DEFAULT_DOWNLOAD_DIRECTORY, m_manager->config().download_directory());
}

TEST_F(download_manager_test, blocking_download_returns_worker_path)
{
    std::thread worker = serve_one(true);
    auto path = m_manager->download_media(VOICE_FILE_ID, "/tmp/voice.ogg");
    worker.join();

    ASSERT_TRUE(path);
    EXPECT_EQ("/tmp/voice.ogg", *path);
}

TEST_F(download_manager_test, blocking_download_without_file_returns_none)
{
    std::thread worker = serve_one(false);
    auto path = m_manager->download_media(VOICE_FILE_ID);
    worker.join();

    EXPECT_FALSE(path);
}

TEST_F(download_manager_test, non_blocking_download_returns_at_once)
{
    auto path = m_manager->download_media(PHOTO_FILE_ID, "pictures/", false);
    EXPECT_FALSE(path);

    ASSERT_EQ(1u, m_queue->size());
    auto request = m_queue->try_pop();
    EXPECT_EQ("/srv/bot/pictures", request->directory());
    EXPECT_EQ(0u, request->file_name().find("photo_"));
    EXPECT_EQ(tgm_download_state::pending, request->result()->state());
}

TEST_F(download_manager_test, submit_download_hands_back_the_request_result)
{
    auto result = m_manager->submit_download(PHOTO_FILE_ID, "/tmp/p.jpg");
    auto request = m_queue->try_pop();
    ASSERT_NE(nullptr, request);
    EXPECT_EQ(result, request->result());

    request->result()->resolve(request->path());
    EXPECT_EQ(std::string("/tmp/p.jpg"), *result->try_get());
}

TEST_F(download_manager_test, every_request_gets_its_own_name)
{
    m_manager->download_media(VOICE_FILE_ID, "/tmp/", false);
    m_manager->download_media(VOICE_FILE_ID, "/tmp/", false);

    auto first = m_queue->try_pop();
    auto second = m_queue->try_pop();
    ASSERT_NE(nullptr, first);
    ASSERT_NE(nullptr, second);
    EXPECT_NE(first->file_name(), second->file_name());
}

TEST_F(download_manager_test, media_metadata_reaches_the_request)
{
    auto media = std::make_shared<tgm_media>(VOICE_FILE_ID);
    media->file_name = std::string("memo.ogg");
    media->file_size = 2048;

    auto message = std::make_shared<tgm_message>();
    message->voice = media;

    m_manager->download_media(message, "/tmp/", false);
    auto request = m_queue->try_pop();
    ASSERT_NE(nullptr, request);
    EXPECT_EQ("memo.ogg", request->file_name());
    EXPECT_EQ(2048, *request->data().file_size);
    EXPECT_EQ(tgm_media_type::voice, request->data().file_id.media_type);
}

TEST_F(download_manager_test, errors_are_raised_before_queueing)
{
    EXPECT_THROW(m_manager->download_media(std::make_shared<tgm_message>()), tgm_no_downloadable_media);
    EXPECT_THROW(m_manager->download_media(std::shared_ptr<tgm_media>()), tgm_no_downloadable_media);
    EXPECT_THROW(m_manager->download_media(std::string("garbage")), tgm_invalid_file_id);
    EXPECT_THROW(m_manager->submit_download(std::make_shared<tgm_media>("BwADBAADAQAHAQAHAg")), tgm_invalid_file_id);
    EXPECT_TRUE(m_queue->empty());
}

TEST_F(download_manager_test, progress_reaches_the_caller_with_args)
{
    auto args = std::make_shared<std::string>("context");
    int64_t reported_current = 0;
    int64_t reported_total = 0;
    std::shared_ptr<void> reported_args;

    std::thread worker = serve_one(true);
    m_manager->download_media(VOICE_FILE_ID, "/tmp/", true,
            [&](int64_t current, int64_t total, const std::shared_ptr<void>& progress_args) {
                reported_current = current;
                reported_total = total;
                reported_args = progress_args;
            }, args);
    worker.join();

    EXPECT_EQ(50, reported_current);
    EXPECT_EQ(100, reported_total);
    EXPECT_EQ(args, reported_args);
}

TEST_F(download_manager_test, async_completion_runs_on_io_service)
{
    bool completed = false;
    boost::optional<std::string> completed_path;
    m_manager->download_media_async(VOICE_FILE_ID, "/tmp/async.ogg",
            [&](const boost::optional<std::string>& path) {
                completed = true;
                completed_path = path;
            });

    auto request = m_queue->try_pop();
    ASSERT_NE(nullptr, request);
    request->result()->resolve(request->path());
    EXPECT_FALSE(completed);

    m_io_service.run();
    EXPECT_TRUE(completed);
    ASSERT_TRUE(completed_path);
    EXPECT_EQ("/tmp/async.ogg", *completed_path);
}

TEST_F(download_manager_test, async_completion_reports_absence)
{
    bool completed = false;
    boost::optional<std::string> completed_path = std::string("unset");
    m_manager->download_media_async(PHOTO_FILE_ID, "",
            [&](const boost::optional<std::string>& path) {
                completed = true;
                completed_path = path;
            });

    m_queue->try_pop()->result()->resolve_absent();
    m_io_service.run();
    EXPECT_TRUE(completed);
    EXPECT_FALSE(completed_path);
}

TEST_F(download_manager_test, async_completion_runs_on_the_io_service_thread)
{
    std::thread::id completion_thread;
    m_manager->download_media_async(VOICE_FILE_ID, "/tmp/async.ogg",
            [&](const boost::optional<std::string>&) {
                completion_thread = std::this_thread::get_id();
            });

    std::thread worker = serve_one(true);
    worker.join();
    EXPECT_EQ(std::thread::id(), completion_thread);

    m_io_service.run();
    EXPECT_EQ(std::this_thread::get_id(), completion_thread);
}
