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

#include "tgm/tgm_log.h"

#include <gtest/gtest.h>

#include <vector>

namespace {

class log_test: public ::testing::Test
{
protected:
    virtual void TearDown() override
    {
        tgm_init_log(nullptr, tgm_log_level::level_notice);
    }
};

}

TEST_F(log_test, filters_by_level)
{
    std::vector<std::string> lines;
    tgm_init_log([&lines](const std::string& line, tgm_log_level) { lines.push_back(line); },
            tgm_log_level::level_warning);

    TGM_NOTICE("dropped");
    TGM_WARNING("kept " << 1);
    TGM_ERROR("kept " << 2);

    ASSERT_EQ(2u, lines.size());
    EXPECT_NE(std::string::npos, lines[0].find("kept 1"));
    EXPECT_NE(std::string::npos, lines[0].find("log_test.cpp:"));
    EXPECT_NE(std::string::npos, lines[1].find("kept 2"));
}

TEST_F(log_test, sink_may_log_again)
{
    std::vector<std::string> lines;
    tgm_init_log([&lines](const std::string& line, tgm_log_level level) {
                lines.push_back(line);
                if (level == tgm_log_level::level_error) {
                    TGM_WARNING("sink saw an error");
                }
            }, tgm_log_level::level_notice);

    TGM_ERROR("disk full");

    ASSERT_EQ(2u, lines.size());
    EXPECT_NE(std::string::npos, lines[0].find("disk full"));
    EXPECT_NE(std::string::npos, lines[1].find("sink saw an error"));
}

TEST_F(log_test, nothing_is_logged_without_a_sink)
{
    tgm_init_log(nullptr, tgm_log_level::level_debug);
    EXPECT_FALSE(tgm_log_enabled(tgm_log_level::level_error));
    tgm_log("ignored", tgm_log_level::level_error);
}
