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

#include "tgm/tgm_mime_type.h"

#include <gtest/gtest.h>

TEST(mime_type, extension_by_mime_type)
{
    EXPECT_EQ("mp4", tgm_extension_by_mime_type("video/mp4"));
    EXPECT_EQ("jpg", tgm_extension_by_mime_type("image/jpeg"));
    EXPECT_EQ("ogg", tgm_extension_by_mime_type("Audio/OGG"));
    EXPECT_EQ("", tgm_extension_by_mime_type("application/x-made-up"));
    EXPECT_EQ("", tgm_extension_by_mime_type(""));
}

TEST(mime_type, mime_type_by_filename)
{
    EXPECT_EQ("application/pdf", tgm_mime_type_by_filename("report.PDF"));
    EXPECT_EQ("image/jpeg", tgm_mime_type_by_filename("holiday.jpeg"));
    EXPECT_EQ("application/octet-stream", tgm_mime_type_by_filename("README"));
    EXPECT_EQ("application/octet-stream", tgm_mime_type_by_filename("archive."));
    EXPECT_EQ("application/octet-stream", tgm_mime_type_by_filename("data.xyz"));
}

TEST(mime_type, extension_and_mime_type_agree)
{
    for (const char* mime_type: { "audio/mpeg", "image/webp", "application/zip", "video/quicktime" }) {
        EXPECT_EQ(mime_type, tgm_mime_type_by_extension(tgm_extension_by_mime_type(mime_type)));
    }
}

TEST(mime_type, non_ascii_input_is_unknown)
{
    EXPECT_EQ("", tgm_extension_by_mime_type("image/\xe9\xff"));
    EXPECT_EQ("", tgm_extension_by_mime_type("\xc3\xa9/\x80"));
    EXPECT_EQ("application/octet-stream", tgm_mime_type_by_filename("photo.\xe9\xff"));
}
