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

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace tgm {
namespace impl {

class file_id_format_error: public std::runtime_error
{
public:
    explicit file_id_format_error(const std::string& what)
        : std::runtime_error(what)
    { }
};

// Little-endian, unaligned reader over a decoded file id record.
class file_id_in_buffer
{
public:
    explicit file_id_in_buffer(const std::string& data)
        : m_data(data)
        , m_offset(0)
    { }

    int32_t fetch_i32()
    {
        return static_cast<int32_t>(fetch_unsigned(4));
    }

    int64_t fetch_i64()
    {
        return static_cast<int64_t>(fetch_unsigned(8));
    }

    char fetch_char()
    {
        return static_cast<char>(fetch_unsigned(1));
    }

    bool fetch_bool()
    {
        return fetch_unsigned(1) != 0;
    }

    size_t remaining() const { return m_data.size() - m_offset; }

private:
    uint64_t fetch_unsigned(size_t width)
    {
        if (remaining() < width) {
            throw file_id_format_error("file id record is truncated");
        }
        uint64_t value = 0;
        for (size_t i = 0; i < width; ++i) {
            value |= static_cast<uint64_t>(static_cast<unsigned char>(m_data[m_offset + i])) << (8 * i);
        }
        m_offset += width;
        return value;
    }

private:
    const std::string& m_data;
    size_t m_offset;
};

class file_id_out_buffer
{
public:
    void out_i32(int32_t i) { out_unsigned(static_cast<uint32_t>(i), 4); }
    void out_i64(int64_t i) { out_unsigned(static_cast<uint64_t>(i), 8); }
    void out_char(char c) { m_data.push_back(c); }
    void out_bool(bool b) { m_data.push_back(b ? 1 : 0); }

    const std::string& data() const { return m_data; }

private:
    void out_unsigned(uint64_t value, size_t width)
    {
        for (size_t i = 0; i < width; ++i) {
            m_data.push_back(static_cast<char>((value >> (8 * i)) & 0xff));
        }
    }

private:
    std::string m_data;
};

}
}
