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

#include "crypto_base64.h"

#include <vector>

static inline bool is_base64_alnum(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

std::string TGMC_base64url_encode(const std::string& data)
{
    if (data.empty()) {
        return std::string();
    }

    std::vector<unsigned char> buffer(4 * ((data.size() + 2) / 3) + 1);
    int length = TGMC_base64_encode_block(buffer.data(),
            reinterpret_cast<const unsigned char*>(data.data()), static_cast<int>(data.size()));

    std::string text;
    text.reserve(length);
    for (int i = 0; i < length; ++i) {
        char c = static_cast<char>(buffer[i]);
        if (c == '=') {
            break;
        }
        if (c == '+') {
            c = '-';
        } else if (c == '/') {
            c = '_';
        }
        text.push_back(c);
    }
    return text;
}

bool TGMC_base64url_decode(const std::string& text, std::string& data)
{
    data.clear();

    std::string standard;
    standard.reserve(text.size() + 3);
    size_t padding = 0;
    for (char c: text) {
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding) {
            // padding only at the end
            return false;
        }
        if (c == '-') {
            c = '+';
        } else if (c == '_') {
            c = '/';
        } else if (!is_base64_alnum(c)) {
            return false;
        }
        standard.push_back(c);
    }

    if (padding > 2) {
        return false;
    }

    size_t remainder = standard.size() % 4;
    if (remainder == 1) {
        return false;
    }

    size_t missing = remainder ? 4 - remainder : 0;
    standard.append(missing, '=');
    if (standard.empty()) {
        return true;
    }

    std::vector<unsigned char> buffer(standard.size() / 4 * 3 + 1);
    int length = TGMC_base64_decode_block(buffer.data(),
            reinterpret_cast<const unsigned char*>(standard.data()), static_cast<int>(standard.size()));
    if (length < 0 || static_cast<size_t>(length) < missing) {
        return false;
    }

    // EVP_DecodeBlock counts the padding as zero bytes.
    data.assign(reinterpret_cast<const char*>(buffer.data()), length - missing);
    return true;
}
