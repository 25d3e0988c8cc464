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

#ifndef __TGM_CRYPTO_BASE64_H__
#define __TGM_CRYPTO_BASE64_H__

#include <openssl/evp.h>

#include <string>

// Both return the number of bytes written, a negative value on malformed input.
inline static int TGMC_base64_encode_block(unsigned char* to, const unsigned char* from, int length)
{
    return EVP_EncodeBlock(to, from, length);
}

inline static int TGMC_base64_decode_block(unsigned char* to, const unsigned char* from, int length)
{
    return EVP_DecodeBlock(to, from, length);
}

// URL-safe alphabet ('-' and '_'), no padding on output, padding optional on input.
std::string TGMC_base64url_encode(const std::string& data);
bool TGMC_base64url_decode(const std::string& text, std::string& data);

#endif
