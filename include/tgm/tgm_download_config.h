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

#ifndef __TGM_DOWNLOAD_CONFIG_H__
#define __TGM_DOWNLOAD_CONFIG_H__

#include <string>

#define TGM_DEFAULT_DOWNLOAD_DIRECTORY "downloads/"

/*
 * Where downloads land when the caller doesn't give an absolute directory.
 * Relative directories are resolved against base_directory(); a caller
 * giving no directory at all gets download_directory() instead.
 */
class tgm_download_config
{
public:
    // The base directory is the working directory at the time of the call.
    tgm_download_config();
    explicit tgm_download_config(const std::string& base_directory,
            const std::string& download_directory = TGM_DEFAULT_DOWNLOAD_DIRECTORY);

    const std::string& base_directory() const { return m_base_directory; }
    void set_base_directory(const std::string& directory) { m_base_directory = directory; }

    const std::string& download_directory() const { return m_download_directory; }
    void set_download_directory(const std::string& directory) { m_download_directory = directory; }

private:
    std::string m_base_directory;
    std::string m_download_directory;
};

#endif
