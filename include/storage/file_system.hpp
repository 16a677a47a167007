#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
//---------------------------------------------------------------------------
// RepoBlob - Range-Aware Artifact Delivery
// RepoBlob Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace repoblob::storage {
//---------------------------------------------------------------------------
/// POSIX helpers shared by the file backed stores
struct FileSystem {
    /// An opened regular file
    struct OpenFile {
        /// The file descriptor, owned by the caller
        int fd;
        /// The file size
        uint64_t size;
    };

    /// Open a regular file for reading, nullopt if it does not exist
    [[nodiscard]] static std::optional<OpenFile> openRegular(const std::string& path);
    /// Read a small file completely, nullopt if it does not exist
    [[nodiscard]] static std::optional<std::string> readFile(const std::string& path);
    /// Write a file through a temporary file and rename it into place
    static void writeAtomically(const std::string& path, std::string_view data);
    /// Unlink a file, false if it did not exist
    static bool unlinkFile(const std::string& path);
    /// Does a file exist
    [[nodiscard]] static bool exists(const std::string& path);
};
//---------------------------------------------------------------------------
} // namespace repoblob::storage
