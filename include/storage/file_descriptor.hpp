#pragma once
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
/// Logical address of a stored object: repository, architecture and filename.
/// The canonical path "repo/arch/filename" is the key of the object in a store.
class FileDescriptor {
    /// The repository name
    std::string _repo;
    /// The architecture
    std::string _arch;
    /// The filename
    std::string _filename;

    /// Checks one path component, throws std::invalid_argument
    static void validate(std::string_view component, std::string_view name);

    public:
    /// The constructor, all components need to be non-empty path segments
    FileDescriptor(std::string repo, std::string arch, std::string filename);

    /// Get the repository
    [[nodiscard]] const std::string& getRepo() const { return _repo; }
    /// Get the architecture
    [[nodiscard]] const std::string& getArch() const { return _arch; }
    /// Get the filename
    [[nodiscard]] const std::string& getFilename() const { return _filename; }
    /// Get the canonical path
    [[nodiscard]] std::string getPath() const;

    /// Compare
    bool operator==(const FileDescriptor& other) const = default;
};
//---------------------------------------------------------------------------
} // namespace repoblob::storage
