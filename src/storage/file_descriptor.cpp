#include "storage/file_descriptor.hpp"
#include <stdexcept>
#include <utility>
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
using namespace std;
//---------------------------------------------------------------------------
FileDescriptor::FileDescriptor(string repo, string arch, string filename) : _repo(move(repo)), _arch(move(arch)), _filename(move(filename))
// The constructor
{
    validate(_repo, "repository");
    validate(_arch, "architecture");
    validate(_filename, "filename");
}
//---------------------------------------------------------------------------
void FileDescriptor::validate(string_view component, string_view name)
// A component is exactly one path segment
{
    if (component.empty())
        throw invalid_argument("Invalid file descriptor: Empty " + string(name) + "!");
    if (component.find('/') != string_view::npos)
        throw invalid_argument("Invalid file descriptor: The " + string(name) + " '" + string(component) + "' is not a single path segment!");
    // control characters would end up in header values
    for (auto c : component)
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f)
            throw invalid_argument("Invalid file descriptor: The " + string(name) + " contains control characters!");
    if (component == "." || component == "..")
        throw invalid_argument("Invalid file descriptor: The " + string(name) + " must not be a relative path segment!");
}
//---------------------------------------------------------------------------
string FileDescriptor::getPath() const
// The canonical store key
{
    string path;
    path.reserve(_repo.size() + _arch.size() + _filename.size() + 2);
    path += _repo;
    path += '/';
    path += _arch;
    path += '/';
    path += _filename;
    return path;
}
//---------------------------------------------------------------------------
} // namespace repoblob::storage
