#include "storage/object_store.hpp"
#include "storage/content_store.hpp"
#include "storage/delivery_error.hpp"
#include "storage/local_store.hpp"
#include "storage/memory_store.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
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
ObjectStore::Window ObjectStore::window(const FileDescriptor& descriptor, uint64_t fileLength, uint64_t offset, optional<uint64_t> length)
// Clamp the requested window
{
    if (offset >= fileLength)
        throw RangeNotSatisfiable(descriptor.getPath(), offset, fileLength);
    auto available = fileLength - offset;
    return Window{.offset = offset, .length = length ? min(*length, available) : available};
}
//---------------------------------------------------------------------------
unique_ptr<ObjectStore> ObjectStore::makeStore(string_view uri)
// Create the store
{
    static constexpr string_view strMemory = "memory://";
    static constexpr string_view strFile = "file://";
    static constexpr string_view strContent = "cas://";

    auto directory = [&](string_view prefix) {
        auto path = uri.substr(prefix.size());
        if (!path.starts_with('/'))
            throw runtime_error("Invalid store uri: " + string(uri) + " needs an absolute path!");
        return string(path);
    };

    if (uri == strMemory)
        return make_unique<MemoryStore>();
    if (uri.starts_with(strFile))
        return make_unique<LocalStore>(directory(strFile));
    if (uri.starts_with(strContent))
        return make_unique<ContentStore>(directory(strContent));
    throw runtime_error("Invalid store uri: " + string(uri) + "!");
}
//---------------------------------------------------------------------------
} // namespace repoblob::storage
