#include "storage/media_types.hpp"
#include <array>
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
string_view MediaTypes::lookup(string_view filename) noexcept
// Get the media type by extension
{
    static constexpr array<pair<string_view, string_view>, 6> types = {{
        {".rpm", package},
        {".xml", "application/xml"},
        {".gz", "application/x-gzip"},
        {".bz2", "application/x-bzip2"},
        {".sqlite", "application/x-sqlite3"},
        {".txt", "text/plain"},
    }};

    for (auto& [extension, type] : types)
        if (filename.size() > extension.size() && filename.ends_with(extension))
            return type;
    return {};
}
//---------------------------------------------------------------------------
} // namespace repoblob::storage
