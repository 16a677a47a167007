#pragma once
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
/// Maps filename extensions to media types
struct MediaTypes {
    /// The package media type, delivered as attachment
    static constexpr std::string_view package = "application/x-rpm";

    /// Get the media type of a filename, empty if unknown
    [[nodiscard]] static std::string_view lookup(std::string_view filename) noexcept;
    /// Is the media type the package media type
    [[nodiscard]] static constexpr bool isPackage(std::string_view contentType) noexcept { return contentType == package; }
};
//---------------------------------------------------------------------------
} // namespace repoblob::storage
