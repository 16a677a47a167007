#include "storage/delivery_error.hpp"
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
DeliveryError::DeliveryError(Kind kind, const string& message, string path, string rangeHeader) : runtime_error(message), _kind(kind), _path(move(path)), _rangeHeader(move(rangeHeader))
// The constructor
{
}
//---------------------------------------------------------------------------
MalformedRange::MalformedRange(const string& message, string rangeHeader, string path) : DeliveryError(Kind::MalformedRange, message, move(path), move(rangeHeader))
// The constructor
{
}
//---------------------------------------------------------------------------
InvalidRangeOrder::InvalidRangeOrder(const string& message, string rangeHeader, string path) : DeliveryError(Kind::InvalidRangeOrder, message, move(path), move(rangeHeader))
// The constructor
{
}
//---------------------------------------------------------------------------
RangeNotSatisfiable::RangeNotSatisfiable(string path, uint64_t offset, uint64_t fileLength)
    : DeliveryError(Kind::RangeNotSatisfiable, "Range start " + to_string(offset) + " is beyond the length " + to_string(fileLength) + " of [" + path + "]", path, ""), _fileLength(fileLength)
// The constructor
{
}
//---------------------------------------------------------------------------
ObjectNotFound::ObjectNotFound(string path) : DeliveryError(Kind::ObjectNotFound, "Object not found [" + path + "]", path, "")
// The constructor
{
}
//---------------------------------------------------------------------------
} // namespace repoblob::storage
