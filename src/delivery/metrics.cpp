#include "delivery/metrics.hpp"
//---------------------------------------------------------------------------
// RepoBlob - Range-Aware Artifact Delivery
// RepoBlob Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace repoblob::delivery {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
void CounterMetrics::increment(string_view name)
// Increment the counter
{
    lock_guard lock(_mutex);
    auto it = _counters.find(name);
    if (it == _counters.end())
        it = _counters.emplace(string(name), 0).first;
    it->second++;
}
//---------------------------------------------------------------------------
uint64_t CounterMetrics::get(string_view name) const
// Get the counter value
{
    lock_guard lock(_mutex);
    auto it = _counters.find(name);
    return it == _counters.end() ? 0 : it->second;
}
//---------------------------------------------------------------------------
map<string, uint64_t, less<>> CounterMetrics::snapshot() const
// Copy all counters
{
    lock_guard lock(_mutex);
    return _counters;
}
//---------------------------------------------------------------------------
} // namespace repoblob::delivery
