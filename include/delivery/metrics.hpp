#pragma once
#include <cstdint>
#include <map>
#include <mutex>
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
namespace repoblob::delivery {
//---------------------------------------------------------------------------
/// The sink for named counters
class Metrics {
    public:
    /// The destructor
    virtual ~Metrics() noexcept = default;
    /// Increment the counter by one
    virtual void increment(std::string_view name) = 0;
};
//---------------------------------------------------------------------------
/// Thread-safe in-process counters
class CounterMetrics : public Metrics {
    /// The counters
    std::map<std::string, uint64_t, std::less<>> _counters;
    /// Guards the counters
    mutable std::mutex _mutex;

    public:
    /// Increment the counter by one
    void increment(std::string_view name) override;
    /// Get the counter value, 0 if never incremented
    [[nodiscard]] uint64_t get(std::string_view name) const;
    /// Get a copy of all counters
    [[nodiscard]] std::map<std::string, uint64_t, std::less<>> snapshot() const;
};
//---------------------------------------------------------------------------
} // namespace repoblob::delivery
