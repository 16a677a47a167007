#pragma once
#include <algorithm>
#include <cassert>
#include <cstdint>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string_view>
//---------------------------------------------------------------------------
// RepoBlob - Range-Aware Artifact Delivery
// RepoBlob Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace repoblob::utils {
//---------------------------------------------------------------------------
/// Minimal growable buffer for raw wire data (receive buffers, response heads, body chunks)
template <typename T>
class DataVector {
    private:
    /// Current capacity
    uint64_t _capacity;
    /// Current size
    uint64_t _size;
    /// The data
    std::unique_ptr<T[]> _data;

    public:
    /// Constructor
    constexpr DataVector() : _capacity(0), _size(0) {}

    /// Constructor with size
    explicit DataVector(uint64_t size) : _capacity(0), _size(0) {
        resize(size);
    }

    /// Copy constructor
    DataVector(const DataVector& rhs) : _capacity(0), _size(0) {
        reserve(rhs._capacity);
        _size = rhs._size;
        if (_size)
            std::memcpy(data(), rhs.cdata(), _size * sizeof(T));
    }

    /// Constructor from other pointers
    DataVector(const T* start, const T* end) : _capacity(0), _size(0) {
        assert(end - start >= 0);
        append(start, static_cast<uint64_t>(end - start));
    }

    /// Move constructor
    DataVector(DataVector&& rhs) noexcept : _capacity(rhs._capacity), _size(rhs._size), _data(std::move(rhs._data)) {
        rhs._capacity = 0;
        rhs._size = 0;
    }

    /// Get the data
    [[nodiscard]] T* data() {
        return _data.get();
    }

    /// Get the data
    [[nodiscard]] const T* cdata() const {
        return _data.get();
    }

    /// Get the size
    [[nodiscard]] constexpr uint64_t size() const {
        return _size;
    }

    /// Get the capacity
    [[nodiscard]] constexpr uint64_t capacity() const {
        return _capacity;
    }

    /// Is the vector empty
    [[nodiscard]] constexpr bool empty() const {
        return !_size;
    }

    /// Clear the size
    constexpr void clear() {
        _size = 0;
    }

    /// Increase the capacity
    void reserve(uint64_t cap) {
        if (_capacity < cap) {
            auto swap = std::unique_ptr<T[]>(new T[cap]());
            if (_data && _size)
                std::memcpy(swap.get(), _data.get(), _size * sizeof(T));
            _data.swap(swap);
            _capacity = cap;
        }
    }

    /// Change the number of elements
    void resize(uint64_t size) {
        if (size > _capacity)
            reserve(size);
        _size = size;
    }

    /// Append elements at the end, grows by at least half of the capacity
    void append(const T* src, uint64_t count) {
        if (!count)
            return;
        if (_size + count > _capacity)
            reserve(std::max(_size + count, _capacity + _capacity / 2));
        std::memcpy(_data.get() + _size, src, count * sizeof(T));
        _size += count;
    }

    /// Drop the first count elements and move the rest to the front
    void consume(uint64_t count) {
        if (count > _size)
            throw std::runtime_error("DataVector: cannot consume more than the size!");
        if (count < _size)
            std::memmove(_data.get(), _data.get() + count, (_size - count) * sizeof(T));
        _size -= count;
    }

    /// View the bytes as characters
    [[nodiscard]] std::string_view view() const
        requires(sizeof(T) == 1)
    {
        return std::string_view(reinterpret_cast<const char*>(_data.get()), _size);
    }
};
//---------------------------------------------------------------------------
} // namespace repoblob::utils
