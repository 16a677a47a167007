#include "utils/logger.hpp"
#include <stdexcept>
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
using namespace std;
//---------------------------------------------------------------------------
Logger::Level Logger::parseLevel(string_view name)
// Parse a level name
{
    for (auto level = static_cast<uint8_t>(Level::Error); level <= static_cast<uint8_t>(Level::Debug); level++) {
        if (name == getLevelName(static_cast<Level>(level)))
            return static_cast<Level>(level);
    }
    throw runtime_error("Unknown log level: " + string(name));
}
//---------------------------------------------------------------------------
void StreamLogger::write(Level level, string_view message)
// Write one line
{
    if (!_outStream)
        return;
    lock_guard<mutex> lock(_mutex);
    *_outStream << "[" << getLevelName(level) << "] " << message << "\n";
    _outStream->flush();
}
//---------------------------------------------------------------------------
void MemoryLogger::write(Level level, string_view message)
// Keep one line
{
    string line = "[";
    line += getLevelName(level);
    line += "] ";
    line += message;
    lock_guard<mutex> lock(_mutex);
    _lines.push_back(move(line));
}
//---------------------------------------------------------------------------
vector<string> MemoryLogger::getLines() const
// Get a copy of the lines
{
    lock_guard<mutex> lock(_mutex);
    return _lines;
}
//---------------------------------------------------------------------------
bool MemoryLogger::contains(string_view needle) const
// Does any line contain the needle
{
    lock_guard<mutex> lock(_mutex);
    for (auto& line : _lines)
        if (line.find(needle) != string::npos)
            return true;
    return false;
}
//---------------------------------------------------------------------------
} // namespace repoblob::utils
