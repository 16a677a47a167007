#include "storage/file_system.hpp"
#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
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
namespace {
//---------------------------------------------------------------------------
/// Errors that mean the path does not name an object
bool isMissing(int error) { return error == ENOENT || error == ENOTDIR; }
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
optional<FileSystem::OpenFile> FileSystem::openRegular(const string& path)
// Open a regular file
{
    auto fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (isMissing(errno))
            return nullopt;
        throw runtime_error("Open error! " + path + ": " + string(strerror(errno)));
    }
    struct stat st;
    if (::fstat(fd, &st) < 0) {
        auto error = errno;
        ::close(fd);
        throw runtime_error("Stat error! " + path + ": " + string(strerror(error)));
    }
    if (!S_ISREG(st.st_mode)) {
        ::close(fd);
        return nullopt;
    }
    return OpenFile{.fd = fd, .size = static_cast<uint64_t>(st.st_size)};
}
//---------------------------------------------------------------------------
optional<string> FileSystem::readFile(const string& path)
// Read a small file
{
    auto file = openRegular(path);
    if (!file)
        return nullopt;
    string result(file->size, '\0');
    uint64_t position = 0;
    while (position < result.size()) {
        auto res = ::pread(file->fd, result.data() + position, result.size() - position, static_cast<off_t>(position));
        if (res < 0 && errno == EINTR)
            continue;
        if (res <= 0) {
            auto error = res < 0 ? string(strerror(errno)) : string("unexpected end of file");
            ::close(file->fd);
            throw runtime_error("Read error! " + path + ": " + error);
        }
        position += static_cast<uint64_t>(res);
    }
    ::close(file->fd);
    return result;
}
//---------------------------------------------------------------------------
void FileSystem::writeAtomically(const string& path, string_view data)
// Write through a temporary file
{
    static atomic<uint64_t> counter{0};
    filesystem::create_directories(filesystem::path(path).parent_path());

    auto temporary = path + ".tmp." + to_string(::getpid()) + "." + to_string(counter++);
    auto fd = ::open(temporary.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0)
        throw runtime_error("Open error! " + temporary + ": " + string(strerror(errno)));

    auto fail = [&](const char* what) {
        auto error = string(strerror(errno));
        ::close(fd);
        ::unlink(temporary.c_str());
        throw runtime_error(string(what) + " " + path + ": " + error);
    };

    while (!data.empty()) {
        auto res = ::write(fd, data.data(), data.size());
        if (res < 0) {
            if (errno == EINTR)
                continue;
            fail("Write error!");
        }
        data.remove_prefix(static_cast<size_t>(res));
    }
    if (::fsync(fd) < 0)
        fail("Sync error!");
    ::close(fd);
    if (::rename(temporary.c_str(), path.c_str()) < 0) {
        auto error = string(strerror(errno));
        ::unlink(temporary.c_str());
        throw runtime_error("Rename error! " + path + ": " + error);
    }
}
//---------------------------------------------------------------------------
bool FileSystem::unlinkFile(const string& path)
// Unlink a file
{
    if (::unlink(path.c_str()) == 0)
        return true;
    if (isMissing(errno))
        return false;
    throw runtime_error("Unlink error! " + path + ": " + string(strerror(errno)));
}
//---------------------------------------------------------------------------
bool FileSystem::exists(const string& path)
// Does a file exist
{
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}
//---------------------------------------------------------------------------
} // namespace repoblob::storage
