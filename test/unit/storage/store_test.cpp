#include "storage/content_store.hpp"
#include "storage/delivery_error.hpp"
#include "storage/file_system.hpp"
#include "storage/local_store.hpp"
#include "storage/memory_store.hpp"
#include <catch2/catch.hpp>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <unistd.h>
//---------------------------------------------------------------------------
// RepoBlob - Range-Aware Artifact Delivery
// RepoBlob Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace repoblob::storage::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
/// A scratch directory removed on destruction
class TemporaryDirectory {
    /// The path
    string _path;

    public:
    /// The constructor
    TemporaryDirectory() {
        string pattern = filesystem::temp_directory_path().string() + "/repoblob_storeXXXXXX";
        auto path = mkdtemp(pattern.data());
        if (!path)
            throw runtime_error("Could not create a temporary directory!");
        _path = path;
    }
    /// The destructor
    ~TemporaryDirectory() {
        error_code ec;
        filesystem::remove_all(_path, ec);
    }
    /// Get the path
    const string& getPath() const { return _path; }
};
//---------------------------------------------------------------------------
string readAll(BoundedResource& resource)
// Drain the resource
{
    string result;
    uint8_t buffer[64];
    while (auto count = resource.read(buffer, sizeof(buffer)))
        result.append(reinterpret_cast<const char*>(buffer), count);
    return result;
}
//---------------------------------------------------------------------------
string makeObject()
// A 1000 byte package
{
    string object;
    for (auto i = 0; i < 1000; i++)
        object += static_cast<char>('a' + i % 26);
    return object;
}
//---------------------------------------------------------------------------
void checkContract(ObjectStore& store, const FileDescriptor& descriptor, const string& object)
// The behavior every store shares
{
    auto whole = store.resolve(descriptor);
    REQUIRE(whole->getFileLength() == 1000);
    REQUIRE(whole->contentLength() == 1000);
    REQUIRE(!whole->isPartial());
    REQUIRE(whole->getContentType() == "application/x-rpm");
    REQUIRE(readAll(*whole) == object);

    auto head = store.resolveRange(descriptor, 0, 100);
    REQUIRE(head->getOffset() == 0);
    REQUIRE(head->contentLength() == 100);
    REQUIRE(readAll(*head) == object.substr(0, 100));

    auto tail = store.resolveRange(descriptor, 500, nullopt);
    REQUIRE(tail->contentLength() == 500);
    REQUIRE(readAll(*tail) == object.substr(500));

    // the end is capped to the last byte
    auto capped = store.resolveRange(descriptor, 990, 100);
    REQUIRE(capped->contentLength() == 10);
    REQUIRE(readAll(*capped) == object.substr(990));

    try {
        (void) store.resolveRange(descriptor, 1000, 1);
        FAIL("resolved a range beyond the object");
    } catch (const RangeNotSatisfiable& e) {
        REQUIRE(e.getFileLength() == 1000);
        REQUIRE(e.getPath() == descriptor.getPath());
    }

    FileDescriptor missing(descriptor.getRepo(), descriptor.getArch(), "missing-1.0.rpm");
    REQUIRE_THROWS_AS(store.resolve(missing), ObjectNotFound);
    REQUIRE_THROWS_AS(store.resolveRange(missing, 0, 1), ObjectNotFound);

    REQUIRE(store.remove(descriptor) == ObjectStore::DeleteResult::Deleted);
    REQUIRE(store.remove(descriptor) == ObjectStore::DeleteResult::NotFound);
    REQUIRE_THROWS_AS(store.resolve(descriptor), ObjectNotFound);
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
TEST_CASE("object_store_window") {
    FileDescriptor descriptor("updates", "x86_64", "foo-1.0.rpm");
    auto w = ObjectStore::window(descriptor, 1000, 500, nullopt);
    REQUIRE(w.offset == 500);
    REQUIRE(w.length == 500);
    w = ObjectStore::window(descriptor, 1000, 0, 5000);
    REQUIRE(w.length == 1000);
    REQUIRE_THROWS_AS(ObjectStore::window(descriptor, 1000, 1000, nullopt), RangeNotSatisfiable);
    REQUIRE_THROWS_AS(ObjectStore::window(descriptor, 0, 0, nullopt), RangeNotSatisfiable);
}
//---------------------------------------------------------------------------
TEST_CASE("memory_store") {
    FileDescriptor descriptor("updates", "x86_64", "foo-1.0.rpm");
    auto object = makeObject();
    MemoryStore store;
    store.put(descriptor, object);
    REQUIRE(store.contains(descriptor));
    checkContract(store, descriptor, object);
    REQUIRE(!store.contains(descriptor));

    SECTION("open resources survive a delete") {
        store.put(descriptor, object, "application/octet-stream");
        auto resource = store.resolve(descriptor);
        REQUIRE(resource->getContentType() == "application/octet-stream");
        REQUIRE(store.remove(descriptor) == ObjectStore::DeleteResult::Deleted);
        REQUIRE(readAll(*resource) == object);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("local_store") {
    TemporaryDirectory directory;
    FileDescriptor descriptor("updates", "x86_64", "foo-1.0.rpm");
    auto object = makeObject();
    LocalStore store(directory.getPath() + "/");
    REQUIRE(store.getFilePath(descriptor) == directory.getPath() + "/updates/x86_64/foo-1.0.rpm");
    store.put(descriptor, object);
    REQUIRE(FileSystem::exists(store.getFilePath(descriptor)));
    checkContract(store, descriptor, object);
    REQUIRE(!FileSystem::exists(store.getFilePath(descriptor)));

    SECTION("directories are not objects") {
        FileDescriptor directoryDescriptor("updates", "x86_64", "repodata");
        filesystem::create_directories(store.getFilePath(directoryDescriptor));
        REQUIRE_THROWS_AS(store.resolve(directoryDescriptor), ObjectNotFound);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("content_store") {
    TemporaryDirectory directory;
    FileDescriptor descriptor("updates", "x86_64", "foo-1.0.rpm");
    auto object = makeObject();
    ContentStore store(directory.getPath());

    auto digest = store.put(descriptor, object);
    REQUIRE(digest.size() == 64);
    REQUIRE(FileSystem::exists(store.getBlobPath(digest)));
    REQUIRE(store.getBlobPath(digest) == directory.getPath() + "/objects/" + digest.substr(0, 2) + "/" + digest);

    SECTION("shared blobs") {
        FileDescriptor copy("testing", "x86_64", "foo-1.0.rpm");
        REQUIRE(store.put(copy, object) == digest);
        checkContract(store, descriptor, object);
        // the blob stays for the other reference
        REQUIRE(FileSystem::exists(store.getBlobPath(digest)));
        REQUIRE(readAll(*store.resolve(copy)) == object);
    }
    SECTION("missing blob") {
        filesystem::remove(store.getBlobPath(digest));
        REQUIRE_THROWS_AS(store.resolve(descriptor), runtime_error);
    }
    SECTION("references") {
        auto reference = ContentStore::Reference::parse(digest + " application/x-rpm\n");
        REQUIRE(reference.digest == digest);
        REQUIRE(reference.contentType == "application/x-rpm");
        REQUIRE(reference.serialize() == digest + " application/x-rpm\n");
        REQUIRE(ContentStore::Reference::parse(digest).contentType.empty());
        REQUIRE_THROWS_AS(ContentStore::Reference::parse("not-a-digest"), runtime_error);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("make_store") {
    REQUIRE(dynamic_cast<MemoryStore*>(ObjectStore::makeStore("memory://").get()));
    REQUIRE(dynamic_cast<LocalStore*>(ObjectStore::makeStore("file:///srv/repo").get()));
    REQUIRE(dynamic_cast<ContentStore*>(ObjectStore::makeStore("cas:///srv/cas").get()));
    REQUIRE_THROWS_AS(ObjectStore::makeStore("file://relative"), runtime_error);
    REQUIRE_THROWS_AS(ObjectStore::makeStore("s3://bucket"), runtime_error);
}
//---------------------------------------------------------------------------
} // namespace repoblob::storage::test
