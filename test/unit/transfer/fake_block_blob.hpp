#pragma once
#include "cloud/block_blob.hpp"
#include "network/body_source.hpp"
#include "utils/cancellation.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
//---------------------------------------------------------------------------
// BlobCopy - Chunked Cloud Blob Transfer Engine
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobcopy::transfer::test {
//---------------------------------------------------------------------------
/// The remote state shared by all fake blobs
struct FakeStore {
    /// The committed objects by destination
    std::map<std::string, std::string> committed;
    /// The headers of the committed objects
    std::map<std::string, cloud::BlobHeaders> headers;
    /// The metadata of the committed objects
    std::map<std::string, cloud::Metadata> metadata;
    /// The staged blocks by block id
    std::map<std::string, std::string> staged;
    /// Guards the maps
    std::mutex mutex;

    /// Open calls
    std::atomic<unsigned> openCalls{0};
    /// Stage calls
    std::atomic<unsigned> stageCalls{0};
    /// Commit calls
    std::atomic<unsigned> commitCalls{0};
    /// Upload calls
    std::atomic<unsigned> uploadCalls{0};

    /// The 1-based stage call that fails, 0 never fails
    std::atomic<unsigned> failStageCall{0};
    /// Fail every commit
    std::atomic<bool> failCommit{false};
    /// Commits throw instead of failing
    std::atomic<bool> throwCommit{false};
    /// Uploads throw instead of failing
    std::atomic<bool> throwUpload{false};
    /// Stage calls wait for the cancellation of their transfer
    std::atomic<bool> blockStages{false};
    /// A delay that varies with the stage call
    std::atomic<unsigned> stageJitterMs{0};

    /// The committed content
    std::string object(const std::string& destination) {
        std::lock_guard lock(mutex);
        auto it = committed.find(destination);
        if (it == committed.end())
            throw std::runtime_error("no object " + destination);
        return it->second;
    }
    /// Was an object committed
    bool exists(const std::string& destination) {
        std::lock_guard lock(mutex);
        return committed.count(destination);
    }
};
//---------------------------------------------------------------------------
/// Reads a body completely
inline std::string readBody(network::BodySource& body) {
    std::string result;
    while (true) {
        auto piece = body.next(1ull << 20);
        if (piece.empty())
            return result;
        result.append(reinterpret_cast<const char*>(piece.data()), piece.size());
    }
}
//---------------------------------------------------------------------------
/// A block blob in the fake store
class FakeBlockBlob : public cloud::BlockBlob {
    /// The store
    FakeStore& _store;
    /// The destination
    std::string _destination;

    public:
    /// The constructor
    FakeBlockBlob(FakeStore& store, std::string destination) : _store(store), _destination(std::move(destination)) {}

    /// Stage one block
    cloud::BlobResult stageBlock(const utils::CancellationToken& token, const std::string& blockId, network::BodySource& body) override {
        auto call = ++_store.stageCalls;
        if (_store.blockStages) {
            token.waitFor(std::chrono::seconds(30));
            return {false, 0, "PutBlock cancelled"};
        }
        if (_store.stageJitterMs)
            std::this_thread::sleep_for(std::chrono::milliseconds((call * 7) % (_store.stageJitterMs + 1)));
        if (call == _store.failStageCall)
            return {false, 500, "PutBlock failed: 500 InternalError"};
        auto data = readBody(body);
        std::lock_guard lock(_store.mutex);
        _store.staged[blockId] = std::move(data);
        return {true, 201, ""};
    }
    /// Commit the blocks in order
    cloud::BlobResult commitBlockList(const utils::CancellationToken&, const std::vector<std::string>& blockIds, const cloud::BlobHeaders& headers, const cloud::Metadata& metadata) override {
        ++_store.commitCalls;
        if (_store.throwCommit)
            throw std::runtime_error("PutBlockList request could not be signed");
        if (_store.failCommit)
            return {false, 400, "PutBlockList failed: 400 InvalidBlockList"};
        std::lock_guard lock(_store.mutex);
        std::string object;
        for (auto& id : blockIds) {
            auto it = _store.staged.find(id);
            if (it == _store.staged.end())
                return {false, 400, "PutBlockList failed: unknown block " + id};
            object += it->second;
        }
        _store.committed[_destination] = std::move(object);
        _store.headers[_destination] = headers;
        _store.metadata[_destination] = metadata;
        return {true, 201, ""};
    }
    /// Upload the whole object
    cloud::BlobResult upload(const utils::CancellationToken&, network::BodySource* body, const cloud::BlobHeaders& headers, const cloud::Metadata& metadata) override {
        ++_store.uploadCalls;
        if (_store.throwUpload)
            throw std::runtime_error("PutBlob request could not be signed");
        auto object = body ? readBody(*body) : std::string();
        std::lock_guard lock(_store.mutex);
        _store.committed[_destination] = std::move(object);
        _store.headers[_destination] = headers;
        _store.metadata[_destination] = metadata;
        return {true, 201, ""};
    }
};
//---------------------------------------------------------------------------
/// Opens fake blobs, destinations starting with "invalid" are rejected
class FakeBlockBlobFactory : public cloud::BlockBlobFactory {
    /// The store
    FakeStore& _store;

    public:
    /// The constructor
    explicit FakeBlockBlobFactory(FakeStore& store) : _store(store) {}

    /// Open the destination
    std::unique_ptr<cloud::BlockBlob> open(const std::string& destination, const cloud::PipelineOptions&) override {
        ++_store.openCalls;
        if (destination.starts_with("invalid"))
            throw std::runtime_error("Invalid destination url " + destination);
        return std::make_unique<FakeBlockBlob>(_store, destination);
    }
};
//---------------------------------------------------------------------------
} // namespace blobcopy::transfer::test
