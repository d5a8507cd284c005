// Copyright 2025 KVCache.AI
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "transport_response_handler.h"

#include <glog/logging.h>

#include <chrono>
#include <vector>

namespace shufflenet {

namespace {
int64_t nowNs() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}
}  // namespace

ErrorCode TransportResponseHandler::addFetchRequest(
    const StreamChunkSlice &slice,
    std::shared_ptr<ChunkReceivedCallback> callback) {
    CHECK(callback) << "fetch of " << slice.toString() << " without callback";
    int64_t now = nowNs();
    {
        MutexLocker lock(&mutex_);
        auto [it, inserted] = pending_.try_emplace(
            FetchKey{slice.stream_id, slice.chunk_index},
            PendingFetch{std::move(callback), now});
        if (!inserted) {
            return ErrorCode::DUPLICATE_REQUEST;
        }
    }
    time_of_last_request_ns_.store(now, std::memory_order_relaxed);
    return ErrorCode::OK;
}

std::shared_ptr<ChunkReceivedCallback>
TransportResponseHandler::removeFetchRequest(StreamId stream_id,
                                             int32_t chunk_index) {
    MutexLocker lock(&mutex_);
    auto it = pending_.find(FetchKey{stream_id, chunk_index});
    if (it == pending_.end()) {
        return nullptr;
    }
    auto callback = std::move(it->second.callback);
    pending_.erase(it);
    return callback;
}

void TransportResponseHandler::handle(ChunkFetchSuccess &&success) {
    const auto &slice = success.slice;
    auto callback = removeFetchRequest(slice.stream_id, slice.chunk_index);
    if (!callback) {
        LOG(WARNING) << "Ignoring response for " << slice.toString()
                     << " since it is not outstanding";
        success.body.release();
        return;
    }
    callback->onSuccess(slice.chunk_index, success.body);
    success.body.release();
}

void TransportResponseHandler::handle(const ChunkFetchFailure &failure) {
    const auto &slice = failure.slice;
    auto callback = removeFetchRequest(slice.stream_id, slice.chunk_index);
    if (!callback) {
        LOG(WARNING) << "Ignoring failure response for " << slice.toString()
                     << " since it is not outstanding: "
                     << failure.error_string;
        return;
    }
    callback->onFailure(slice.chunk_index, ErrorCode::CHUNK_FETCH_FAILED,
                        failure.error_string);
}

void TransportResponseHandler::failOutstandingRequests(
    ErrorCode code, const std::string &message) {
    std::vector<std::pair<FetchKey, PendingFetch>> failed;
    {
        MutexLocker lock(&mutex_);
        failed.reserve(pending_.size());
        for (auto &entry : pending_) {
            failed.emplace_back(entry.first, std::move(entry.second));
        }
        pending_.clear();
    }
    if (!failed.empty()) {
        LOG(ERROR) << "Failing " << failed.size()
                   << " outstanding fetches: " << message;
    }
    for (auto &[key, fetch] : failed) {
        fetch.callback->onFailure(key.second, code, message);
    }
}

size_t TransportResponseHandler::numOutstandingRequests() const {
    MutexLocker lock(&mutex_);
    return pending_.size();
}

}  // namespace shufflenet
