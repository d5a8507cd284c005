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

#ifndef TRANSPORT_RESPONSE_HANDLER_H_
#define TRANSPORT_RESPONSE_HANDLER_H_

#include <atomic>
#include <boost/functional/hash.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>

#include "managed_buffer.h"
#include "mutex.h"
#include "protocol.h"
#include "types.h"

namespace shufflenet {

/**
 * @brief Completion of one chunk fetch
 *
 * Exactly one of the two methods is called per fetch, on the connection's
 * delivery thread (or inline on the caller's thread when the fetch is
 * rejected up front). Implementations should hand off quickly.
 *
 * The buffer passed to onSuccess is lent, not transferred: the dispatcher
 * holds the one reference it received from the wire and releases it as soon
 * as onSuccess returns. A callback must not release that reference itself.
 * To use the buffer after returning it calls retain() and later balances
 * that with its own release().
 */
class ChunkReceivedCallback {
   public:
    virtual ~ChunkReceivedCallback() = default;

    // buffer is valid only until this returns unless retained.
    virtual void onSuccess(int32_t chunk_index, ManagedBuffer buffer) = 0;

    virtual void onFailure(int32_t chunk_index, ErrorCode code,
                           const std::string &message) = 0;
};

/**
 * @brief Client-side table of outstanding fetches of one connection
 *
 * Entries are keyed by (stream id, chunk index). Callbacks are always
 * invoked after the entry has been removed and outside the table lock.
 */
class TransportResponseHandler {
   public:
    TransportResponseHandler() = default;

    /**
     * @brief Registers a fetch about to be sent
     * @return OK, or DUPLICATE_REQUEST if the same chunk is already pending
     */
    ErrorCode addFetchRequest(const StreamChunkSlice &slice,
                              std::shared_ptr<ChunkReceivedCallback> callback);

    // Returns the removed callback, or nullptr if nothing was pending.
    std::shared_ptr<ChunkReceivedCallback> removeFetchRequest(
        StreamId stream_id, int32_t chunk_index);

    // Delivers the body to the matching callback and drops the delivery
    // reference afterwards. Unmatched bodies are released and logged.
    void handle(ChunkFetchSuccess &&success);

    void handle(const ChunkFetchFailure &failure);

    // Fails and removes every pending fetch.
    void failOutstandingRequests(ErrorCode code, const std::string &message);

    size_t numOutstandingRequests() const;

    // Steady-clock time in nanoseconds of the last added fetch, 0 if none.
    int64_t timeOfLastRequest() const {
        return time_of_last_request_ns_.load(std::memory_order_relaxed);
    }

   private:
    using FetchKey = std::pair<StreamId, int32_t>;

    struct PendingFetch {
        std::shared_ptr<ChunkReceivedCallback> callback;
        int64_t start_ns;
    };

    mutable Mutex mutex_;
    std::unordered_map<FetchKey, PendingFetch, boost::hash<FetchKey>>
        pending_ GUARDED_BY(mutex_);
    std::atomic<int64_t> time_of_last_request_ns_{0};
};

}  // namespace shufflenet

#endif  // TRANSPORT_RESPONSE_HANDLER_H_
