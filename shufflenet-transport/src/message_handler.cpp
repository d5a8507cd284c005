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

#include "message_handler.h"

#include <glog/logging.h>

#include <exception>

namespace shufflenet {

ChunkFetchRequestHandler::ChunkFetchRequestHandler(
    std::shared_ptr<ChunkStreamManager> manager, bool registered)
    : manager_(std::move(manager)), registered_(registered) {
    CHECK(manager_) << "ChunkFetchRequestHandler requires a stream manager";
}

void ChunkFetchRequestHandler::receive(
    const std::shared_ptr<TransportChannel> &channel,
    const ChunkFetchRequest &request) {
    const auto &slice = request.slice;
    VLOG(1) << "Received " << slice.toString() << " from "
            << channel->remoteAddress();

    if (!checkRegistered()) {
        LOG(WARNING) << "Refusing " << slice.toString()
                     << ": handler is not registered yet";
        channel->sendChunkFailure(
            slice, "Failed to fetch chunk " + std::to_string(slice.chunk_index) +
                       " of stream " + std::to_string(slice.stream_id) + ": " +
                       toString(ErrorCode::HANDLER_NOT_REGISTERED));
        return;
    }

    tl::expected<ManagedBuffer, ErrorCode> buffer;
    try {
        buffer = manager_->getChunk(slice.stream_id, slice.chunk_index,
                                    slice.offset, slice.len);
    } catch (const std::exception &e) {
        LOG(ERROR) << "Resolver threw for " << slice.toString() << ": "
                   << e.what();
        channel->sendChunkFailure(
            slice, "Failed to fetch chunk " + std::to_string(slice.chunk_index) +
                       " of stream " + std::to_string(slice.stream_id) + ": " +
                       e.what());
        return;
    }
    if (!buffer) {
        channel->sendChunkFailure(
            slice, "Failed to fetch chunk " + std::to_string(slice.chunk_index) +
                       " of stream " + std::to_string(slice.stream_id) + ": " +
                       toString(buffer.error()));
        return;
    }
    // The channel releases the manager's reference after the write.
    channel->sendChunkSuccess(slice, std::move(*buffer));
}

void ChunkFetchRequestHandler::channelActive(
    const std::shared_ptr<TransportChannel> &channel) {
    active_channels_.fetch_add(1, std::memory_order_relaxed);
    LOG(INFO) << "Channel from " << channel->remoteAddress() << " is active";
}

void ChunkFetchRequestHandler::channelInactive(
    const std::shared_ptr<TransportChannel> &channel) {
    active_channels_.fetch_sub(1, std::memory_order_relaxed);
    LOG(INFO) << "Channel from " << channel->remoteAddress()
              << " is inactive";
}

}  // namespace shufflenet
