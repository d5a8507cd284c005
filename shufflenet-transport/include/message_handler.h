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

#ifndef MESSAGE_HANDLER_H_
#define MESSAGE_HANDLER_H_

#include <atomic>
#include <memory>
#include <string>

#include "chunk_stream_manager.h"
#include "managed_buffer.h"
#include "protocol.h"
#include "types.h"

namespace shufflenet {

/**
 * @brief The sending side of one accepted connection, as seen by a handler
 *
 * Both send calls may be made from any thread and never block. Each call
 * queues exactly one response frame.
 */
class TransportChannel {
   public:
    virtual ~TransportChannel() = default;

    /**
     * @brief Queues a success frame carrying buffer
     * @note Takes over one reference of buffer. It is released once the last
     * payload byte has been handed to the socket, or when the connection
     * closes first. If the payload cannot be read or does not fit in a frame,
     * a failure frame is written instead.
     */
    virtual void sendChunkSuccess(const StreamChunkSlice &slice,
                                  ManagedBuffer buffer) = 0;

    virtual void sendChunkFailure(const StreamChunkSlice &slice,
                                  const std::string &error_string) = 0;

    virtual std::string remoteAddress() const = 0;

    virtual bool isActive() const = 0;

    virtual void close() = 0;
};

// Server-side handler invoked for every decoded request frame.
class BaseMessageHandler {
   public:
    virtual ~BaseMessageHandler() = default;

    // Must answer the request with exactly one response on channel.
    virtual void receive(const std::shared_ptr<TransportChannel> &channel,
                         const ChunkFetchRequest &request) = 0;

    virtual bool checkRegistered() const { return true; }

    virtual void channelActive(
        const std::shared_ptr<TransportChannel> &channel) {}

    virtual void channelInactive(
        const std::shared_ptr<TransportChannel> &channel) {}
};

/**
 * @brief Serves chunk fetches out of a ChunkStreamManager
 *
 * Requests that arrive while the handler is not registered (see
 * setRegistered) are answered with a failure frame.
 */
class ChunkFetchRequestHandler : public BaseMessageHandler {
   public:
    explicit ChunkFetchRequestHandler(
        std::shared_ptr<ChunkStreamManager> manager, bool registered = true);

    void receive(const std::shared_ptr<TransportChannel> &channel,
                 const ChunkFetchRequest &request) override;

    bool checkRegistered() const override {
        return registered_.load(std::memory_order_acquire);
    }

    void setRegistered(bool registered) {
        registered_.store(registered, std::memory_order_release);
    }

    void channelActive(
        const std::shared_ptr<TransportChannel> &channel) override;

    void channelInactive(
        const std::shared_ptr<TransportChannel> &channel) override;

    size_t numActiveChannels() const {
        return active_channels_.load(std::memory_order_relaxed);
    }

    const std::shared_ptr<ChunkStreamManager> &manager() const {
        return manager_;
    }

   private:
    std::shared_ptr<ChunkStreamManager> manager_;
    std::atomic<bool> registered_;
    std::atomic<size_t> active_channels_{0};
};

}  // namespace shufflenet

#endif  // MESSAGE_HANDLER_H_
