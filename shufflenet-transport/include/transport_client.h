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

#ifndef TRANSPORT_CLIENT_H_
#define TRANSPORT_CLIENT_H_

#include <array>
#include <atomic>
#include <boost/asio.hpp>
#include <deque>
#include <memory>
#include <optional>
#include <string>

#include "protocol.h"
#include "transport_conf.h"
#include "transport_response_handler.h"

namespace shufflenet {

// Narrows a fetch to [offset, offset + length) of the chunk.
struct ChunkRange {
    int32_t offset = 0;
    int32_t length = kUnboundedLength;
};

/**
 * TransportClient is one connection to a chunk server. Fetches may be issued
 * concurrently from any thread; responses are read and delivered on the
 * connection's strand, one at a time.
 */
class TransportClient : public std::enable_shared_from_this<TransportClient> {
   public:
    TransportClient(boost::asio::io_context &io_context,
                    boost::asio::ip::tcp::socket socket,
                    const TransportConf &conf);

    ~TransportClient();

    TransportClient(const TransportClient &) = delete;
    TransportClient &operator=(const TransportClient &) = delete;

    // Starts reading responses. Called once by the factory.
    void start();

    /**
     * @brief Requests one chunk without blocking
     * @note callback receives exactly one onSuccess or onFailure. A fetch of
     * a chunk that is already in flight on this client, or a fetch on a
     * closed client, fails right away on the calling thread.
     */
    void fetchChunk(StreamId stream_id, int32_t chunk_index,
                    std::optional<ChunkRange> range,
                    std::shared_ptr<ChunkReceivedCallback> callback);

    // Closes the connection; every outstanding fetch fails with
    // CONNECTION_CLOSED.
    void close();

    bool isActive() const { return !closed_.load(std::memory_order_acquire); }

    const std::string &remoteAddress() const { return remote_address_; }

    size_t numOutstandingRequests() const {
        return handler_.numOutstandingRequests();
    }

    int64_t timeOfLastRequest() const { return handler_.timeOfLastRequest(); }

   private:
    void sendRequest(const StreamChunkSlice &slice, std::string frame);
    void writeNext();
    void readHeader();
    void readBody();
    void doClose(ErrorCode code, const std::string &reason);

    boost::asio::ip::tcp::socket socket_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    const size_t max_frame_size_;
    std::string remote_address_;
    TransportResponseHandler handler_;

    std::array<char, kFrameHeaderLength> header_buf_;
    FrameHeader header_;
    std::string body_;

    // Touched only on strand_.
    std::deque<std::string> outbound_;
    bool writing_ = false;
    std::atomic<bool> closed_{false};
};

}  // namespace shufflenet

#endif  // TRANSPORT_CLIENT_H_
