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

#ifndef TRANSPORT_SERVER_H_
#define TRANSPORT_SERVER_H_

#include <array>
#include <atomic>
#include <boost/asio.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "message_handler.h"
#include "mutex.h"
#include "protocol.h"
#include "transport_conf.h"

namespace shufflenet {

using tcpsocket = boost::asio::ip::tcp::socket;

/**
 * One accepted connection. Reads request frames and writes response frames
 * on a single strand, so frames of one connection are processed one at a
 * time while other connections run in parallel.
 */
class TcpTransportChannel
    : public TransportChannel,
      public std::enable_shared_from_this<TcpTransportChannel> {
   public:
    using OnClose = std::function<void(TcpTransportChannel *)>;

    TcpTransportChannel(boost::asio::io_context &io_context,
                        tcpsocket socket, const TransportConf &conf,
                        std::shared_ptr<BaseMessageHandler> handler,
                        OnClose on_close);

    ~TcpTransportChannel() override;

    void start();

    void sendChunkSuccess(const StreamChunkSlice &slice,
                          ManagedBuffer buffer) override;

    void sendChunkFailure(const StreamChunkSlice &slice,
                          const std::string &error_string) override;

    std::string remoteAddress() const override { return remote_address_; }

    bool isActive() const override {
        return !closed_.load(std::memory_order_acquire);
    }

    void close() override;

   private:
    struct OutboundFrame {
        StreamChunkSlice slice;
        std::string head;
        ManagedBuffer body;
        std::optional<BufferStream> stream;
    };

    void readHeader();
    void readBody();
    void enqueue(OutboundFrame frame);
    void writeHead();
    void writePayload();
    void finishFrame();
    void doClose(const std::string &reason);

    tcpsocket socket_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    const size_t max_frame_size_;
    const size_t send_chunk_size_;
    std::shared_ptr<BaseMessageHandler> handler_;
    OnClose on_close_;
    std::string remote_address_;

    std::array<char, kFrameHeaderLength> header_buf_;
    FrameHeader header_;
    std::string body_;

    // Touched only on strand_.
    std::deque<OutboundFrame> outbound_;
    bool writing_ = false;
    std::atomic<bool> closed_{false};
};

/**
 * TransportServer accepts connections on bind_host:server_port and runs
 * server_threads threads over one io_context. Requests are handed to the
 * message handler on the connection's strand.
 */
class TransportServer {
   public:
    TransportServer(const TransportConf &conf,
                    std::shared_ptr<BaseMessageHandler> handler);

    ~TransportServer();

    TransportServer(const TransportServer &) = delete;
    TransportServer &operator=(const TransportServer &) = delete;

    // Binds, listens and starts the worker threads.
    ErrorCode start();

    // Port the acceptor is bound to, resolved when server_port is 0.
    uint16_t getPort() const { return port_; }

    size_t numConnections() const;

    // Stops accepting, closes every connection and joins the threads.
    void close();

   private:
    void doAccept();
    void worker();
    void removeChannel(TcpTransportChannel *channel);

    TransportConf conf_;
    std::shared_ptr<BaseMessageHandler> handler_;
    boost::asio::io_context io_context_;
    boost::asio::strand<boost::asio::io_context::executor_type>
        accept_strand_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::optional<boost::asio::executor_work_guard<
        boost::asio::io_context::executor_type>>
        work_guard_;
    std::vector<std::thread> threads_;
    uint16_t port_ = 0;
    bool running_ = false;

    mutable Mutex channels_mutex_;
    bool stopping_ GUARDED_BY(channels_mutex_) = false;
    std::unordered_map<TcpTransportChannel *,
                       std::shared_ptr<TcpTransportChannel>>
        channels_ GUARDED_BY(channels_mutex_);
};

}  // namespace shufflenet

#endif  // TRANSPORT_SERVER_H_
