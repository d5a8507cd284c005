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

#include "transport_server.h"

#include <glog/logging.h>

#include <sstream>

namespace shufflenet {

namespace {
std::string endpointString(const tcpsocket &socket) {
    boost::system::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) return "<unknown>";
    std::ostringstream oss;
    oss << endpoint;
    return oss.str();
}
}  // namespace

TcpTransportChannel::TcpTransportChannel(
    boost::asio::io_context &io_context, tcpsocket socket,
    const TransportConf &conf, std::shared_ptr<BaseMessageHandler> handler,
    OnClose on_close)
    : socket_(std::move(socket)),
      strand_(boost::asio::make_strand(io_context)),
      max_frame_size_(conf.max_frame_size),
      send_chunk_size_(conf.send_chunk_size),
      handler_(std::move(handler)),
      on_close_(std::move(on_close)),
      remote_address_(endpointString(socket_)) {}

TcpTransportChannel::~TcpTransportChannel() {
    for (auto &frame : outbound_) {
        frame.stream.reset();
        if (frame.body) frame.body.release();
    }
}

void TcpTransportChannel::start() {
    auto self(shared_from_this());
    boost::asio::dispatch(strand_, [this, self]() {
        handler_->channelActive(self);
        readHeader();
    });
}

void TcpTransportChannel::readHeader() {
    auto self(shared_from_this());
    boost::asio::async_read(
        socket_, boost::asio::buffer(header_buf_),
        boost::asio::bind_executor(
            strand_, [this, self](const boost::system::error_code &ec,
                                  std::size_t len) {
                if (closed_) return;
                if (ec) {
                    doClose(ec == boost::asio::error::eof
                                ? "closed by peer"
                                : "read error: " + ec.message());
                    return;
                }
                auto header = decodeFrameHeader(
                    std::string_view(header_buf_.data(), len),
                    max_frame_size_);
                if (!header) {
                    doClose("bad frame header: " + toString(header.error()));
                    return;
                }
                if (header->type != MessageType::kChunkFetchRequest) {
                    doClose(std::string("unexpected ") +
                            messageTypeName(header->type));
                    return;
                }
                if (header->body_length != StreamChunkSlice::kEncodedLength) {
                    doClose("request body of " +
                            std::to_string(header->body_length) +
                            " bytes, expected " +
                            std::to_string(StreamChunkSlice::kEncodedLength));
                    return;
                }
                header_ = *header;
                readBody();
            }));
}

void TcpTransportChannel::readBody() {
    auto self(shared_from_this());
    body_.assign(header_.body_length, '\0');
    boost::asio::async_read(
        socket_, boost::asio::buffer(body_),
        boost::asio::bind_executor(
            strand_,
            [this, self](const boost::system::error_code &ec, std::size_t) {
                if (closed_) return;
                if (ec) {
                    doClose("read error: " + ec.message());
                    return;
                }
                auto message = decodeFrameBody(header_, std::move(body_));
                body_.clear();
                if (!message) {
                    doClose("bad request frame: " +
                            toString(message.error()));
                    return;
                }
                try {
                    handler_->receive(self,
                                      std::get<ChunkFetchRequest>(*message));
                } catch (const std::exception &e) {
                    // No response was queued for this request.
                    doClose(std::string("handler error: ") + e.what());
                    return;
                }
                if (!closed_) readHeader();
            }));
}

void TcpTransportChannel::sendChunkSuccess(const StreamChunkSlice &slice,
                                           ManagedBuffer buffer) {
    auto self(shared_from_this());
    boost::asio::dispatch(strand_, [this, self, slice, buffer]() mutable {
        if (closed_) {
            buffer.release();
            return;
        }

        auto fail = [&](ErrorCode code) {
            buffer.release();
            ChunkFetchFailure failure{
                slice, "Failed to send chunk " +
                           std::to_string(slice.chunk_index) + " of stream " +
                           std::to_string(slice.stream_id) + ": " +
                           toString(code)};
            enqueue(OutboundFrame{slice, encodeFrame(failure), {}, {}});
        };

        if (kSuccessFixedLength + buffer.size() > max_frame_size_) {
            LOG(ERROR) << "Chunk of " << buffer.size() << " bytes for "
                       << slice.toString() << " exceeds max frame size "
                       << max_frame_size_;
            fail(ErrorCode::FRAME_TOO_LARGE);
            return;
        }
        auto head = encodeSuccessHeader(slice, buffer.size());
        if (!head) {
            fail(head.error());
            return;
        }
        auto stream = buffer.asStream();
        if (!stream) {
            LOG(ERROR) << "Cannot open " << buffer.toString() << " for "
                       << slice.toString() << ": " << stream.error();
            fail(stream.error());
            return;
        }
        enqueue(OutboundFrame{slice, std::move(*head), buffer,
                              std::move(*stream)});
    });
}

void TcpTransportChannel::sendChunkFailure(const StreamChunkSlice &slice,
                                           const std::string &error_string) {
    auto self(shared_from_this());
    std::string frame = encodeFrame(ChunkFetchFailure{slice, error_string});
    boost::asio::dispatch(
        strand_, [this, self, slice, frame = std::move(frame)]() mutable {
            if (closed_) return;
            enqueue(OutboundFrame{slice, std::move(frame), {}, {}});
        });
}

void TcpTransportChannel::enqueue(OutboundFrame frame) {
    outbound_.push_back(std::move(frame));
    if (!writing_) writeHead();
}

void TcpTransportChannel::writeHead() {
    if (outbound_.empty()) {
        writing_ = false;
        return;
    }
    writing_ = true;
    auto self(shared_from_this());
    auto &frame = outbound_.front();
    boost::asio::async_write(
        socket_, boost::asio::buffer(frame.head),
        boost::asio::bind_executor(
            strand_,
            [this, self](const boost::system::error_code &ec, std::size_t) {
                if (closed_) return;
                if (ec) {
                    doClose("write error: " + ec.message());
                    return;
                }
                writePayload();
            }));
}

void TcpTransportChannel::writePayload() {
    auto &frame = outbound_.front();
    if (!frame.stream || frame.stream->done()) {
        finishFrame();
        return;
    }
    auto piece = frame.stream->next(send_chunk_size_);
    if (!piece) {
        // Part of the success frame is already on the wire.
        LOG(ERROR) << "Failed to read payload of " << frame.slice.toString()
                   << " at " << frame.stream->position() << ": "
                   << piece.error();
        doClose("payload read failure");
        return;
    }
    auto self(shared_from_this());
    boost::asio::async_write(
        socket_, boost::asio::buffer(piece->data(), piece->size()),
        boost::asio::bind_executor(
            strand_,
            [this, self](const boost::system::error_code &ec, std::size_t) {
                if (closed_) return;
                if (ec) {
                    doClose("write error: " + ec.message());
                    return;
                }
                writePayload();
            }));
}

void TcpTransportChannel::finishFrame() {
    OutboundFrame frame = std::move(outbound_.front());
    outbound_.pop_front();
    frame.stream.reset();
    if (frame.body) frame.body.release();
    VLOG(1) << "Sent response for " << frame.slice.toString() << " to "
            << remote_address_;
    writeHead();
}

void TcpTransportChannel::close() {
    auto self(shared_from_this());
    boost::asio::post(strand_, [this, self]() { doClose("closed locally"); });
}

void TcpTransportChannel::doClose(const std::string &reason) {
    if (closed_.exchange(true, std::memory_order_acq_rel)) return;
    LOG(INFO) << "Closing channel from " << remote_address_ << ": " << reason;

    boost::system::error_code ignored;
    socket_.shutdown(tcpsocket::shutdown_both, ignored);
    socket_.close(ignored);

    // Frames stay queued until destruction since an aborted write may still
    // refer to them; only the buffer references are dropped here.
    for (auto &frame : outbound_) {
        if (frame.body) {
            frame.body.release();
            frame.body = ManagedBuffer();
        }
    }
    writing_ = false;

    auto self(shared_from_this());
    handler_->channelInactive(self);
    if (on_close_) on_close_(this);
}

TransportServer::TransportServer(const TransportConf &conf,
                                 std::shared_ptr<BaseMessageHandler> handler)
    : conf_(conf),
      handler_(std::move(handler)),
      accept_strand_(boost::asio::make_strand(io_context_)),
      acceptor_(accept_strand_) {
    CHECK(handler_) << "TransportServer requires a message handler";
    CHECK_GT(conf_.server_threads, 0)
        << "TransportServer requires at least one thread";
}

TransportServer::~TransportServer() { close(); }

ErrorCode TransportServer::start() {
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(conf_.bind_host, ec);
    if (ec) {
        LOG(ERROR) << "TransportServer: invalid bind host " << conf_.bind_host
                   << ": " << ec.message();
        return ErrorCode::INVALID_PARAMS;
    }
    boost::asio::ip::tcp::endpoint endpoint(address, conf_.server_port);

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec)
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true),
                             ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(conf_.listen_backlog, ec);
    if (ec) {
        LOG(ERROR) << "TransportServer: cannot listen on " << endpoint << ": "
                   << ec.message();
        acceptor_.close(ec);
        return ErrorCode::SERVER_START_FAIL;
    }
    port_ = acceptor_.local_endpoint(ec).port();

    work_guard_.emplace(io_context_.get_executor());
    boost::asio::dispatch(accept_strand_, [this]() { doAccept(); });
    for (int i = 0; i < conf_.server_threads; ++i) {
        threads_.emplace_back(&TransportServer::worker, this);
    }
    running_ = true;
    LOG(INFO) << "TransportServer [" << conf_.module << "] listening on "
              << conf_.bind_host << ":" << port_ << " with "
              << conf_.server_threads << " threads";
    return ErrorCode::OK;
}

void TransportServer::doAccept() {
    acceptor_.async_accept(
        io_context_,
        boost::asio::bind_executor(
            accept_strand_,
            [this](boost::system::error_code ec, tcpsocket socket) {
                if (ec == boost::asio::error::operation_aborted ||
                    !acceptor_.is_open()) {
                    return;
                }
                if (ec) {
                    LOG(WARNING) << "TransportServer: accept failed: "
                                 << ec.message();
                    doAccept();
                    return;
                }
                socket.set_option(
                    boost::asio::ip::tcp::no_delay(conf_.tcp_no_delay), ec);
                if (ec) {
                    LOG(WARNING) << "TransportServer: cannot set TCP_NODELAY: "
                                 << ec.message();
                }
                auto channel = std::make_shared<TcpTransportChannel>(
                    io_context_, std::move(socket), conf_, handler_,
                    [this](TcpTransportChannel *closed) {
                        removeChannel(closed);
                    });
                {
                    MutexLocker lock(&channels_mutex_);
                    if (stopping_) return;
                    channels_.emplace(channel.get(), channel);
                }
                channel->start();
                doAccept();
            }));
}

void TransportServer::worker() {
    while (true) {
        try {
            io_context_.run();
            return;
        } catch (std::exception &e) {
            LOG(ERROR) << "TransportServer: exception: " << e.what();
        }
    }
}

void TransportServer::removeChannel(TcpTransportChannel *channel) {
    MutexLocker lock(&channels_mutex_);
    channels_.erase(channel);
}

size_t TransportServer::numConnections() const {
    MutexLocker lock(&channels_mutex_);
    return channels_.size();
}

void TransportServer::close() {
    if (!running_) return;
    running_ = false;

    std::vector<std::shared_ptr<TcpTransportChannel>> channels;
    {
        MutexLocker lock(&channels_mutex_);
        stopping_ = true;
        for (auto &entry : channels_) channels.push_back(entry.second);
    }
    boost::asio::post(accept_strand_, [this]() {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
    });
    for (auto &channel : channels) channel->close();
    channels.clear();

    work_guard_.reset();
    for (auto &thread : threads_) thread.join();
    threads_.clear();
    LOG(INFO) << "TransportServer [" << conf_.module << "] on port " << port_
              << " closed";
}

}  // namespace shufflenet
