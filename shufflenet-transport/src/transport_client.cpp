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

#include "transport_client.h"

#include <glog/logging.h>

#include <sstream>

namespace shufflenet {

TransportClient::TransportClient(boost::asio::io_context &io_context,
                                 boost::asio::ip::tcp::socket socket,
                                 const TransportConf &conf)
    : socket_(std::move(socket)),
      strand_(boost::asio::make_strand(io_context)),
      max_frame_size_(conf.max_frame_size) {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (!ec) {
        std::ostringstream oss;
        oss << endpoint;
        remote_address_ = oss.str();
    }
}

TransportClient::~TransportClient() {
    handler_.failOutstandingRequests(
        ErrorCode::CONNECTION_CLOSED,
        "Client to " + remote_address_ + " was destroyed");
}

void TransportClient::start() {
    auto self(shared_from_this());
    boost::asio::dispatch(strand_, [this, self]() { readHeader(); });
}

void TransportClient::fetchChunk(
    StreamId stream_id, int32_t chunk_index, std::optional<ChunkRange> range,
    std::shared_ptr<ChunkReceivedCallback> callback) {
    CHECK(callback) << "fetchChunk without callback";
    StreamChunkSlice slice{stream_id, chunk_index, 0, kUnboundedLength};
    if (range) {
        slice.offset = range->offset;
        slice.len = range->length;
    }

    if (!isActive()) {
        callback->onFailure(chunk_index, ErrorCode::CONNECTION_CLOSED,
                            "Connection to " + remote_address_ +
                                " is closed");
        return;
    }
    if (handler_.addFetchRequest(slice, callback) != ErrorCode::OK) {
        LOG(WARNING) << "Rejecting duplicate fetch of " << slice.toString()
                     << " to " << remote_address_;
        callback->onFailure(chunk_index, ErrorCode::DUPLICATE_REQUEST,
                            "Chunk " + std::to_string(chunk_index) +
                                " of stream " + std::to_string(stream_id) +
                                " is already being fetched");
        return;
    }
    VLOG(1) << "Sending fetch of " << slice.toString() << " to "
            << remote_address_;
    sendRequest(slice, encodeFrame(ChunkFetchRequest{slice}));
}

void TransportClient::sendRequest(const StreamChunkSlice &slice,
                                  std::string frame) {
    auto self(shared_from_this());
    boost::asio::post(
        strand_, [this, self, slice, frame = std::move(frame)]() mutable {
            if (closed_) {
                // Added after the connection failed its outstanding fetches.
                auto callback =
                    handler_.removeFetchRequest(slice.stream_id,
                                                slice.chunk_index);
                if (callback) {
                    callback->onFailure(slice.chunk_index,
                                        ErrorCode::CONNECTION_CLOSED,
                                        "Connection to " + remote_address_ +
                                            " is closed");
                }
                return;
            }
            outbound_.push_back(std::move(frame));
            if (!writing_) writeNext();
        });
}

void TransportClient::writeNext() {
    if (outbound_.empty()) {
        writing_ = false;
        return;
    }
    writing_ = true;
    auto self(shared_from_this());
    boost::asio::async_write(
        socket_, boost::asio::buffer(outbound_.front()),
        boost::asio::bind_executor(
            strand_,
            [this, self](const boost::system::error_code &ec, std::size_t) {
                if (closed_) return;
                if (ec) {
                    doClose(ErrorCode::CONNECTION_FAILED,
                            "Failed to send request to " + remote_address_ +
                                ": " + ec.message());
                    return;
                }
                outbound_.pop_front();
                writeNext();
            }));
}

void TransportClient::readHeader() {
    auto self(shared_from_this());
    boost::asio::async_read(
        socket_, boost::asio::buffer(header_buf_),
        boost::asio::bind_executor(
            strand_, [this, self](const boost::system::error_code &ec,
                                  std::size_t len) {
                if (closed_) return;
                if (ec) {
                    if (ec == boost::asio::error::eof) {
                        doClose(ErrorCode::CONNECTION_CLOSED,
                                "Connection from " + remote_address_ +
                                    " closed");
                    } else {
                        doClose(ErrorCode::CONNECTION_FAILED,
                                "Failed to read from " + remote_address_ +
                                    ": " + ec.message());
                    }
                    return;
                }
                auto header = decodeFrameHeader(
                    std::string_view(header_buf_.data(), len),
                    max_frame_size_);
                if (!header) {
                    doClose(ErrorCode::CONNECTION_FAILED,
                            "Bad frame header from " + remote_address_ +
                                ": " + toString(header.error()));
                    return;
                }
                if (header->type == MessageType::kChunkFetchRequest) {
                    doClose(ErrorCode::CONNECTION_FAILED,
                            "Unexpected request frame from " +
                                remote_address_);
                    return;
                }
                header_ = *header;
                readBody();
            }));
}

void TransportClient::readBody() {
    auto self(shared_from_this());
    body_.assign(header_.body_length, '\0');
    boost::asio::async_read(
        socket_, boost::asio::buffer(body_),
        boost::asio::bind_executor(
            strand_,
            [this, self](const boost::system::error_code &ec, std::size_t) {
                if (closed_) return;
                if (ec) {
                    doClose(ErrorCode::CONNECTION_FAILED,
                            "Failed to read from " + remote_address_ + ": " +
                                ec.message());
                    return;
                }
                auto message = decodeFrameBody(header_, std::move(body_));
                body_.clear();
                if (!message) {
                    doClose(ErrorCode::CONNECTION_FAILED,
                            "Bad response frame from " + remote_address_ +
                                ": " + toString(message.error()));
                    return;
                }
                if (auto *success =
                        std::get_if<ChunkFetchSuccess>(&*message)) {
                    handler_.handle(std::move(*success));
                } else {
                    handler_.handle(std::get<ChunkFetchFailure>(*message));
                }
                if (!closed_) readHeader();
            }));
}

void TransportClient::close() {
    auto self(shared_from_this());
    boost::asio::post(strand_, [this, self]() {
        doClose(ErrorCode::CONNECTION_CLOSED,
                "Connection to " + remote_address_ + " closed locally");
    });
}

void TransportClient::doClose(ErrorCode code, const std::string &reason) {
    if (closed_.exchange(true, std::memory_order_acq_rel)) return;
    LOG(INFO) << "Closing client: " << reason;
    boost::system::error_code ignored;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
    writing_ = false;
    handler_.failOutstandingRequests(code, reason);
}

}  // namespace shufflenet
