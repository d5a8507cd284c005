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

#include "protocol.h"

#include <endian.h>
#include <glog/logging.h>

#include <cstring>
#include <limits>
#include <sstream>

namespace shufflenet {

namespace {

class ByteWriter {
   public:
    explicit ByteWriter(size_t reserve) { out_.reserve(reserve); }

    void putU8(uint8_t v) { out_.push_back(static_cast<char>(v)); }

    void putU32(uint32_t v) {
        v = htole32(v);
        out_.append(reinterpret_cast<const char *>(&v), sizeof(v));
    }

    void putI32(int32_t v) { putU32(static_cast<uint32_t>(v)); }

    void putI64(int64_t v) {
        uint64_t u = htole64(static_cast<uint64_t>(v));
        out_.append(reinterpret_cast<const char *>(&u), sizeof(u));
    }

    void putBytes(std::string_view bytes) { out_.append(bytes); }

    void putSlice(const StreamChunkSlice &slice) {
        putI64(slice.stream_id);
        putI32(slice.chunk_index);
        putI32(slice.offset);
        putI32(slice.len);
    }

    std::string take() { return std::move(out_); }

   private:
    std::string out_;
};

class ByteReader {
   public:
    explicit ByteReader(std::string_view data) : data_(data) {}

    bool getU8(uint8_t &v) {
        if (remaining() < 1) return false;
        v = static_cast<uint8_t>(data_[pos_++]);
        return true;
    }

    bool getU32(uint32_t &v) {
        if (remaining() < sizeof(v)) return false;
        std::memcpy(&v, data_.data() + pos_, sizeof(v));
        v = le32toh(v);
        pos_ += sizeof(v);
        return true;
    }

    bool getI32(int32_t &v) {
        uint32_t u;
        if (!getU32(u)) return false;
        v = static_cast<int32_t>(u);
        return true;
    }

    bool getI64(int64_t &v) {
        uint64_t u;
        if (remaining() < sizeof(u)) return false;
        std::memcpy(&u, data_.data() + pos_, sizeof(u));
        v = static_cast<int64_t>(le64toh(u));
        pos_ += sizeof(u);
        return true;
    }

    bool getSlice(StreamChunkSlice &slice) {
        return getI64(slice.stream_id) && getI32(slice.chunk_index) &&
               getI32(slice.offset) && getI32(slice.len);
    }

    size_t position() const { return pos_; }
    size_t remaining() const { return data_.size() - pos_; }

   private:
    std::string_view data_;
    size_t pos_ = 0;
};

void putHeader(ByteWriter &writer, MessageType type, size_t body_length) {
    writer.putU32(static_cast<uint32_t>(body_length));
    writer.putU8(static_cast<uint8_t>(type));
}

bool isKnownType(uint8_t type) {
    return type <= static_cast<uint8_t>(MessageType::kChunkFetchFailure);
}

}  // namespace

const char *messageTypeName(MessageType type) {
    switch (type) {
        case MessageType::kChunkFetchRequest:
            return "ChunkFetchRequest";
        case MessageType::kChunkFetchSuccess:
            return "ChunkFetchSuccess";
        case MessageType::kChunkFetchFailure:
            return "ChunkFetchFailure";
    }
    return "Unknown";
}

std::string StreamChunkSlice::toString() const {
    std::ostringstream oss;
    oss << "StreamChunkSlice{streamId=" << stream_id
        << ", chunkIndex=" << chunk_index << ", offset=" << offset
        << ", len=" << len << "}";
    return oss.str();
}

std::string encodeFrame(const ChunkFetchRequest &request) {
    ByteWriter writer(kFrameHeaderLength + StreamChunkSlice::kEncodedLength);
    putHeader(writer, MessageType::kChunkFetchRequest,
              StreamChunkSlice::kEncodedLength);
    writer.putSlice(request.slice);
    return writer.take();
}

std::string encodeFrame(const ChunkFetchFailure &failure) {
    size_t body_length = StreamChunkSlice::kEncodedLength + sizeof(int32_t) +
                         failure.error_string.size();
    ByteWriter writer(kFrameHeaderLength + body_length);
    putHeader(writer, MessageType::kChunkFetchFailure, body_length);
    writer.putSlice(failure.slice);
    writer.putI32(static_cast<int32_t>(failure.error_string.size()));
    writer.putBytes(failure.error_string);
    return writer.take();
}

tl::expected<std::string, ErrorCode> encodeSuccessHeader(
    const StreamChunkSlice &slice, size_t payload_size) {
    if (payload_size >
        static_cast<size_t>(std::numeric_limits<int32_t>::max()) -
            kSuccessFixedLength) {
        LOG(ERROR) << "Payload of " << payload_size << " bytes for "
                   << slice.toString() << " does not fit in a frame";
        return tl::make_unexpected(ErrorCode::PAYLOAD_TOO_LARGE);
    }
    ByteWriter writer(kFrameHeaderLength + kSuccessFixedLength);
    putHeader(writer, MessageType::kChunkFetchSuccess,
              kSuccessFixedLength + payload_size);
    writer.putSlice(slice);
    writer.putI32(static_cast<int32_t>(payload_size));
    return writer.take();
}

tl::expected<std::string, ErrorCode> encodeFrame(
    const ChunkFetchSuccess &success) {
    auto header = encodeSuccessHeader(success.slice, success.body.size());
    if (!header) {
        return header;
    }
    auto payload = success.body.asBytes();
    if (!payload) {
        return tl::make_unexpected(payload.error());
    }
    std::string frame = std::move(*header);
    frame.append(**payload);
    return frame;
}

tl::expected<FrameHeader, ErrorCode> decodeFrameHeader(std::string_view data,
                                                       size_t max_frame_size) {
    ByteReader reader(data);
    uint32_t body_length;
    uint8_t type;
    if (!reader.getU32(body_length) || !reader.getU8(type)) {
        return tl::make_unexpected(ErrorCode::MALFORMED_FRAME);
    }
    if (!isKnownType(type)) {
        LOG(ERROR) << "Unknown message type " << static_cast<int>(type);
        return tl::make_unexpected(ErrorCode::UNKNOWN_MESSAGE_TYPE);
    }
    if (body_length > max_frame_size) {
        LOG(ERROR) << "Frame body of " << body_length
                   << " bytes exceeds limit of " << max_frame_size;
        return tl::make_unexpected(ErrorCode::FRAME_TOO_LARGE);
    }
    return FrameHeader{static_cast<MessageType>(type), body_length};
}

tl::expected<Message, ErrorCode> decodeFrameBody(const FrameHeader &header,
                                                 std::string body) {
    if (body.size() != header.body_length) {
        return tl::make_unexpected(ErrorCode::MALFORMED_FRAME);
    }

    ByteReader reader(body);
    StreamChunkSlice slice;
    if (!reader.getSlice(slice)) {
        return tl::make_unexpected(ErrorCode::MALFORMED_FRAME);
    }

    switch (header.type) {
        case MessageType::kChunkFetchRequest: {
            if (reader.remaining() != 0) {
                return tl::make_unexpected(ErrorCode::MALFORMED_FRAME);
            }
            return ChunkFetchRequest{slice};
        }
        case MessageType::kChunkFetchSuccess: {
            int32_t payload_length;
            if (!reader.getI32(payload_length) || payload_length < 0 ||
                static_cast<size_t>(payload_length) != reader.remaining()) {
                return tl::make_unexpected(ErrorCode::MALFORMED_FRAME);
            }
            // Reuse the body's storage for the payload.
            body.erase(0, reader.position());
            return ChunkFetchSuccess{slice,
                                     ManagedBuffer::fromBytes(std::move(body))};
        }
        case MessageType::kChunkFetchFailure: {
            int32_t message_length;
            if (!reader.getI32(message_length) || message_length < 0 ||
                static_cast<size_t>(message_length) != reader.remaining()) {
                return tl::make_unexpected(ErrorCode::MALFORMED_FRAME);
            }
            return ChunkFetchFailure{slice, body.substr(reader.position())};
        }
    }
    return tl::make_unexpected(ErrorCode::UNKNOWN_MESSAGE_TYPE);
}

}  // namespace shufflenet
