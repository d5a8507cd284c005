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

#pragma once

#include <cstdint>
#include <limits>
#include <ostream>
#include <string>

#include <ylt/util/tl/expected.hpp>

namespace shufflenet {

// Constants
static constexpr int32_t kUnboundedLength =
    std::numeric_limits<int32_t>::max();
static constexpr size_t kDefaultSendChunkSize = 65536;  // 64KB
static constexpr size_t kDefaultMaxFrameSize = 64ULL * 1024 * 1024;  // 64MB
static constexpr int kDefaultConnectTimeoutMs = 10000;
static constexpr int kDefaultListenBacklog = 128;
constexpr const char* DEFAULT_MODULE_NAME = "shuffle";
constexpr const char* DEFAULT_BIND_HOST = "0.0.0.0";

using StreamId = int64_t;

/**
 * @brief Error codes for various operations in the system
 */
enum class ErrorCode : int32_t {
    OK = 0,               ///< Operation successful.
    INTERNAL_ERROR = -1,  ///< Internal error occurred.

    // Parameter errors (Range: -600 to -699)
    INVALID_PARAMS = -600,  ///< Invalid parameters.

    // Chunk resolution errors (Range: -100 to -199)
    STREAM_NOT_FOUND = -100,       ///< Stream id was never registered.
    INVALID_CHUNK_INDEX = -101,    ///< Chunk index outside the stream.
    STREAM_ALREADY_EXISTS = -102,  ///< Stream id already registered.
    HANDLER_NOT_REGISTERED = -103, ///< Server handler refuses requests.

    // FILE errors (Range: -1100 to -1199)
    FILE_NOT_FOUND = -1100,       ///< File not found.
    FILE_OPEN_FAIL = -1101,       ///< Error opening file.
    FILE_READ_FAIL = -1102,       ///< Error reading file.
    FILE_INVALID_BUFFER = -1104,  ///< File buffer is wrong.
    FILE_INVALID_HANDLE = -1106,  ///< Invalid file handle.
    FILE_SEGMENT_OUT_OF_RANGE =
        -1107,  ///< Segment extends past the end of the file.

    // Protocol errors (Range: -1500 to -1599)
    MALFORMED_FRAME = -1500,       ///< Truncated or inconsistent frame.
    FRAME_TOO_LARGE = -1501,       ///< Frame exceeds the configured limit.
    UNKNOWN_MESSAGE_TYPE = -1502,  ///< Unknown message type byte.
    PAYLOAD_TOO_LARGE = -1503,     ///< Payload does not fit in a frame.

    // Connection and fetch errors (Range: -1600 to -1699)
    CONNECTION_FAILED = -1600,   ///< Connection could not be established
                                 ///< or broke with an I/O error.
    CONNECTION_CLOSED = -1601,   ///< Connection was closed.
    CHUNK_FETCH_FAILED = -1602,  ///< Server answered with a failure frame.
    DUPLICATE_REQUEST = -1603,   ///< Same chunk already in flight.
    SERVER_START_FAIL = -1604,   ///< Server could not bind or listen.
};

int32_t toInt(ErrorCode errorCode) noexcept;
ErrorCode fromInt(int32_t errorCode) noexcept;

const std::string& toString(ErrorCode errorCode) noexcept;

inline std::ostream& operator<<(std::ostream& os,
                                const ErrorCode& errorCode) noexcept {
    return os << toString(errorCode);
}

}  // namespace shufflenet
