#include "types.h"

#include <unordered_map>

namespace shufflenet {

const std::string& toString(ErrorCode errorCode) noexcept {
    static const std::unordered_map<ErrorCode, std::string> errorCodeMap = {
        {ErrorCode::OK, "OK"},
        {ErrorCode::INTERNAL_ERROR, "INTERNAL_ERROR"},
        {ErrorCode::INVALID_PARAMS, "INVALID_PARAMS"},
        {ErrorCode::STREAM_NOT_FOUND, "STREAM_NOT_FOUND"},
        {ErrorCode::INVALID_CHUNK_INDEX, "INVALID_CHUNK_INDEX"},
        {ErrorCode::STREAM_ALREADY_EXISTS, "STREAM_ALREADY_EXISTS"},
        {ErrorCode::HANDLER_NOT_REGISTERED, "HANDLER_NOT_REGISTERED"},
        {ErrorCode::FILE_NOT_FOUND, "FILE_NOT_FOUND"},
        {ErrorCode::FILE_OPEN_FAIL, "FILE_OPEN_FAIL"},
        {ErrorCode::FILE_READ_FAIL, "FILE_READ_FAIL"},
        {ErrorCode::FILE_INVALID_BUFFER, "FILE_INVALID_BUFFER"},
        {ErrorCode::FILE_INVALID_HANDLE, "FILE_INVALID_HANDLE"},
        {ErrorCode::FILE_SEGMENT_OUT_OF_RANGE, "FILE_SEGMENT_OUT_OF_RANGE"},
        {ErrorCode::MALFORMED_FRAME, "MALFORMED_FRAME"},
        {ErrorCode::FRAME_TOO_LARGE, "FRAME_TOO_LARGE"},
        {ErrorCode::UNKNOWN_MESSAGE_TYPE, "UNKNOWN_MESSAGE_TYPE"},
        {ErrorCode::PAYLOAD_TOO_LARGE, "PAYLOAD_TOO_LARGE"},
        {ErrorCode::CONNECTION_FAILED, "CONNECTION_FAILED"},
        {ErrorCode::CONNECTION_CLOSED, "CONNECTION_CLOSED"},
        {ErrorCode::CHUNK_FETCH_FAILED, "CHUNK_FETCH_FAILED"},
        {ErrorCode::DUPLICATE_REQUEST, "DUPLICATE_REQUEST"},
        {ErrorCode::SERVER_START_FAIL, "SERVER_START_FAIL"}};

    auto it = errorCodeMap.find(errorCode);
    static const std::string unknownError = "UNKNOWN_ERROR";
    return (it != errorCodeMap.end()) ? it->second : unknownError;
}

int32_t toInt(ErrorCode errorCode) noexcept {
    return static_cast<int32_t>(errorCode);
}

ErrorCode fromInt(int32_t errorCode) noexcept {
    return static_cast<ErrorCode>(errorCode);
}

}  // namespace shufflenet
