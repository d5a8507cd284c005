#include "environ.h"
#include <cctype>
#include <cstring>
#include <algorithm>

namespace shufflenet {

Environ& Environ::Get() {
    static Environ instance;
    return instance;
}

Environ Environ::Capture() { return Environ(); }

int Environ::GetInt(const char* name, int default_value) {
    const char* val = std::getenv(name);
    if (val) {
        return std::atoi(val);
    }
    return default_value;
}

size_t Environ::GetSizeT(const char* name, size_t default_value) {
    const char* val = std::getenv(name);
    if (val) {
        return static_cast<size_t>(std::strtoull(val, nullptr, 10));
    }
    return default_value;
}

bool Environ::GetBool(const char* name, bool default_value) {
    const char* val = std::getenv(name);
    if (val) {
        std::string s(val);
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return s == "1" || s == "true" || s == "on" || s == "yes";
    }
    return default_value;
}

std::string Environ::GetString(const char* name,
                               const std::string& default_value) {
    const char* val = std::getenv(name);
    if (val) {
        return std::string(val);
    }
    return default_value;
}

Environ::Environ() {
    server_threads_ = GetInt("SN_SERVER_THREADS", 0);
    client_threads_ = GetInt("SN_CLIENT_THREADS", 0);
    connect_timeout_ms_ = GetInt("SN_CONNECT_TIMEOUT_MS", 0);
    listen_backlog_ = GetInt("SN_LISTEN_BACKLOG", 0);
    max_frame_size_ = GetSizeT("SN_MAX_FRAME_SIZE", 0);
    send_chunk_size_ = GetSizeT("SN_SEND_CHUNK_SIZE", 0);
    tcp_no_delay_ = GetString("SN_TCP_NODELAY", "");
    bind_host_ = GetString("SN_BIND_HOST", "");
    server_port_ = GetInt("SN_SERVER_PORT", 0);
    config_path_ = GetString("SN_CONFIG_PATH", "");
    log_level_ = GetString("SN_LOG_LEVEL", "INFO");
    log_dir_ = GetString("SN_LOG_DIR", "");
}

}  // namespace shufflenet
