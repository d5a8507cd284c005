#pragma once

#include <string>
#include <cstdint>
#include <cstdlib>

namespace shufflenet {

// Snapshot of the SN_* environment variables. A value of 0 (or an empty
// string) means the variable is unset and the built-in default applies.
class Environ {
   public:
    // Singleton access, captured on first use
    static Environ& Get();

    // Fresh snapshot of the current process environment
    static Environ Capture();

    // Getters for Environment Variables
    int GetServerThreads() const { return server_threads_; }
    int GetClientThreads() const { return client_threads_; }
    int GetConnectTimeoutMs() const { return connect_timeout_ms_; }
    int GetListenBacklog() const { return listen_backlog_; }
    size_t GetMaxFrameSize() const { return max_frame_size_; }
    size_t GetSendChunkSize() const { return send_chunk_size_; }
    std::string GetTcpNoDelay() const { return tcp_no_delay_; }
    std::string GetBindHost() const { return bind_host_; }
    int GetServerPort() const { return server_port_; }
    std::string GetConfigPath() const { return config_path_; }
    std::string GetLogLevel() const { return log_level_; }
    std::string GetLogDir() const { return log_dir_; }

    // Helper method to get int from env
    static int GetInt(const char* name, int default_value);
    // Helper method to get size_t from env
    static size_t GetSizeT(const char* name, size_t default_value);
    // Helper method to get bool from env (checks for "1", "true", "on", "yes")
    static bool GetBool(const char* name, bool default_value);
    // Helper method to get string from env
    static std::string GetString(const char* name,
                                 const std::string& default_value);

   private:
    Environ();

    int server_threads_;
    int client_threads_;
    int connect_timeout_ms_;
    int listen_backlog_;
    size_t max_frame_size_;
    size_t send_chunk_size_;
    // Kept as a string so that "unset" can be told apart from "false"
    std::string tcp_no_delay_;
    std::string bind_host_;
    int server_port_;
    std::string config_path_;
    std::string log_level_;
    std::string log_dir_;
};

}  // namespace shufflenet
