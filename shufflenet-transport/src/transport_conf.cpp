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

#include "transport_conf.h"

#include <dirent.h>
#include <glog/logging.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace shufflenet {

namespace {
bool validThreads(int64_t n) { return n > 0 && n <= 256; }
bool validPort(int64_t port) { return port >= 0 && port < 65536; }
bool validFrameSize(uint64_t size) {
    return size >= 1024 && size <= (1ULL << 31);
}
bool validSendChunkSize(uint64_t size) {
    return size > 0 && size <= (64ULL << 20);
}

void applyLogDir(const std::string &log_dir_path) {
    DIR *dir = opendir(log_dir_path.c_str());
    if (dir == nullptr) {
        LOG(WARNING)
            << "Path [" << log_dir_path
            << "] is not a valid directory path. Still logging to stderr.";
        return;
    }
    closedir(dir);
    if (access(log_dir_path.c_str(), W_OK) != 0) {
        LOG(WARNING) << "Path [" << log_dir_path
                     << "] is not writable by the current user. Still "
                        "logging to stderr.";
        return;
    }
    FLAGS_log_dir = log_dir_path;
    FLAGS_logtostderr = 0;
    FLAGS_stop_logging_if_full_disk = true;
}
}  // namespace

void loadTransportConf(TransportConf &conf, const DefaultConfig &config) {
    int32_t server_threads;
    config.GetInt32(conf.key("serverThreads"), &server_threads,
                    conf.server_threads);
    if (validThreads(server_threads)) {
        conf.server_threads = server_threads;
    } else {
        LOG(WARNING) << "Ignore " << conf.key("serverThreads") << "="
                     << server_threads;
    }

    int32_t client_threads;
    config.GetInt32(conf.key("clientThreads"), &client_threads,
                    conf.client_threads);
    if (validThreads(client_threads)) {
        conf.client_threads = client_threads;
    } else {
        LOG(WARNING) << "Ignore " << conf.key("clientThreads") << "="
                     << client_threads;
    }

    int32_t connect_timeout_ms;
    config.GetInt32(conf.key("connectTimeoutMs"), &connect_timeout_ms,
                    conf.connect_timeout_ms);
    if (connect_timeout_ms > 0) conf.connect_timeout_ms = connect_timeout_ms;

    int32_t backlog;
    config.GetInt32(conf.key("backlog"), &backlog, conf.listen_backlog);
    if (backlog > 0) conf.listen_backlog = backlog;

    uint64_t max_frame_size;
    config.GetUInt64(conf.key("maxFrameSize"), &max_frame_size,
                     conf.max_frame_size);
    if (validFrameSize(max_frame_size)) {
        conf.max_frame_size = max_frame_size;
    } else {
        LOG(WARNING) << "Ignore " << conf.key("maxFrameSize") << "="
                     << max_frame_size;
    }

    uint64_t send_chunk_size;
    config.GetUInt64(conf.key("sendChunkSize"), &send_chunk_size,
                     conf.send_chunk_size);
    if (validSendChunkSize(send_chunk_size)) {
        conf.send_chunk_size = send_chunk_size;
    } else {
        LOG(WARNING) << "Ignore " << conf.key("sendChunkSize") << "="
                     << send_chunk_size;
    }

    config.GetBool(conf.key("tcpNoDelay"), &conf.tcp_no_delay,
                   conf.tcp_no_delay);
    config.GetString(conf.key("bindHost"), &conf.bind_host, conf.bind_host);

    int32_t port;
    config.GetInt32(conf.key("port"), &port, conf.server_port);
    if (validPort(port)) {
        conf.server_port = static_cast<uint16_t>(port);
    } else {
        LOG(WARNING) << "Ignore " << conf.key("port") << "=" << port;
    }
}

void loadTransportConf(TransportConf &conf, const Environ &env) {
    int server_threads = env.GetServerThreads();
    if (validThreads(server_threads)) conf.server_threads = server_threads;

    int client_threads = env.GetClientThreads();
    if (validThreads(client_threads)) conf.client_threads = client_threads;

    int connect_timeout_ms = env.GetConnectTimeoutMs();
    if (connect_timeout_ms > 0) conf.connect_timeout_ms = connect_timeout_ms;

    int backlog = env.GetListenBacklog();
    if (backlog > 0) conf.listen_backlog = backlog;

    size_t max_frame_size = env.GetMaxFrameSize();
    if (validFrameSize(max_frame_size)) {
        conf.max_frame_size = max_frame_size;
    } else if (max_frame_size != 0) {
        LOG(WARNING) << "Ignore value from environment variable "
                        "SN_MAX_FRAME_SIZE, it should be in [1KB, 2GB]";
    }

    size_t send_chunk_size = env.GetSendChunkSize();
    if (validSendChunkSize(send_chunk_size)) {
        conf.send_chunk_size = send_chunk_size;
    } else if (send_chunk_size != 0) {
        LOG(WARNING) << "Ignore value from environment variable "
                        "SN_SEND_CHUNK_SIZE, it should be in (0, 64MB]";
    }

    std::string tcp_no_delay = env.GetTcpNoDelay();
    if (!tcp_no_delay.empty()) {
        std::transform(tcp_no_delay.begin(), tcp_no_delay.end(),
                       tcp_no_delay.begin(), [](unsigned char c) {
                           return static_cast<char>(std::tolower(c));
                       });
        conf.tcp_no_delay = tcp_no_delay == "1" || tcp_no_delay == "true" ||
                            tcp_no_delay == "on" || tcp_no_delay == "yes";
    }

    std::string bind_host = env.GetBindHost();
    if (!bind_host.empty()) conf.bind_host = bind_host;

    int port = env.GetServerPort();
    if (port > 0 && validPort(port)) conf.server_port = port;

    std::string log_level = env.GetLogLevel();
    if (log_level == "TRACE") {
        FLAGS_minloglevel = google::INFO;
        FLAGS_v = 1;
    } else if (log_level == "INFO") {
        FLAGS_minloglevel = google::INFO;
    } else if (log_level == "WARNING") {
        FLAGS_minloglevel = google::WARNING;
    } else if (log_level == "ERROR") {
        FLAGS_minloglevel = google::ERROR;
    } else if (!log_level.empty()) {
        LOG(WARNING) << "Ignore value from environment variable SN_LOG_LEVEL, "
                        "it should be TRACE|INFO|WARNING|ERROR";
    }

    std::string log_dir_path = env.GetLogDir();
    if (!log_dir_path.empty()) {
        applyLogDir(log_dir_path);
    }
}

TransportConf createTransportConf(const std::string &module) {
    TransportConf conf;
    conf.module = module;
    auto &env = Environ::Get();
    std::string config_path = env.GetConfigPath();
    if (!config_path.empty()) {
        DefaultConfig config;
        config.SetPath(config_path);
        try {
            config.Load();
            loadTransportConf(conf, config);
        } catch (const std::exception &e) {
            LOG(ERROR) << "Failed to load transport config from "
                       << config_path << ": " << e.what()
                       << ", using defaults";
        }
    }
    loadTransportConf(conf, env);
    return conf;
}

void dumpTransportConf(const TransportConf &conf) {
    LOG(INFO) << "=== Transport Configuration [" << conf.module << "] ===";
    LOG(INFO) << "server_threads = " << conf.server_threads;
    LOG(INFO) << "client_threads = " << conf.client_threads;
    LOG(INFO) << "connect_timeout_ms = " << conf.connect_timeout_ms;
    LOG(INFO) << "listen_backlog = " << conf.listen_backlog;
    LOG(INFO) << "max_frame_size = " << conf.max_frame_size;
    LOG(INFO) << "send_chunk_size = " << conf.send_chunk_size;
    LOG(INFO) << "tcp_no_delay = " << conf.tcp_no_delay;
    LOG(INFO) << "bind_host = " << conf.bind_host;
    LOG(INFO) << "server_port = " << conf.server_port;
}

}  // namespace shufflenet
