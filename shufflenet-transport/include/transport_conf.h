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

#ifndef TRANSPORT_CONF_H_
#define TRANSPORT_CONF_H_

#include <cstddef>
#include <cstdint>
#include <string>

#include "default_config.h"
#include "environ.h"
#include "types.h"

namespace shufflenet {

// Transport settings of one module (e.g. "shuffle"). File keys live under
// "<module>.io."; SN_* environment variables override them.
struct TransportConf {
    std::string module = DEFAULT_MODULE_NAME;
    int server_threads = 2;
    int client_threads = 1;
    int connect_timeout_ms = kDefaultConnectTimeoutMs;
    int listen_backlog = kDefaultListenBacklog;
    size_t max_frame_size = kDefaultMaxFrameSize;
    size_t send_chunk_size = kDefaultSendChunkSize;
    bool tcp_no_delay = true;
    std::string bind_host = DEFAULT_BIND_HOST;
    uint16_t server_port = 0;

    std::string key(const std::string &name) const {
        return module + ".io." + name;
    }
};

// Applies the values found in a loaded config file.
void loadTransportConf(TransportConf &conf, const DefaultConfig &config);

// Applies SN_* overrides and the logging settings (SN_LOG_LEVEL, SN_LOG_DIR).
void loadTransportConf(TransportConf &conf, const Environ &env);

// Defaults, then the file named by SN_CONFIG_PATH, then the environment.
TransportConf createTransportConf(const std::string &module);

void dumpTransportConf(const TransportConf &conf);

}  // namespace shufflenet

#endif  // TRANSPORT_CONF_H_
