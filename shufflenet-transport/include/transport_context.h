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

#ifndef TRANSPORT_CONTEXT_H_
#define TRANSPORT_CONTEXT_H_

#include <memory>

#include "message_handler.h"
#include "transport_client_factory.h"
#include "transport_conf.h"
#include "transport_server.h"

namespace shufflenet {

// Builds servers and client factories of one module from a shared
// configuration and message handler.
class TransportContext {
   public:
    TransportContext(TransportConf conf,
                     std::shared_ptr<BaseMessageHandler> handler);

    // Returns a started server, or the reason it could not listen.
    tl::expected<std::unique_ptr<TransportServer>, ErrorCode> createServer();

    std::unique_ptr<TransportClientFactory> createClientFactory();

    const TransportConf &conf() const { return conf_; }

    const std::shared_ptr<BaseMessageHandler> &handler() const {
        return handler_;
    }

   private:
    TransportConf conf_;
    std::shared_ptr<BaseMessageHandler> handler_;
};

}  // namespace shufflenet

#endif  // TRANSPORT_CONTEXT_H_
