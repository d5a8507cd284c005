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

#include "transport_context.h"

#include <glog/logging.h>

namespace shufflenet {

TransportContext::TransportContext(TransportConf conf,
                                   std::shared_ptr<BaseMessageHandler> handler)
    : conf_(std::move(conf)), handler_(std::move(handler)) {}

tl::expected<std::unique_ptr<TransportServer>, ErrorCode>
TransportContext::createServer() {
    if (!handler_) {
        LOG(ERROR) << "TransportContext [" << conf_.module
                   << "]: cannot create a server without a message handler";
        return tl::make_unexpected(ErrorCode::INVALID_PARAMS);
    }
    auto server = std::make_unique<TransportServer>(conf_, handler_);
    auto err = server->start();
    if (err != ErrorCode::OK) {
        return tl::make_unexpected(err);
    }
    return server;
}

std::unique_ptr<TransportClientFactory>
TransportContext::createClientFactory() {
    return std::make_unique<TransportClientFactory>(conf_);
}

}  // namespace shufflenet
