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

#ifndef TRANSPORT_CLIENT_FACTORY_H_
#define TRANSPORT_CLIENT_FACTORY_H_

#include <boost/asio.hpp>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "mutex.h"
#include "transport_client.h"
#include "transport_conf.h"

namespace shufflenet {

/**
 * TransportClientFactory owns the io_context and the client_threads threads
 * that deliver responses for all of its clients. Clients must not outlive
 * the factory that created them.
 *
 * createClient and createUnmanagedClient block until connected and must not
 * be called from a fetch callback.
 */
class TransportClientFactory {
   public:
    explicit TransportClientFactory(const TransportConf &conf);

    ~TransportClientFactory();

    TransportClientFactory(const TransportClientFactory &) = delete;
    TransportClientFactory &operator=(const TransportClientFactory &) = delete;

    // Returns the pooled client for host:port if it is still active,
    // otherwise connects a new one and pools it.
    tl::expected<std::shared_ptr<TransportClient>, ErrorCode> createClient(
        const std::string &host, uint16_t port);

    // Always connects a new client, which is not pooled.
    tl::expected<std::shared_ptr<TransportClient>, ErrorCode>
    createUnmanagedClient(const std::string &host, uint16_t port);

    // Closes every client created by this factory and joins the threads.
    void close();

   private:
    void worker();

    TransportConf conf_;
    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<
        boost::asio::io_context::executor_type>>
        work_guard_;
    std::vector<std::thread> threads_;

    Mutex mutex_;
    bool closed_ GUARDED_BY(mutex_) = false;
    std::unordered_map<std::string, std::shared_ptr<TransportClient>> pool_
        GUARDED_BY(mutex_);
    std::vector<std::weak_ptr<TransportClient>> all_clients_
        GUARDED_BY(mutex_);
};

}  // namespace shufflenet

#endif  // TRANSPORT_CLIENT_FACTORY_H_
