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

#include "transport_client_factory.h"

#include <glog/logging.h>

#include <chrono>
#include <future>

namespace shufflenet {

TransportClientFactory::TransportClientFactory(const TransportConf &conf)
    : conf_(conf) {
    CHECK_GT(conf_.client_threads, 0)
        << "TransportClientFactory requires at least one thread";
    work_guard_.emplace(io_context_.get_executor());
    for (int i = 0; i < conf_.client_threads; ++i) {
        threads_.emplace_back(&TransportClientFactory::worker, this);
    }
}

TransportClientFactory::~TransportClientFactory() { close(); }

void TransportClientFactory::worker() {
    while (true) {
        try {
            io_context_.run();
            return;
        } catch (std::exception &e) {
            LOG(ERROR) << "TransportClientFactory: exception: " << e.what();
        }
    }
}

tl::expected<std::shared_ptr<TransportClient>, ErrorCode>
TransportClientFactory::createClient(const std::string &host, uint16_t port) {
    std::string key = host + ":" + std::to_string(port);
    {
        MutexLocker lock(&mutex_);
        auto it = pool_.find(key);
        if (it != pool_.end() && it->second->isActive()) {
            return it->second;
        }
    }

    auto client = createUnmanagedClient(host, port);
    if (!client) {
        return client;
    }

    MutexLocker lock(&mutex_);
    auto &slot = pool_[key];
    if (slot && slot->isActive()) {
        // Another caller connected to the same peer first.
        (*client)->close();
        return slot;
    }
    slot = *client;
    return client;
}

tl::expected<std::shared_ptr<TransportClient>, ErrorCode>
TransportClientFactory::createUnmanagedClient(const std::string &host,
                                              uint16_t port) {
    {
        MutexLocker lock(&mutex_);
        if (closed_) {
            return tl::make_unexpected(ErrorCode::CONNECTION_CLOSED);
        }
    }

    boost::system::error_code ec;
    boost::asio::ip::tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        LOG(ERROR) << "TransportClientFactory: cannot resolve " << host
                   << ": " << ec.message();
        return tl::make_unexpected(ErrorCode::CONNECTION_FAILED);
    }

    auto socket = std::make_shared<boost::asio::ip::tcp::socket>(io_context_);
    auto strand = boost::asio::make_strand(io_context_);
    auto promise =
        std::make_shared<std::promise<boost::system::error_code>>();
    auto future = promise->get_future();
    boost::asio::async_connect(
        *socket, endpoints,
        boost::asio::bind_executor(
            strand, [promise](const boost::system::error_code &ec,
                              const boost::asio::ip::tcp::endpoint &) {
                promise->set_value(ec);
            }));

    if (future.wait_for(std::chrono::milliseconds(
            conf_.connect_timeout_ms)) != std::future_status::ready) {
        boost::asio::post(strand, [socket]() {
            boost::system::error_code ignored;
            socket->close(ignored);
        });
        future.wait();
        LOG(ERROR) << "TransportClientFactory: connecting to " << host << ":"
                   << port << " timed out after " << conf_.connect_timeout_ms
                   << " ms";
        return tl::make_unexpected(ErrorCode::CONNECTION_FAILED);
    }
    ec = future.get();
    if (ec) {
        LOG(ERROR) << "TransportClientFactory: cannot connect to " << host
                   << ":" << port << ": " << ec.message();
        return tl::make_unexpected(ErrorCode::CONNECTION_FAILED);
    }

    socket->set_option(boost::asio::ip::tcp::no_delay(conf_.tcp_no_delay),
                       ec);
    if (ec) {
        LOG(WARNING) << "TransportClientFactory: cannot set TCP_NODELAY: "
                     << ec.message();
    }

    auto client = std::make_shared<TransportClient>(
        io_context_, std::move(*socket), conf_);
    {
        MutexLocker lock(&mutex_);
        if (closed_) {
            return tl::make_unexpected(ErrorCode::CONNECTION_CLOSED);
        }
        all_clients_.push_back(client);
    }
    client->start();
    LOG(INFO) << "Connected to " << host << ":" << port;
    return client;
}

void TransportClientFactory::close() {
    std::vector<std::shared_ptr<TransportClient>> clients;
    {
        MutexLocker lock(&mutex_);
        if (closed_) return;
        closed_ = true;
        for (auto &weak : all_clients_) {
            if (auto client = weak.lock()) clients.push_back(client);
        }
        all_clients_.clear();
        pool_.clear();
    }
    for (auto &client : clients) client->close();
    clients.clear();

    work_guard_.reset();
    for (auto &thread : threads_) thread.join();
    threads_.clear();
}

}  // namespace shufflenet
