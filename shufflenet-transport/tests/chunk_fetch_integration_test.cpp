#include <endian.h>
#include <glog/logging.h>
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <future>
#include <map>
#include <mutex>
#include <random>
#include <semaphore>
#include <stdexcept>
#include <thread>
#include <vector>

#include "chunk_stream_manager.h"
#include "message_handler.h"
#include "protocol.h"
#include "transport_client.h"
#include "transport_client_factory.h"
#include "transport_context.h"
#include "transport_server.h"

namespace shufflenet {

namespace {

constexpr StreamId kStreamId = 1;
constexpr StreamId kRangedStreamId = 2;
constexpr StreamId kBlockingStreamId = 3;
constexpr int32_t kBufferChunkIndex = 0;
constexpr int32_t kFileChunkIndex = 1;
constexpr int32_t kMissingChunkIndex = 12345;

template <typename Pred>
bool waitUntil(Pred pred, std::chrono::milliseconds timeout =
                              std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

struct FetchResult {
    std::map<int32_t, std::string> successes;
    std::map<int32_t, std::pair<ErrorCode, std::string>> failures;
};

// Records every terminal callback and signals a semaphore once per fetch.
class RecordingCallback : public ChunkReceivedCallback {
   public:
    void onSuccess(int32_t chunk_index, ManagedBuffer buffer) override {
        auto bytes = buffer.asBytes();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            result_.successes[chunk_index] = bytes ? **bytes : "<unreadable>";
            ++num_successes_;
        }
        sem_.release();
    }

    void onFailure(int32_t chunk_index, ErrorCode code,
                   const std::string &message) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            result_.failures[chunk_index] = {code, message};
            ++num_failures_;
        }
        sem_.release();
    }

    // Waits for n terminal callbacks, at most 5 seconds each.
    bool await(int n) {
        for (int i = 0; i < n; ++i) {
            if (!sem_.try_acquire_for(std::chrono::seconds(5))) return false;
        }
        return true;
    }

    FetchResult result() {
        std::lock_guard<std::mutex> lock(mutex_);
        return result_;
    }

    int numSuccesses() {
        std::lock_guard<std::mutex> lock(mutex_);
        return num_successes_;
    }

    int numFailures() {
        std::lock_guard<std::mutex> lock(mutex_);
        return num_failures_;
    }

   private:
    std::counting_semaphore<1 << 20> sem_{0};
    std::mutex mutex_;
    FetchResult result_;
    int num_successes_ = 0;
    int num_failures_ = 0;
};

}  // namespace

class ChunkFetchIntegrationTest : public ::testing::Test {
   protected:
    void SetUp() override {
        google::InitGoogleLogging("ChunkFetchIntegrationTest");
        FLAGS_logtostderr = 1;

        buffer_content = std::make_shared<std::string>(100000, '\0');
        for (size_t i = 0; i < buffer_content->size(); ++i) {
            (*buffer_content)[i] = static_cast<char>(i);
        }

        char path[] = "/tmp/chunk_fetch_integration_test_XXXXXX";
        int fd = mkstemp(path);
        ASSERT_GE(fd, 0);
        close(fd);
        test_filename = path;
        file_content.resize(1024);
        std::mt19937 rng(20251018);
        for (auto &c : file_content) c = static_cast<char>(rng());
        std::ofstream out(test_filename, std::ios::binary | std::ios::trunc);
        out.write(file_content.data(), file_content.size());
        out.close();

        manager = std::make_shared<ChunkStreamManager>();
        ASSERT_EQ(
            manager->registerStream(
                kStreamId, 2,
                [this](int32_t chunk_index, int32_t, int32_t)
                    -> tl::expected<ManagedBuffer, ErrorCode> {
                    if (chunk_index == kBufferChunkIndex) {
                        auto buffer = ManagedBuffer::wrap(buffer_content);
                        track(buffer);
                        return buffer;
                    }
                    auto buffer = ManagedBuffer::fromFile(
                        test_filename, 10, file_content.size() - 25);
                    if (buffer) track(*buffer);
                    return buffer;
                }),
            ErrorCode::OK);

        FileChunkResolver ranged(test_filename, {0, 512, 1024});
        ASSERT_EQ(manager->registerStream(
                      kRangedStreamId, ranged.numChunks(),
                      [this, ranged](int32_t chunk_index, int32_t offset,
                                     int32_t len) {
                          auto buffer = ranged(chunk_index, offset, len);
                          if (buffer) track(*buffer);
                          return buffer;
                      }),
                  ErrorCode::OK);

        auto gate = gate_promise.get_future().share();
        ASSERT_EQ(manager->registerStream(
                      kBlockingStreamId, 1,
                      [this, gate](int32_t, int32_t, int32_t)
                          -> tl::expected<ManagedBuffer, ErrorCode> {
                          resolver_entered = true;
                          gate.wait();
                          auto buffer = ManagedBuffer::fromBytes("gated");
                          track(buffer);
                          return buffer;
                      }),
                  ErrorCode::OK);

        conf.bind_host = "127.0.0.1";
        conf.server_port = 0;
        conf.send_chunk_size = 4096;
        handler = std::make_shared<ChunkFetchRequestHandler>(manager);
        startServer(conf);
    }

    void TearDown() override {
        openGate();
        if (factory) factory->close();
        if (server) server->close();
        EXPECT_TRUE(waitUntil([this] {
            return buffers_freed.load() == buffers_created.load();
        })) << "created " << buffers_created << ", freed " << buffers_freed;
        google::ShutdownGoogleLogging();
        remove(test_filename.c_str());
    }

    void startServer(const TransportConf &server_conf) {
        // A client must go before the factory that runs it.
        client.reset();
        TransportContext context(server_conf, handler);
        auto created = context.createServer();
        ASSERT_TRUE(created) << toString(created.error());
        server = std::move(*created);
        factory = context.createClientFactory();
        auto connected = factory->createClient("127.0.0.1", server->getPort());
        ASSERT_TRUE(connected) << toString(connected.error());
        client = *connected;
    }

    void track(ManagedBuffer &buffer) {
        buffers_created++;
        buffer.setDeallocateHook([this] { buffers_freed++; });
    }

    void openGate() {
        if (!gate_opened) {
            gate_opened = true;
            gate_promise.set_value();
        }
    }

    FetchResult fetchChunks(StreamId stream_id,
                            const std::vector<int32_t> &chunks) {
        auto callback = std::make_shared<RecordingCallback>();
        for (int32_t chunk : chunks) {
            client->fetchChunk(stream_id, chunk, std::nullopt, callback);
        }
        EXPECT_TRUE(callback->await(chunks.size()))
            << "Timeout getting response from the server";
        return callback->result();
    }

    std::string expectedFileChunk() const {
        return file_content.substr(10, file_content.size() - 25);
    }

    std::shared_ptr<std::string> buffer_content;
    std::string test_filename;
    std::string file_content;
    std::shared_ptr<ChunkStreamManager> manager;
    std::shared_ptr<ChunkFetchRequestHandler> handler;
    TransportConf conf;
    std::unique_ptr<TransportServer> server;
    std::unique_ptr<TransportClientFactory> factory;
    std::shared_ptr<TransportClient> client;

    std::atomic<int> buffers_created{0};
    std::atomic<int> buffers_freed{0};
    std::promise<void> gate_promise;
    bool gate_opened = false;
    std::atomic<bool> resolver_entered{false};
};

TEST_F(ChunkFetchIntegrationTest, FetchBufferChunk) {
    auto result = fetchChunks(kStreamId, {kBufferChunkIndex});
    EXPECT_TRUE(result.failures.empty());
    ASSERT_EQ(result.successes.size(), 1u);
    EXPECT_EQ(result.successes[kBufferChunkIndex], *buffer_content);
}

TEST_F(ChunkFetchIntegrationTest, FetchFileChunk) {
    auto result = fetchChunks(kStreamId, {kFileChunkIndex});
    EXPECT_TRUE(result.failures.empty());
    ASSERT_EQ(result.successes.size(), 1u);
    EXPECT_EQ(result.successes[kFileChunkIndex], expectedFileChunk());
}

TEST_F(ChunkFetchIntegrationTest, FetchNonExistentChunk) {
    auto result = fetchChunks(kStreamId, {kMissingChunkIndex});
    EXPECT_TRUE(result.successes.empty());
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[kMissingChunkIndex].first,
              ErrorCode::CHUNK_FETCH_FAILED);
    EXPECT_NE(result.failures[kMissingChunkIndex].second.find(
                  "INVALID_CHUNK_INDEX"),
              std::string::npos);
}

TEST_F(ChunkFetchIntegrationTest, FetchBothChunks) {
    auto result = fetchChunks(kStreamId, {kBufferChunkIndex, kFileChunkIndex});
    EXPECT_TRUE(result.failures.empty());
    ASSERT_EQ(result.successes.size(), 2u);
    EXPECT_EQ(result.successes[kBufferChunkIndex], *buffer_content);
    EXPECT_EQ(result.successes[kFileChunkIndex], expectedFileChunk());
}

TEST_F(ChunkFetchIntegrationTest, FetchChunkAndNonExistent) {
    auto result =
        fetchChunks(kStreamId, {kBufferChunkIndex, kMissingChunkIndex});
    ASSERT_EQ(result.successes.size(), 1u);
    EXPECT_EQ(result.successes[kBufferChunkIndex], *buffer_content);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures.count(kMissingChunkIndex), 1u);
}

TEST_F(ChunkFetchIntegrationTest, FetchUnknownStream) {
    auto result = fetchChunks(99, {0});
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_NE(result.failures[0].second.find("STREAM_NOT_FOUND"),
              std::string::npos);
}

TEST_F(ChunkFetchIntegrationTest, RangeHintNarrowsChunk) {
    auto callback = std::make_shared<RecordingCallback>();
    client->fetchChunk(kRangedStreamId, 1, ChunkRange{10, 20}, callback);
    client->fetchChunk(kRangedStreamId, 0, std::nullopt, callback);
    ASSERT_TRUE(callback->await(2));
    auto result = callback->result();
    ASSERT_EQ(result.successes.size(), 2u);
    EXPECT_EQ(result.successes[1], file_content.substr(522, 20));
    EXPECT_EQ(result.successes[0], file_content.substr(0, 512));
}

TEST_F(ChunkFetchIntegrationTest, ConcurrentMixedFetchesFromManyThreads) {
    const int kThreads = 4;
    const int kStreamsPerThread = 16;
    for (int s = 0; s < kThreads * kStreamsPerThread; ++s) {
        FileChunkResolver resolver(test_filename, {0, 1024});
        ASSERT_EQ(manager->registerStream(1000 + s, resolver.numChunks(),
                                          resolver),
                  ErrorCode::OK);
    }

    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            auto callback = std::make_shared<RecordingCallback>();
            int issued = 0;
            for (int s = 0; s < kStreamsPerThread; ++s) {
                StreamId stream_id = 1000 + t * kStreamsPerThread + s;
                // Chunk 0 exists, chunk 7 does not.
                client->fetchChunk(stream_id, 0, std::nullopt, callback);
                client->fetchChunk(stream_id, 7, std::nullopt, callback);
                issued += 2;
            }
            if (!callback->await(issued)) {
                mismatches++;
                return;
            }
            if (callback->numSuccesses() != kStreamsPerThread ||
                callback->numFailures() != kStreamsPerThread) {
                mismatches++;
            }
            auto result = callback->result();
            for (auto &[index, bytes] : result.successes) {
                if (index != 0 || bytes != file_content) mismatches++;
            }
            for (auto &[index, failure] : result.failures) {
                if (index != 7) mismatches++;
            }
        });
    }
    for (auto &thread : threads) thread.join();

    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_EQ(client->numOutstandingRequests(), 0u);
}

TEST_F(ChunkFetchIntegrationTest, ExactlyOneCallbackPerFetch) {
    std::atomic<int> terminal{0};
    class CountingCallback : public ChunkReceivedCallback {
       public:
        explicit CountingCallback(std::atomic<int> &count) : count_(count) {}
        void onSuccess(int32_t, ManagedBuffer) override { count_++; }
        void onFailure(int32_t, ErrorCode, const std::string &) override {
            count_++;
        }

       private:
        std::atomic<int> &count_;
    };

    for (int s = 0; s < 50; ++s) {
        FileChunkResolver resolver(test_filename, {0, 100, 200});
        ASSERT_EQ(manager->registerStream(2000 + s, resolver.numChunks(),
                                          resolver),
                  ErrorCode::OK);
    }
    auto callback = std::make_shared<CountingCallback>(terminal);
    int issued = 0;
    for (int s = 0; s < 50; ++s) {
        for (int32_t chunk : {0, 1, 2, 3}) {
            client->fetchChunk(2000 + s, chunk, std::nullopt, callback);
            ++issued;
        }
    }
    EXPECT_TRUE(waitUntil([&] { return terminal.load() == issued; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(terminal.load(), issued);
}

TEST_F(ChunkFetchIntegrationTest, OversizedChunkFailsWithoutClosing) {
    factory->close();
    server->close();
    TransportConf small = conf;
    small.max_frame_size = 65536;
    startServer(small);

    auto result = fetchChunks(kStreamId, {kBufferChunkIndex, kFileChunkIndex});
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_NE(result.failures[kBufferChunkIndex].second.find(
                  "FRAME_TOO_LARGE"),
              std::string::npos);
    ASSERT_EQ(result.successes.size(), 1u);
    EXPECT_EQ(result.successes[kFileChunkIndex], expectedFileChunk());
    EXPECT_TRUE(client->isActive());
}

TEST_F(ChunkFetchIntegrationTest, UnregisteredHandlerRefusesFetches) {
    handler->setRegistered(false);
    auto result = fetchChunks(kStreamId, {kBufferChunkIndex});
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_NE(result.failures[kBufferChunkIndex].second.find(
                  "HANDLER_NOT_REGISTERED"),
              std::string::npos);

    handler->setRegistered(true);
    result = fetchChunks(kStreamId, {kBufferChunkIndex});
    EXPECT_EQ(result.successes.size(), 1u);
}

TEST_F(ChunkFetchIntegrationTest, DuplicateInFlightFetchFailsInline) {
    auto first = std::make_shared<RecordingCallback>();
    client->fetchChunk(kBlockingStreamId, 0, std::nullopt, first);
    ASSERT_TRUE(waitUntil([this] { return resolver_entered.load(); }));

    auto second = std::make_shared<RecordingCallback>();
    client->fetchChunk(kBlockingStreamId, 0, std::nullopt, second);
    // Delivered on this thread before fetchChunk returned.
    auto rejected = second->result();
    ASSERT_EQ(rejected.failures.size(), 1u);
    EXPECT_EQ(rejected.failures[0].first, ErrorCode::DUPLICATE_REQUEST);

    openGate();
    ASSERT_TRUE(first->await(1));
    auto result = first->result();
    ASSERT_EQ(result.successes.size(), 1u);
    EXPECT_EQ(result.successes[0], "gated");
}

TEST_F(ChunkFetchIntegrationTest, CloseFailsPendingFetches) {
    auto callback = std::make_shared<RecordingCallback>();
    client->fetchChunk(kBlockingStreamId, 0, std::nullopt, callback);
    ASSERT_TRUE(waitUntil([this] { return resolver_entered.load(); }));
    client->fetchChunk(kStreamId, kBufferChunkIndex, std::nullopt, callback);
    EXPECT_EQ(client->numOutstandingRequests(), 2u);

    client->close();
    ASSERT_TRUE(callback->await(2));
    auto result = callback->result();
    EXPECT_TRUE(result.successes.empty());
    ASSERT_EQ(result.failures.size(), 2u);
    for (auto &[index, failure] : result.failures) {
        EXPECT_EQ(failure.first, ErrorCode::CONNECTION_CLOSED);
    }
    EXPECT_FALSE(client->isActive());

    auto late = std::make_shared<RecordingCallback>();
    client->fetchChunk(kStreamId, kBufferChunkIndex, std::nullopt, late);
    auto late_result = late->result();
    ASSERT_EQ(late_result.failures.size(), 1u);
    EXPECT_EQ(late_result.failures[kBufferChunkIndex].first,
              ErrorCode::CONNECTION_CLOSED);
}

TEST_F(ChunkFetchIntegrationTest, ServerCloseFailsClientConnection) {
    auto result = fetchChunks(kStreamId, {kBufferChunkIndex});
    ASSERT_EQ(result.successes.size(), 1u);
    EXPECT_TRUE(waitUntil([this] { return server->numConnections() == 1; }));

    server->close();
    EXPECT_TRUE(waitUntil([this] { return !client->isActive(); }));
    auto after = fetchChunks(kStreamId, {kBufferChunkIndex});
    ASSERT_EQ(after.failures.size(), 1u);
    EXPECT_EQ(after.failures[kBufferChunkIndex].first,
              ErrorCode::CONNECTION_CLOSED);
}

TEST_F(ChunkFetchIntegrationTest, ClientPoolReusesActiveClient) {
    auto again = factory->createClient("127.0.0.1", server->getPort());
    ASSERT_TRUE(again);
    EXPECT_EQ(again->get(), client.get());

    auto unmanaged =
        factory->createUnmanagedClient("127.0.0.1", server->getPort());
    ASSERT_TRUE(unmanaged);
    EXPECT_NE(unmanaged->get(), client.get());

    client->close();
    ASSERT_TRUE(waitUntil([this] { return !client->isActive(); }));
    auto replaced = factory->createClient("127.0.0.1", server->getPort());
    ASSERT_TRUE(replaced);
    EXPECT_NE(replaced->get(), client.get());
    EXPECT_TRUE((*replaced)->isActive());
}

TEST_F(ChunkFetchIntegrationTest, ConnectToClosedPortFails) {
    uint16_t port = server->getPort();
    factory->close();
    server->close();

    TransportConf client_conf = conf;
    client_conf.connect_timeout_ms = 1000;
    TransportClientFactory other(client_conf);
    auto failed = other.createClient("127.0.0.1", port);
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error(), ErrorCode::CONNECTION_FAILED);
}

TEST_F(ChunkFetchIntegrationTest, ThrowingResolverFailsOnlyThatChunk) {
    ASSERT_EQ(manager->registerStream(
                  4, 2,
                  [this](int32_t chunk_index, int32_t, int32_t)
                      -> tl::expected<ManagedBuffer, ErrorCode> {
                      if (chunk_index == 1) {
                          throw std::invalid_argument("Invalid chunk index 1");
                      }
                      auto buffer = ManagedBuffer::fromBytes("sibling");
                      track(buffer);
                      return buffer;
                  }),
              ErrorCode::OK);

    auto result = fetchChunks(4, {1, 0});
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[1].first, ErrorCode::CHUNK_FETCH_FAILED);
    EXPECT_NE(result.failures[1].second.find("Invalid chunk index 1"),
              std::string::npos);
    ASSERT_EQ(result.successes.size(), 1u);
    EXPECT_EQ(result.successes[0], "sibling");

    // The connection keeps serving after the exception.
    auto after = fetchChunks(kStreamId, {kBufferChunkIndex});
    ASSERT_EQ(after.successes.size(), 1u);
    EXPECT_EQ(after.successes[kBufferChunkIndex], *buffer_content);
    EXPECT_TRUE(client->isActive());
    EXPECT_TRUE(waitUntil([this] {
        return buffers_freed.load() == buffers_created.load();
    }));
}

TEST_F(ChunkFetchIntegrationTest, FileShrunkBeforeSendFailsWithoutClosing) {
    std::string shrinking = test_filename + ".shrinking";
    {
        std::ofstream out(shrinking, std::ios::binary | std::ios::trunc);
        out << std::string(4096, 'x');
    }
    ASSERT_EQ(manager->registerStream(
                  5, 1,
                  [this, shrinking](int32_t, int32_t, int32_t)
                      -> tl::expected<ManagedBuffer, ErrorCode> {
                      auto buffer = ManagedBuffer::fromFile(shrinking, 0, 4096);
                      if (!buffer) return buffer;
                      track(*buffer);
                      // Validated at 4096 bytes, shrunk before the write.
                      EXPECT_EQ(truncate(shrinking.c_str(), 100), 0);
                      return buffer;
                  }),
              ErrorCode::OK);

    auto result = fetchChunks(5, {0});
    EXPECT_TRUE(result.successes.empty());
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].first, ErrorCode::CHUNK_FETCH_FAILED);
    EXPECT_NE(result.failures[0].second.find("FILE_READ_FAIL"),
              std::string::npos);

    auto after = fetchChunks(kStreamId, {kBufferChunkIndex});
    ASSERT_EQ(after.successes.size(), 1u);
    EXPECT_TRUE(client->isActive());
    EXPECT_TRUE(waitUntil([this] {
        return buffers_freed.load() == buffers_created.load();
    }));
    remove(shrinking.c_str());
}

TEST_F(ChunkFetchIntegrationTest, PayloadReadFailureClosesConnection) {
    char dir_template[] = "/tmp/chunk_fetch_integration_dir_XXXXXX";
    ASSERT_NE(mkdtemp(dir_template), nullptr);
    std::string dir = dir_template;
    std::string entry = dir + "/entry";
    {
        std::ofstream out(entry);
        out << "x";
    }
    struct stat st;
    ASSERT_EQ(stat(dir.c_str(), &st), 0);
    if (st.st_size <= 0) {
        remove(entry.c_str());
        rmdir(dir.c_str());
        GTEST_SKIP() << "directory size is not reported on this filesystem";
    }
    uint64_t dir_size = static_cast<uint64_t>(st.st_size);

    // A directory opens and has a size but every pread fails, so the error
    // shows up only once the success header is on the wire.
    ASSERT_EQ(manager->registerStream(
                  6, 1,
                  [this, dir, dir_size](int32_t, int32_t, int32_t)
                      -> tl::expected<ManagedBuffer, ErrorCode> {
                      auto buffer = ManagedBuffer::fromFile(dir, 0, dir_size);
                      if (buffer) track(*buffer);
                      return buffer;
                  }),
              ErrorCode::OK);

    auto callback = std::make_shared<RecordingCallback>();
    client->fetchChunk(6, 0, std::nullopt, callback);
    client->fetchChunk(kStreamId, kBufferChunkIndex, std::nullopt, callback);
    ASSERT_TRUE(callback->await(2));
    // Both fetches use chunk index 0, so count callbacks rather than map
    // entries.
    EXPECT_EQ(callback->numSuccesses(), 0);
    EXPECT_EQ(callback->numFailures(), 2);
    for (auto &[index, failure] : callback->result().failures) {
        EXPECT_TRUE(failure.first == ErrorCode::CONNECTION_CLOSED ||
                    failure.first == ErrorCode::CONNECTION_FAILED)
            << index << ": " << toString(failure.first);
    }
    EXPECT_TRUE(waitUntil([this] { return !client->isActive(); }));
    EXPECT_TRUE(waitUntil([this] { return server->numConnections() == 0; }));
    EXPECT_TRUE(waitUntil([this] {
        return buffers_freed.load() == buffers_created.load();
    }));

    remove(entry.c_str());
    rmdir(dir.c_str());
}

TEST_F(ChunkFetchIntegrationTest, RequestWithWrongBodyLengthClosesConnection) {
    boost::asio::io_context io_context;
    boost::asio::ip::tcp::socket socket(io_context);
    boost::system::error_code ec;
    socket.connect(boost::asio::ip::tcp::endpoint(
                       boost::asio::ip::make_address("127.0.0.1"),
                       server->getPort()),
                   ec);
    ASSERT_FALSE(ec) << ec.message();

    // Announces a 1 MiB request body and never sends it.
    std::string header =
        encodeFrame(ChunkFetchRequest{}).substr(0, kFrameHeaderLength);
    uint32_t body_length = htole32(1u << 20);
    memcpy(header.data(), &body_length, sizeof(body_length));
    boost::asio::write(socket, boost::asio::buffer(header), ec);
    ASSERT_FALSE(ec) << ec.message();

    char byte;
    bool completed = false;
    boost::system::error_code read_ec;
    socket.async_read_some(
        boost::asio::buffer(&byte, 1),
        [&](const boost::system::error_code &e, std::size_t) {
            read_ec = e;
            completed = true;
        });
    io_context.run_for(std::chrono::seconds(5));
    ASSERT_TRUE(completed) << "server kept waiting for the body";
    EXPECT_TRUE(read_ec == boost::asio::error::eof) << read_ec.message();

    auto result = fetchChunks(kStreamId, {kBufferChunkIndex});
    EXPECT_EQ(result.successes.size(), 1u);
}

TEST(TransportThreadsDeathTest, ZeroClientThreadsAborts) {
    ::testing::FLAGS_gtest_death_test_style = "threadsafe";
    TransportConf zero;
    zero.client_threads = 0;
    EXPECT_DEATH({ TransportClientFactory factory(zero); },
                 "at least one thread");
}

TEST(TransportThreadsDeathTest, ZeroServerThreadsAborts) {
    ::testing::FLAGS_gtest_death_test_style = "threadsafe";
    TransportConf zero;
    zero.server_threads = 0;
    auto handler = std::make_shared<ChunkFetchRequestHandler>(
        std::make_shared<ChunkStreamManager>());
    EXPECT_DEATH({ TransportServer server(zero, handler); },
                 "at least one thread");
}

}  // namespace shufflenet
