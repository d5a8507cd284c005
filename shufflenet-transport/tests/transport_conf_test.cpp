#include "transport_conf.h"

#include <glog/logging.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <cstdlib>
#include <fstream>

namespace shufflenet {

class TransportConfTest : public ::testing::Test {
   protected:
    void SetUp() override {
        google::InitGoogleLogging("TransportConfTest");
        FLAGS_logtostderr = 1;
    }

    void TearDown() override {
        google::ShutdownGoogleLogging();
        unsetenv("SN_SERVER_THREADS");
        unsetenv("SN_MAX_FRAME_SIZE");
        unsetenv("SN_SEND_CHUNK_SIZE");
        unsetenv("SN_TCP_NODELAY");
        unsetenv("SN_SERVER_PORT");
        if (!config_path.empty()) remove(config_path.c_str());
    }

    void writeConfig(const std::string &content) {
        config_path = "/tmp/transport_conf_test_" +
                      std::to_string(getpid()) + ".yaml";
        std::ofstream out(config_path);
        out << content;
    }

    std::string config_path;
};

TEST_F(TransportConfTest, Defaults) {
    TransportConf conf;
    EXPECT_EQ(conf.module, "shuffle");
    EXPECT_EQ(conf.server_threads, 2);
    EXPECT_EQ(conf.client_threads, 1);
    EXPECT_EQ(conf.connect_timeout_ms, 10000);
    EXPECT_EQ(conf.max_frame_size, kDefaultMaxFrameSize);
    EXPECT_EQ(conf.send_chunk_size, 65536u);
    EXPECT_TRUE(conf.tcp_no_delay);
    EXPECT_EQ(conf.bind_host, "0.0.0.0");
    EXPECT_EQ(conf.key("serverThreads"), "shuffle.io.serverThreads");
}

TEST_F(TransportConfTest, LoadFromFile) {
    writeConfig(
        "shuffle:\n"
        "  io:\n"
        "    serverThreads: 4\n"
        "    clientThreads: 300\n"
        "    maxFrameSize: 1048576\n"
        "    sendChunkSize: 8192\n"
        "    tcpNoDelay: false\n"
        "    bindHost: 127.0.0.1\n"
        "    port: 19090\n"
        "fetch:\n"
        "  io:\n"
        "    serverThreads: 8\n");
    DefaultConfig config;
    config.SetPath(config_path);
    config.Load();

    TransportConf conf;
    loadTransportConf(conf, config);
    EXPECT_EQ(conf.server_threads, 4);
    // Out of range, keeps the default.
    EXPECT_EQ(conf.client_threads, 1);
    EXPECT_EQ(conf.max_frame_size, 1048576u);
    EXPECT_EQ(conf.send_chunk_size, 8192u);
    EXPECT_FALSE(conf.tcp_no_delay);
    EXPECT_EQ(conf.bind_host, "127.0.0.1");
    EXPECT_EQ(conf.server_port, 19090);

    TransportConf fetch_conf;
    fetch_conf.module = "fetch";
    loadTransportConf(fetch_conf, config);
    EXPECT_EQ(fetch_conf.server_threads, 8);
    EXPECT_EQ(fetch_conf.server_port, 0);
}

TEST_F(TransportConfTest, EnvironmentOverrides) {
    setenv("SN_SERVER_THREADS", "3", 1);
    setenv("SN_MAX_FRAME_SIZE", "16", 1);
    setenv("SN_SEND_CHUNK_SIZE", "4096", 1);
    setenv("SN_TCP_NODELAY", "off", 1);
    setenv("SN_SERVER_PORT", "18080", 1);

    TransportConf conf;
    loadTransportConf(conf, Environ::Capture());
    EXPECT_EQ(conf.server_threads, 3);
    // Below the 1KB minimum, ignored.
    EXPECT_EQ(conf.max_frame_size, kDefaultMaxFrameSize);
    EXPECT_EQ(conf.send_chunk_size, 4096u);
    EXPECT_FALSE(conf.tcp_no_delay);
    EXPECT_EQ(conf.server_port, 18080);
}

TEST_F(TransportConfTest, TcpNoDelayIsCaseInsensitive) {
    setenv("SN_TCP_NODELAY", "OFF", 1);
    TransportConf conf;
    loadTransportConf(conf, Environ::Capture());
    EXPECT_FALSE(conf.tcp_no_delay);

    setenv("SN_TCP_NODELAY", "True", 1);
    loadTransportConf(conf, Environ::Capture());
    EXPECT_TRUE(conf.tcp_no_delay);

    // Bytes above 0x7f are not a recognized value.
    setenv("SN_TCP_NODELAY", "\xc3\xa9", 1);
    loadTransportConf(conf, Environ::Capture());
    EXPECT_FALSE(conf.tcp_no_delay);
}

}  // namespace shufflenet
