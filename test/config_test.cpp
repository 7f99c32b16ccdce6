#include <fstream>
#include <gtest/gtest.h>
#include <runbox/paths.h>

#include "../src/config.h"
#include "../src/server.h"

using namespace std::chrono_literals;

class ConfigTest : public ::testing::Test {
 protected:
  size_t saved_max_requests = kMaxRequests;
  size_t saved_http_threads = kHttpThreads;
  int saved_port = kPort;
  std::string saved_api_key = kApiKey;
  ExecutorOptions saved_options = kExecutorOptions;
  fs::path saved_scratch = kScratchRoot;
  fs::path conf = kScratchRoot / "runbox.conf";

  void TearDown() override {
    kMaxRequests = saved_max_requests;
    kHttpThreads = saved_http_threads;
    kPort = saved_port;
    kApiKey = saved_api_key;
    kExecutorOptions = saved_options;
    kScratchRoot = saved_scratch;
    fs::remove(conf);
  }
  void Write(const std::string& content) {
    std::ofstream(conf) << content;
  }
};

TEST_F(ConfigTest, ReadsGlobalSection) {
  Write("port = 9000\napi_key = secret\nmax_requests = 7\nmax_workers = 3\n"
        "http_threads = 2\nworker_timeout = 12\nnode_path = /opt/node\n");
  ASSERT_TRUE(ParseConfig(conf, true));
  EXPECT_EQ(kPort, 9000);
  EXPECT_EQ(kApiKey, "secret");
  EXPECT_EQ(kMaxRequests, 7u);
  EXPECT_EQ(kExecutorOptions.pool_size, 3u);
  EXPECT_EQ(kHttpThreads, 2u);
  EXPECT_EQ(kExecutorOptions.timeout, 12s);
  EXPECT_EQ(kExecutorOptions.node_path, "/opt/node");
}

TEST_F(ConfigTest, RejectsNonPositiveCounts) {
  for (const char* line : {"max_requests = -1\n", "max_workers = 0\n",
                           "http_threads = -64\n", "port = -8194\n"}) {
    Write(line);
    EXPECT_FALSE(ParseConfig(conf, true)) << line;
    EXPECT_EQ(kMaxRequests, saved_max_requests) << line;
    EXPECT_EQ(kExecutorOptions.pool_size, saved_options.pool_size) << line;
    EXPECT_EQ(kHttpThreads, saved_http_threads) << line;
  }
}

TEST_F(ConfigTest, MissingFile) {
  EXPECT_TRUE(ParseConfig(kScratchRoot / "absent.conf", false));
  EXPECT_FALSE(ParseConfig(kScratchRoot / "absent.conf", true));
}
