#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "core/convert/ScopedTempDir.hpp"
#include "core/storage/AssetFetcher.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "test_helpers.hpp"

using namespace certgen;
using namespace test_helpers;

class LocalFSBackendTest : public ::testing::Test {
protected:
  ScopedTempDir root_{"certgen-store-"};
  LocalFSBackend store_{root_.path().string()};
};

TEST_F(LocalFSBackendTest, PutThenGet) {
  ASSERT_TRUE(store_.put("certificates/C1_A_B.docx", to_bytes("docx-bytes"), kDocxContentType).ok());
  auto blob = store_.get("certificates/C1_A_B.docx");
  ASSERT_TRUE(blob.ok());
  EXPECT_EQ(to_string(blob.value().data), "docx-bytes");
  EXPECT_EQ(blob.value().content_type, kDocxContentType);
  EXPECT_TRUE(std::filesystem::exists(root_.path() / "certificates" / "C1_A_B.docx"));
}

TEST_F(LocalFSBackendTest, PutOverwrites) {
  ASSERT_TRUE(store_.put("k.pdf", to_bytes("one"), kPdfContentType).ok());
  ASSERT_TRUE(store_.put("k.pdf", to_bytes("two"), kPdfContentType).ok());
  EXPECT_EQ(to_string(store_.get("k.pdf").value().data), "two");

  // no temp files left behind
  int entries = 0;
  for (const auto& e : std::filesystem::directory_iterator(root_.path())) {
    (void)e;
    ++entries;
  }
  EXPECT_EQ(entries, 1);
}

TEST_F(LocalFSBackendTest, MissingKeyIsNotFound) {
  auto blob = store_.get("templates/missing.docx");
  ASSERT_FALSE(blob.ok());
  EXPECT_EQ(blob.error().code, ErrorCode::AssetNotFound);
}

TEST_F(LocalFSBackendTest, KeysCannotEscapeRoot) {
  for (const std::string key : {"../outside", "a/../../b", "/etc/passwd", ""}) {
    EXPECT_FALSE(store_.get(key).ok()) << key;
    EXPECT_FALSE(store_.put(key, to_bytes("x"), "text/plain").ok()) << key;
  }
}

TEST_F(LocalFSBackendTest, ConcurrentWritersToSameKey) {
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([this, i] {
      const std::string body(1000, static_cast<char>('a' + i));
      EXPECT_TRUE(store_.put("same.bin", to_bytes(body), "application/octet-stream").ok());
    });
  }
  for (auto& t : threads) t.join();

  auto blob = store_.get("same.bin");
  ASSERT_TRUE(blob.ok());
  ASSERT_EQ(blob.value().data.size(), 1000u);
  // one writer won, whole
  const unsigned char first = blob.value().data.front();
  for (unsigned char c : blob.value().data) EXPECT_EQ(c, first);
}

TEST_F(LocalFSBackendTest, FetcherRejectsEmptyKey) {
  AssetFetcher fetcher(store_);
  auto blob = fetcher.fetch("");
  ASSERT_FALSE(blob.ok());
  EXPECT_EQ(blob.error().code, ErrorCode::Validation);
}

TEST_F(LocalFSBackendTest, PublisherTagsFailuresAsPublishError) {
  MemoryStore mem;
  mem.failPuts = true;
  ArtifactPublisher publisher(mem);
  auto st = publisher.publish("certificates/x.docx", to_bytes("x"), kDocxContentType);
  ASSERT_FALSE(st.ok());
  EXPECT_EQ(st.error().code, ErrorCode::PublishError);
}
