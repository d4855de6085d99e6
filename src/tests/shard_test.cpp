#include <gtest/gtest.h>
#include "shard/shard.hpp"
#include "network/transfer_error.hpp"

using upstream::shard::Shard;
using upstream::network::ChunkError;

TEST(ShardTest, FromJsonWithAllFields) {
  auto shard = Shard::from_json(R"({"filehash": "abc123", "key": "s3cr3t", "filename": "movie.part"})");
  EXPECT_EQ(shard.filehash(), "abc123");
  EXPECT_EQ(shard.decrypt_key(), "s3cr3t");
  EXPECT_EQ(shard.filename(), "movie.part");
  EXPECT_EQ(shard.uri(), "abc123?key=s3cr3t");
}

TEST(ShardTest, FromJsonHashOnly) {
  auto shard = Shard::from_json(R"({"filehash": "abc123"})");
  EXPECT_TRUE(shard.decrypt_key().empty());
  EXPECT_TRUE(shard.filename().empty());
  EXPECT_EQ(shard.uri(), "abc123");
}

TEST(ShardTest, FromJsonToleratesNullOptionals) {
  auto shard = Shard::from_json(R"({"filehash": "abc123", "key": null, "filename": null, "extra": 5})");
  EXPECT_EQ(shard.uri(), "abc123");
}

TEST(ShardTest, FromJsonRejectsBadBodies) {
  std::vector<std::string> bodies = {
    "",
    "not json",
    "[1, 2, 3]",
    R"({"key": "k"})",
    R"({"filehash": ""})",
    R"({"filehash": 42})"
  };

  for (const auto& body : bodies) {
    EXPECT_THROW(Shard::from_json(body), std::invalid_argument) << "Body: " << body;
  }
}

TEST(ShardTest, FromUriWithKey) {
  auto shard = Shard::from_uri("deadbeef?key=c0ffee");
  EXPECT_EQ(shard.filehash(), "deadbeef");
  EXPECT_EQ(shard.decrypt_key(), "c0ffee");
  EXPECT_EQ(shard.uri(), "deadbeef?key=c0ffee");
}

TEST(ShardTest, FromUriWithoutKey) {
  auto shard = Shard::from_uri("deadbeef");
  EXPECT_EQ(shard.filehash(), "deadbeef");
  EXPECT_TRUE(shard.decrypt_key().empty());
}

TEST(ShardTest, FromUriWithoutHashFails) {
  EXPECT_THROW(Shard::from_uri(""), ChunkError);
  EXPECT_THROW(Shard::from_uri("?key=abc"), ChunkError);
}

TEST(ShardTest, UploadResponseAndUserUriAddressTheSameShard) {
  auto uploaded = Shard::from_json(R"({"filehash": "f00d", "key": "k3y"})");
  auto parsed = Shard::from_uri(uploaded.uri());
  EXPECT_EQ(parsed, uploaded);
}

TEST(ShardTest, ToJsonOmitsEmptyFields) {
  Shard shard("f00d");
  EXPECT_EQ(shard.to_json(), R"({"filehash":"f00d"})");
  EXPECT_EQ(Shard::from_json(Shard("f00d", "k", "name").to_json()), Shard("f00d", "k", "name"));
}
