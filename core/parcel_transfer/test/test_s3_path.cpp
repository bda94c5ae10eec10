// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <gtest/gtest.h>

#include "s3_path.hpp"

using namespace parcel::transfer;

TEST(S3PathTest, BucketAndKey) {
  auto [bucket, key] = find_bucket_key("bucket/dir/file.bin");
  EXPECT_EQ(bucket, "bucket");
  EXPECT_EQ(key, "dir/file.bin");
}

TEST(S3PathTest, SchemeIsStripped) {
  auto [bucket, key] = find_bucket_key("s3://bucket/dir/file.bin");
  EXPECT_EQ(bucket, "bucket");
  EXPECT_EQ(key, "dir/file.bin");
}

TEST(S3PathTest, BucketOnly) {
  EXPECT_EQ(find_bucket_key("bucket"), std::make_pair(std::string("bucket"), std::string()));
  EXPECT_EQ(find_bucket_key("s3://bucket/"), std::make_pair(std::string("bucket"), std::string()));
}

TEST(S3PathTest, KeyKeepsLaterSlashes) {
  auto [bucket, key] = find_bucket_key("s3://bucket//a//b/");
  EXPECT_EQ(bucket, "bucket");
  EXPECT_EQ(key, "/a//b/");
}

TEST(S3PathTest, Utf8NamesPassThrough) {
  auto [bucket, key] = find_bucket_key(u8"s3://bucket/✓/été.txt");
  EXPECT_EQ(bucket, "bucket");
  EXPECT_EQ(key, std::string(u8"✓/été.txt"));
}

TEST(S3PathTest, IsS3Path) {
  EXPECT_TRUE(is_s3_path("s3://bucket/key"));
  EXPECT_FALSE(is_s3_path("/tmp/s3://bucket"));
  EXPECT_FALSE(is_s3_path("bucket/key"));
}
