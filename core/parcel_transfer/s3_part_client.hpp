// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_S3_PART_CLIENT_HPP
#define PARCEL_S3_PART_CLIENT_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "transfer_interfaces.hpp"

namespace parcel {
namespace transfer {

/**
 * S3 configuration options
 */
struct S3Config {
  std::string endpoint_url;  // e.g., "https://play.min.io"; empty for AWS S3
  std::string bucket;        // Bucket name
  std::string region = "us-east-1";
  bool use_ssl = true;
  bool verify_ssl = true;

  // Credentials. If empty, read from AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY
  std::string access_key;
  std::string secret_key;

  // Timeouts (in milliseconds)
  int connect_timeout_ms = 10000;
  int request_timeout_ms = 300000;  // 5 minutes for 5GB parts

  // AWS SDK internal retries. Parcel performs none of its own, so a failed
  // part fails the transfer unless the SDK is allowed to retry it.
  int max_sdk_retries = 0;
};

/**
 * S3 rejects CompleteMultipartUpload when any part but the last is smaller
 */
constexpr uint64_t kMinMultipartPartSize = 5 * 1024 * 1024;

/**
 * "bytes=<first>-<last>" for an HTTP Range header.
 * length must be positive.
 */
std::string make_range_header(uint64_t offset, uint64_t length);

/**
 * Connection to one bucket, shared by the part clients of many transfers.
 *
 * Owns the AWS SDK client; the SDK itself is initialized on first use and
 * shut down when the last connection is destroyed.
 */
class S3Connection {
public:
  explicit S3Connection(const S3Config& config);
  ~S3Connection();

  // Non-copyable, non-movable
  S3Connection(const S3Connection&) = delete;
  S3Connection& operator=(const S3Connection&) = delete;
  S3Connection(S3Connection&&) = delete;
  S3Connection& operator=(S3Connection&&) = delete;

  /**
   * Size of an object via HeadObject
   *
   * @return Content length, or std::nullopt if the object does not exist
   */
  std::optional<uint64_t> object_size(const std::string& key);

  const std::string& bucket() const;

  const std::string& endpoint() const;

private:
  friend class S3MultipartUploader;
  friend class S3RangedDownloader;

  class Impl;
  std::unique_ptr<Impl> impl_;
};

/**
 * Uploads a local file as an S3 multipart upload.
 *
 * begin() creates the upload, refusing plans whose non-final parts are
 * below kMinMultipartPartSize. transfer_part() reads the byte range from the
 * file and sends it with UploadPart, complete() assembles the object from
 * the part ETags and abort() discards the upload on the server.
 */
class S3MultipartUploader : public IPartTransferClient {
public:
  S3MultipartUploader(
    std::shared_ptr<S3Connection> connection, std::string local_path, std::string key
  );

  bool begin(uint64_t total_size, uint64_t part_size, uint64_t part_count) override;
  PartResult transfer_part(const PartTask& part) override;
  bool complete(const std::vector<PartResult>& parts) override;
  void abort() override;
  std::string describe() const override;

  /**
   * Upload ID assigned by begin(), empty before
   */
  const std::string& upload_id() const { return upload_id_; }

private:
  std::shared_ptr<S3Connection> connection_;
  std::string local_path_;
  std::string key_;
  std::string upload_id_;
};

/**
 * Downloads an object with concurrent ranged GETs.
 *
 * Parts are written at their offsets into "<local_path>.parcel-tmp", which
 * complete() renames onto local_path and abort() removes.
 */
class S3RangedDownloader : public IPartTransferClient {
public:
  S3RangedDownloader(
    std::shared_ptr<S3Connection> connection, std::string key, std::string local_path
  );

  bool begin(uint64_t total_size, uint64_t part_size, uint64_t part_count) override;
  PartResult transfer_part(const PartTask& part) override;
  bool complete(const std::vector<PartResult>& parts) override;
  void abort() override;
  std::string describe() const override;

  const std::string& temp_path() const { return temp_path_; }

private:
  std::shared_ptr<S3Connection> connection_;
  std::string key_;
  std::string local_path_;
  std::string temp_path_;
};

}  // namespace transfer
}  // namespace parcel

#endif  // PARCEL_S3_PART_CLIENT_HPP
