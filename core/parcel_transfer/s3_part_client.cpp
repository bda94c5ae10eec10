// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "s3_part_client.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/utils/memory/stl/AWSStreamFwd.h>
#include <aws/core/utils/stream/PreallocatedStreamBuf.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/UploadPartRequest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <vector>

#define PARCEL_LOG_COMPONENT "s3_part_client"
#include <parcel_log_macros.hpp>

namespace fs = std::filesystem;

namespace parcel {
namespace transfer {

using ::parcel::logging::kv;

// =============================================================================
// AWS SDK Lifecycle Management
// =============================================================================
// Aws::InitAPI/ShutdownAPI must bracket every SDK object. Connections hold a
// reference; the SDK is shut down when the last one goes away.
// =============================================================================

class AwsSdkManager {
public:
  static AwsSdkManager& instance() {
    static AwsSdkManager instance;
    return instance;
  }

  void addRef() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      options_.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
      Aws::InitAPI(options_);
      initialized_ = true;
    }
    ++ref_count_;
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref_count_ > 0 && --ref_count_ == 0 && initialized_) {
      Aws::ShutdownAPI(options_);
      initialized_ = false;
    }
  }

private:
  AwsSdkManager() = default;
  ~AwsSdkManager() = default;

  std::mutex mutex_;
  bool initialized_ = false;
  int ref_count_ = 0;
  Aws::SDKOptions options_;
};

std::string make_range_header(uint64_t offset, uint64_t length) {
  return "bytes=" + std::to_string(offset) + "-" + std::to_string(offset + length - 1);
}

// =============================================================================
// S3Connection
// =============================================================================

class S3Connection::Impl {
public:
  S3Config config;
  std::shared_ptr<Aws::S3::S3Client> client;

  Impl() { AwsSdkManager::instance().addRef(); }

  ~Impl() {
    // SDK objects must be gone before release() may call Aws::ShutdownAPI()
    client.reset();
    AwsSdkManager::instance().release();
  }

  void initClient() {
    Aws::Client::ClientConfiguration client_config;
    client_config.region = config.region;

    if (!config.endpoint_url.empty()) {
      std::string endpoint = config.endpoint_url;
      if (endpoint.back() == '/') {
        endpoint.pop_back();
      }
      client_config.endpointOverride = endpoint;
    }

    client_config.verifySSL = config.verify_ssl;
    client_config.scheme = config.use_ssl ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;
    client_config.connectTimeoutMs = config.connect_timeout_ms;
    client_config.requestTimeoutMs = config.request_timeout_ms;
    client_config.retryStrategy = Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(
      "ParcelRetryStrategy", static_cast<long>(config.max_sdk_retries)
    );

    Aws::Auth::AWSCredentials credentials(config.access_key, config.secret_key);

    // Path-style addressing for custom endpoints (MinIO), virtual-hosted for AWS
    bool use_virtual_addressing = config.endpoint_url.empty();

    client = std::make_shared<Aws::S3::S3Client>(
      credentials,
      client_config,
      Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      use_virtual_addressing
    );
  }
};

S3Connection::S3Connection(const S3Config& config) : impl_(std::make_unique<Impl>()) {
  impl_->config = config;

  if (impl_->config.access_key.empty()) {
    if (const char* key = std::getenv("AWS_ACCESS_KEY_ID")) {
      impl_->config.access_key = key;
    }
  }
  if (impl_->config.secret_key.empty()) {
    if (const char* key = std::getenv("AWS_SECRET_ACCESS_KEY")) {
      impl_->config.secret_key = key;
    }
  }

  impl_->initClient();
}

S3Connection::~S3Connection() = default;

std::optional<uint64_t> S3Connection::object_size(const std::string& key) {
  Aws::S3::Model::HeadObjectRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);

  auto outcome = impl_->client->HeadObject(request);
  if (!outcome.IsSuccess()) {
    PARCEL_LOG_WARN(
      "HeadObject failed" << kv("key", key)
                          << kv("error", std::string(outcome.GetError().GetMessage()))
    );
    return std::nullopt;
  }
  return static_cast<uint64_t>(outcome.GetResult().GetContentLength());
}

const std::string& S3Connection::bucket() const { return impl_->config.bucket; }

const std::string& S3Connection::endpoint() const { return impl_->config.endpoint_url; }

// =============================================================================
// S3MultipartUploader
// =============================================================================

S3MultipartUploader::S3MultipartUploader(
  std::shared_ptr<S3Connection> connection, std::string local_path, std::string key
)
    : connection_(std::move(connection))
    , local_path_(std::move(local_path))
    , key_(std::move(key)) {}

bool S3MultipartUploader::begin(uint64_t total_size, uint64_t part_size, uint64_t part_count) {
  if (part_count > 1 && part_size < kMinMultipartPartSize) {
    PARCEL_LOG_ERROR(
      "Part size below S3 multipart minimum" << kv("key", key_) << kv("part_size", part_size)
                                             << kv("min_part_size", kMinMultipartPartSize)
                                             << kv("parts", part_count)
    );
    return false;
  }

  auto& impl = *connection_->impl_;

  Aws::S3::Model::CreateMultipartUploadRequest request;
  request.SetBucket(impl.config.bucket);
  request.SetKey(key_);
  request.SetContentType("application/octet-stream");

  auto outcome = impl.client->CreateMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    const auto& error = outcome.GetError();
    PARCEL_LOG_ERROR(
      "CreateMultipartUpload failed" << kv("key", key_)
                                     << kv("error", std::string(error.GetMessage()))
                                     << kv("code", std::string(error.GetExceptionName()))
    );
    return false;
  }

  upload_id_ = outcome.GetResult().GetUploadId();
  PARCEL_LOG_DEBUG(
    "Multipart upload created" << kv("upload_id", upload_id_) << kv("size", total_size)
                               << kv("part_size", part_size) << kv("parts", part_count)
  );
  return true;
}

PartResult S3MultipartUploader::transfer_part(const PartTask& part) {
  std::ifstream file(local_path_, std::ios::binary);
  if (!file) {
    return PartResult::Failure(
      part.part_number, "Cannot open local file: " + local_path_, "FileNotFound"
    );
  }

  std::vector<char> buffer(static_cast<size_t>(part.length));
  file.seekg(static_cast<std::streamoff>(part.offset));
  file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
  if (static_cast<uint64_t>(file.gcount()) != part.length) {
    return PartResult::Failure(
      part.part_number, "Short read from " + local_path_ + " at offset " +
                          std::to_string(part.offset),
      "ShortRead"
    );
  }

  // The request body reads straight from buffer, which outlives UploadPart
  Aws::Utils::Stream::PreallocatedStreamBuf streambuf(
    reinterpret_cast<unsigned char*>(buffer.data()), buffer.size()
  );
  auto body = Aws::MakeShared<Aws::IOStream>("ParcelUploadPart", &streambuf);

  auto& impl = *connection_->impl_;
  Aws::S3::Model::UploadPartRequest request;
  request.SetBucket(impl.config.bucket);
  request.SetKey(key_);
  request.SetUploadId(upload_id_);
  request.SetPartNumber(static_cast<int>(part.part_number));
  request.SetContentLength(static_cast<long long>(part.length));
  request.SetBody(body);

  auto outcome = impl.client->UploadPart(request);
  if (!outcome.IsSuccess()) {
    const auto& error = outcome.GetError();
    return PartResult::Failure(part.part_number, error.GetMessage(), error.GetExceptionName());
  }
  return PartResult::Success(part.part_number, outcome.GetResult().GetETag());
}

bool S3MultipartUploader::complete(const std::vector<PartResult>& parts) {
  Aws::S3::Model::CompletedMultipartUpload completed;
  for (const auto& part : parts) {
    completed.AddParts(Aws::S3::Model::CompletedPart()
                         .WithETag(part.etag)
                         .WithPartNumber(static_cast<int>(part.part_number)));
  }

  auto& impl = *connection_->impl_;
  Aws::S3::Model::CompleteMultipartUploadRequest request;
  request.SetBucket(impl.config.bucket);
  request.SetKey(key_);
  request.SetUploadId(upload_id_);
  request.SetMultipartUpload(completed);

  auto outcome = impl.client->CompleteMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    const auto& error = outcome.GetError();
    PARCEL_LOG_ERROR(
      "CompleteMultipartUpload failed" << kv("key", key_)
                                       << kv("error", std::string(error.GetMessage()))
                                       << kv("code", std::string(error.GetExceptionName()))
    );
    return false;
  }
  return true;
}

void S3MultipartUploader::abort() {
  if (upload_id_.empty()) {
    return;
  }

  auto& impl = *connection_->impl_;
  Aws::S3::Model::AbortMultipartUploadRequest request;
  request.SetBucket(impl.config.bucket);
  request.SetKey(key_);
  request.SetUploadId(upload_id_);

  auto outcome = impl.client->AbortMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    // The server-side upload keeps its parts until a lifecycle rule removes them
    PARCEL_LOG_WARN(
      "AbortMultipartUpload failed" << kv("upload_id", upload_id_)
                                    << kv("error", std::string(outcome.GetError().GetMessage()))
    );
  }
  upload_id_.clear();
}

std::string S3MultipartUploader::describe() const { return connection_->bucket() + "/" + key_; }

// =============================================================================
// S3RangedDownloader
// =============================================================================

S3RangedDownloader::S3RangedDownloader(
  std::shared_ptr<S3Connection> connection, std::string key, std::string local_path
)
    : connection_(std::move(connection))
    , key_(std::move(key))
    , local_path_(std::move(local_path))
    , temp_path_(local_path_ + ".parcel-tmp") {}

bool S3RangedDownloader::begin(uint64_t total_size, uint64_t part_size, uint64_t part_count) {
  std::error_code ec;
  fs::path parent = fs::path(local_path_).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
  }

  {
    std::ofstream create(temp_path_, std::ios::binary | std::ios::trunc);
    if (!create) {
      PARCEL_LOG_ERROR("Cannot create download file" << kv("path", temp_path_));
      return false;
    }
  }

  // Size the file up front so every worker writes inside it
  fs::resize_file(temp_path_, total_size, ec);
  if (ec) {
    PARCEL_LOG_ERROR(
      "Cannot size download file" << kv("path", temp_path_) << kv("error", ec.message())
    );
    std::error_code remove_ec;
    fs::remove(temp_path_, remove_ec);
    return false;
  }

  PARCEL_LOG_DEBUG(
    "Download file prepared" << kv("path", temp_path_) << kv("size", total_size)
                             << kv("part_size", part_size) << kv("parts", part_count)
  );
  return true;
}

PartResult S3RangedDownloader::transfer_part(const PartTask& part) {
  if (part.length == 0) {
    return PartResult::Success(part.part_number);
  }

  auto& impl = *connection_->impl_;
  Aws::S3::Model::GetObjectRequest request;
  request.SetBucket(impl.config.bucket);
  request.SetKey(key_);
  request.SetRange(make_range_header(part.offset, part.length));

  auto outcome = impl.client->GetObject(request);
  if (!outcome.IsSuccess()) {
    const auto& error = outcome.GetError();
    return PartResult::Failure(part.part_number, error.GetMessage(), error.GetExceptionName());
  }

  std::fstream out(temp_path_, std::ios::in | std::ios::out | std::ios::binary);
  if (!out) {
    return PartResult::Failure(
      part.part_number, "Cannot open download file: " + temp_path_, "FileNotFound"
    );
  }
  out.seekp(static_cast<std::streamoff>(part.offset));
  out << outcome.GetResult().GetBody().rdbuf();

  auto written = static_cast<uint64_t>(out.tellp()) - part.offset;
  if (!out || written != part.length) {
    return PartResult::Failure(
      part.part_number, "Wrote " + std::to_string(written) + " of " +
                          std::to_string(part.length) + " bytes",
      "ShortWrite"
    );
  }
  return PartResult::Success(part.part_number, outcome.GetResult().GetETag());
}

bool S3RangedDownloader::complete(const std::vector<PartResult>& parts) {
  std::error_code ec;
  fs::rename(temp_path_, local_path_, ec);
  if (ec) {
    PARCEL_LOG_ERROR(
      "Cannot move download into place" << kv("path", local_path_) << kv("error", ec.message())
    );
    return false;
  }
  PARCEL_LOG_DEBUG("Download assembled" << kv("path", local_path_) << kv("parts", parts.size()));
  return true;
}

void S3RangedDownloader::abort() {
  std::error_code ec;
  fs::remove(temp_path_, ec);
}

std::string S3RangedDownloader::describe() const { return connection_->bucket() + "/" + key_; }

}  // namespace transfer
}  // namespace parcel
