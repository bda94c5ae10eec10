// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "s3_path.hpp"

namespace parcel {
namespace transfer {

namespace {
const std::string kS3Scheme = "s3://";
}

bool is_s3_path(const std::string& path) { return path.compare(0, kS3Scheme.size(), kS3Scheme) == 0; }

std::pair<std::string, std::string> find_bucket_key(const std::string& s3_path) {
  std::string path = is_s3_path(s3_path) ? s3_path.substr(kS3Scheme.size()) : s3_path;

  auto slash = path.find('/');
  if (slash == std::string::npos) {
    return {path, ""};
  }
  return {path.substr(0, slash), path.substr(slash + 1)};
}

}  // namespace transfer
}  // namespace parcel
