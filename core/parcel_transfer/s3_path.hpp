// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PARCEL_S3_PATH_HPP
#define PARCEL_S3_PATH_HPP

#include <string>
#include <utility>

namespace parcel {
namespace transfer {

/**
 * Split "bucket/key" (optionally prefixed with "s3://") at the first '/'.
 *
 * "s3://bucket/dir/file" -> {"bucket", "dir/file"}
 * "bucket"               -> {"bucket", ""}
 *
 * Bytes are passed through untouched, so UTF-8 names survive as-is.
 */
std::pair<std::string, std::string> find_bucket_key(const std::string& s3_path);

/**
 * True if the path carries the "s3://" scheme
 */
bool is_s3_path(const std::string& path);

}  // namespace transfer
}  // namespace parcel

#endif  // PARCEL_S3_PATH_HPP
