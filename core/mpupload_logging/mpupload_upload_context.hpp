// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef MPUPLOAD_UPLOAD_CONTEXT_HPP
#define MPUPLOAD_UPLOAD_CONTEXT_HPP

#include <boost/log/attributes/attribute_set.hpp>
#include <boost/log/core/record_view.hpp>
#include <boost/log/utility/formatting_ostream.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mpupload {
namespace logging {

// Thread attribute names attached to records emitted during an upload.
constexpr const char* kBucketAttr = "Bucket";
constexpr const char* kObjectKeyAttr = "ObjectKey";
constexpr const char* kUploadIdAttr = "UploadId";
constexpr const char* kPartNumberAttr = "PartNumber";

/**
 * Tags every record logged by the calling thread with the upload target
 * until the context is destroyed.
 *
 * Boost.Log thread attributes are per thread, so each part worker creates its
 * own context. If an enclosing context on the same thread already set an
 * attribute, the outer value is kept and left in place on destruction.
 */
class UploadLogContext {
public:
  UploadLogContext(
    const std::string& bucket, const std::string& key, const std::string& upload_id = ""
  );
  ~UploadLogContext();

  UploadLogContext(const UploadLogContext&) = delete;
  UploadLogContext& operator=(const UploadLogContext&) = delete;

  /**
   * Attach the session id once the store has issued it. Replaces an id set
   * earlier by this context.
   */
  void set_upload_id(const std::string& upload_id);

private:
  std::vector<boost::log::attribute_set::iterator> owned_;
  std::optional<boost::log::attribute_set::iterator> upload_id_;
};

/**
 * Tags records logged by the calling thread with the part being transferred.
 */
class PartLogContext {
public:
  explicit PartLogContext(int part_number);
  ~PartLogContext();

  PartLogContext(const PartLogContext&) = delete;
  PartLogContext& operator=(const PartLogContext&) = delete;

private:
  std::optional<boost::log::attribute_set::iterator> part_;
};

/**
 * Append " | bucket=.. key=.. upload_id=.. part=.." for whichever upload
 * attributes the record carries. Writes nothing for records logged outside
 * an upload.
 */
void append_upload_context(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm
);

}  // namespace logging
}  // namespace mpupload

#endif  // MPUPLOAD_UPLOAD_CONTEXT_HPP
