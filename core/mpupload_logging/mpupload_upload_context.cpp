// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "mpupload_upload_context.hpp"

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core/core.hpp>

namespace mpupload {
namespace logging {

namespace {

// Adds a thread attribute and returns its position, or nothing when the
// thread already carries an attribute of that name.
template <typename T>
std::optional<boost::log::attribute_set::iterator> add_thread_constant(
  const char* name, const T& value
) {
  auto res = boost::log::core::get()->add_thread_attribute(
    name, boost::log::attributes::constant<T>(value)
  );
  if (!res.second) {
    return std::nullopt;
  }
  return res.first;
}

void remove_thread_attribute(boost::log::attribute_set::iterator it) {
  boost::log::core::get()->remove_thread_attribute(it);
}

}  // namespace

UploadLogContext::UploadLogContext(
  const std::string& bucket, const std::string& key, const std::string& upload_id
) {
  if (auto it = add_thread_constant(kBucketAttr, bucket)) {
    owned_.push_back(*it);
  }
  if (auto it = add_thread_constant(kObjectKeyAttr, key)) {
    owned_.push_back(*it);
  }
  if (!upload_id.empty()) {
    set_upload_id(upload_id);
  }
}

UploadLogContext::~UploadLogContext() {
  if (upload_id_) {
    remove_thread_attribute(*upload_id_);
  }
  for (auto it : owned_) {
    remove_thread_attribute(it);
  }
}

void UploadLogContext::set_upload_id(const std::string& upload_id) {
  if (upload_id_) {
    remove_thread_attribute(*upload_id_);
    upload_id_.reset();
  }
  upload_id_ = add_thread_constant(kUploadIdAttr, upload_id);
}

PartLogContext::PartLogContext(int part_number)
    : part_(add_thread_constant(kPartNumberAttr, part_number)) {}

PartLogContext::~PartLogContext() {
  if (part_) {
    remove_thread_attribute(*part_);
  }
}

void append_upload_context(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm
) {
  auto bucket = boost::log::extract<std::string>(kBucketAttr, rec);
  auto key = boost::log::extract<std::string>(kObjectKeyAttr, rec);
  auto upload_id = boost::log::extract<std::string>(kUploadIdAttr, rec);
  auto part = boost::log::extract<int>(kPartNumberAttr, rec);
  if (!bucket && !key && !upload_id && !part) {
    return;
  }

  strm << " |";
  if (bucket) strm << " bucket=" << *bucket;
  if (key) strm << " key=" << *key;
  if (upload_id) strm << " upload_id=" << *upload_id;
  if (part) strm << " part=" << *part;
}

}  // namespace logging
}  // namespace mpupload
