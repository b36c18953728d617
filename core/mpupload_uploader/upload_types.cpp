// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_types.hpp"

namespace mpupload {
namespace uploader {

const char* toString(UploadErrorKind kind) {
  switch (kind) {
    case UploadErrorKind::None:
      return "None";
    case UploadErrorKind::InvalidConfiguration:
      return "InvalidConfiguration";
    case UploadErrorKind::EmptyFileNotSupported:
      return "EmptyFileNotSupported";
    case UploadErrorKind::FileReadFailed:
      return "FileReadFailed";
    case UploadErrorKind::RemoteCallFailed:
      return "RemoteCallFailed";
    case UploadErrorKind::PartUploadFailed:
      return "PartUploadFailed";
  }
  return "Unknown";
}

const char* toString(UploadPhase phase) {
  switch (phase) {
    case UploadPhase::Initiating:
      return "Initiating";
    case UploadPhase::Chunking:
      return "Chunking";
    case UploadPhase::Dispatching:
      return "Dispatching";
    case UploadPhase::Aggregating:
      return "Aggregating";
    case UploadPhase::Completing:
      return "Completing";
    case UploadPhase::Done:
      return "Done";
    case UploadPhase::Failed:
      return "Failed";
  }
  return "Unknown";
}

}  // namespace uploader
}  // namespace mpupload
