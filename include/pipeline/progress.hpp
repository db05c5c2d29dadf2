#pragma once

#include <exception>
#include <functional>
#include <string>

namespace shardpack {
namespace pipeline {

enum class Stage {
  Preparing,
  Encrypting,
  Chunking,
  Replicating,
  StoringPieces,
  StoringManifest,
  FetchingManifest,
  Reconstructing,
  Decrypting,
  Exporting,
  Importing,
  Done,
  Error
};

inline const char* to_string(Stage stage) {
  switch (stage) {
    case Stage::Preparing:        return "preparing";
    case Stage::Encrypting:       return "encrypting";
    case Stage::Chunking:         return "chunking";
    case Stage::Replicating:      return "replicating";
    case Stage::StoringPieces:    return "storing-pieces";
    case Stage::StoringManifest:  return "storing-manifest";
    case Stage::FetchingManifest: return "fetching-manifest";
    case Stage::Reconstructing:   return "reconstructing";
    case Stage::Decrypting:       return "decrypting";
    case Stage::Exporting:        return "exporting";
    case Stage::Importing:        return "importing";
    case Stage::Done:             return "done";
    case Stage::Error:            return "error";
  }
  return "unknown";
}

struct ProgressEvent {
  Stage stage;
  int percent;
  std::string message;
  std::exception_ptr error;               // set only for Stage::Error
};

// Best-effort observer. Exceptions it throws are logged and ignored.
using ProgressCallback = std::function<void(const ProgressEvent&)>;

} // namespace pipeline
} // namespace shardpack
