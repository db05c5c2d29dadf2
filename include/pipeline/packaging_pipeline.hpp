#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "archive/archive_codec.hpp"
#include "config/config.hpp"
#include "crypto/checksum.hpp"
#include "crypto/cipher.hpp"
#include "pipeline/object_record.hpp"
#include "pipeline/progress.hpp"
#include "sharding/manifest.hpp"
#include "sharding/reconstructor.hpp"
#include "store/content_store.hpp"

namespace shardpack {
namespace pipeline {

struct UploadResult {
  ContentId manifest_id;
  sharding::Manifest manifest;
  ObjectRecord record;
  std::optional<std::string> key_material;   // only when the key was generated
};

struct ImportedItem {
  ObjectRecord record;
  bool duplicate = false;
};

struct ImportResult {
  archive::ArchiveMetadata metadata;
  std::vector<ImportedItem> items;
  std::vector<std::string> warnings;
};

class PackagingPipeline {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws config::ConfigError when config is invalid
  PackagingPipeline(store::ContentStore& store,
                    const crypto::Checksum& checksum,
                    const crypto::Cipher& cipher,
                    config::PipelineConfig config = config::PipelineConfig());


  // ---- UPLOAD/DOWNLOAD ----
  // Encrypts (when enabled), splits, replicates and stores data, then stores
  // its manifest. Errors are reported to progress and rethrown unchanged.
  UploadResult upload(const Bytes& data,
                      const std::string& name,
                      const ProgressCallback& progress = nullptr,
                      const std::string& mime_type = "application/octet-stream");
  // Reassembles and verifies the object, decrypting it with key (or the
  // configured key) when the manifest is encrypted
  Bytes download(const ContentId& manifest_id,
                 const std::optional<std::string>& key = std::nullopt,
                 const ProgressCallback& progress = nullptr);
  sharding::VerificationReport verify(const ContentId& manifest_id);
  // Throws store::NotFoundError or sharding::MalformedManifestError
  sharding::Manifest fetch_manifest(const ContentId& manifest_id);


  // ---- EXPORT/IMPORT ----
  Bytes export_archive(const std::vector<ContentId>& root_ids, const ProgressCallback& progress = nullptr);
  Bytes export_archive(const std::vector<ContentId>& root_ids,
                       const config::ArchiveConfig& options,
                       const ProgressCallback& progress = nullptr);
  // Writes every payload not already described by existing into the store
  ImportResult import_archive(const Bytes& data,
                              const std::vector<ObjectRecord>& existing,
                              const ProgressCallback& progress = nullptr);


  // ---- GETTERS ----
  const config::PipelineConfig& config() const { return config_; }

private:
  // ---- PARAMETERS ----
  store::ContentStore& store_;
  const crypto::Checksum& checksum_;
  const crypto::Cipher& cipher_;
  config::PipelineConfig config_;
  sharding::Reconstructor reconstructor_;
  archive::ArchiveCodec codec_;
  std::mutex progress_mutex_;


  // ---- UPLOAD STEPS ----
  sharding::Manifest package(const Bytes& payload, const ProgressCallback& progress);
  void store_pieces(const std::vector<sharding::Piece>& pieces,
                    sharding::Manifest& manifest,
                    const ProgressCallback& progress);


  // ---- UTILITY METHODS ----
  void emit(const ProgressCallback& progress, Stage stage, int percent, const std::string& message,
            std::exception_ptr error = nullptr);
  void emit_error(const ProgressCallback& progress, std::exception_ptr error);
};

} // namespace pipeline
} // namespace shardpack
