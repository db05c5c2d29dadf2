#include "pipeline/packaging_pipeline.hpp"
#include <algorithm>
#include <atomic>
#include <limits>
#include <boost/log/trivial.hpp>
#include "sharding/chunker.hpp"
#include "sharding/replicator.hpp"
#include "utils/parallel.hpp"

namespace shardpack {
namespace pipeline {

namespace {

// Room for the metadata record and length prefixes on top of the payloads
constexpr uint64_t ARCHIVE_FRAMING_ALLOWANCE = 1024 * 1024;

uint64_t decoded_archive_limit(uint64_t max_size) {
  if (max_size > std::numeric_limits<uint64_t>::max() - ARCHIVE_FRAMING_ALLOWANCE) {
    return std::numeric_limits<uint64_t>::max();
  }
  return max_size + ARCHIVE_FRAMING_ALLOWANCE;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

PackagingPipeline::PackagingPipeline(store::ContentStore& store,
                                     const crypto::Checksum& checksum,
                                     const crypto::Cipher& cipher,
                                     config::PipelineConfig config)
  : store_(store)
  , checksum_(checksum)
  , cipher_(cipher)
  , config_(std::move(config))
  , reconstructor_(store, checksum, config_.concurrency.max_parallel_operations)
  , codec_(checksum, decoded_archive_limit(config_.archive.max_size)) {
  config_.validate();
  BOOST_LOG_TRIVIAL(info) << "Pipeline: Initialized (piece size " << config_.sharding.piece_size
                          << ", max pieces " << config_.sharding.max_pieces
                          << ", replication " << config_.sharding.replication_factor
                          << ", encryption " << (config_.encryption.enabled ? "on" : "off") << ")";
}


//==============================================
// UPLOAD/DOWNLOAD
//==============================================

UploadResult PackagingPipeline::upload(const Bytes& data,
                                       const std::string& name,
                                       const ProgressCallback& progress,
                                       const std::string& mime_type) {
  BOOST_LOG_TRIVIAL(info) << "Pipeline: Uploading '" << name << "' (" << data.size() << " bytes)";

  try {
    emit(progress, Stage::Preparing, 0, "Preparing " + name);

    UploadResult result;
    std::optional<sharding::ManifestEncryption> encryption;
    Bytes ciphertext;

    if (config_.encryption.enabled) {
      emit(progress, Stage::Encrypting, 10, "Encrypting " + std::to_string(data.size()) + " bytes");

      std::optional<std::string> key;
      if (!config_.encryption.key_hex.empty()) {
        key = config_.encryption.key_hex;
      }

      auto envelope = cipher_.encrypt(data, key, config_.encryption.algorithm, config_.encryption.key_bits);
      encryption = sharding::ManifestEncryption{envelope.algorithm, crypto::to_hex(envelope.iv)};
      if (!envelope.key_material.empty()) {
        result.key_material = std::move(envelope.key_material);
      }
      ciphertext = std::move(envelope.ciphertext);
    }

    const Bytes& payload = encryption ? ciphertext : data;
    result.manifest = package(payload, progress);
    result.manifest.encryption = encryption;

    emit(progress, Stage::StoringManifest, 90, "Storing manifest");
    result.manifest_id = store_.put(sharding::serialize_manifest(result.manifest));

    auto& record = result.record;
    record.id = result.manifest_id;
    record.name = name;
    record.size = data.size();
    record.mime_type = mime_type;
    record.created_at = result.manifest.created_at;
    record.encrypted = result.manifest.is_encrypted();
    record.sharded = result.manifest.piece_count > 1;
    record.piece_count = result.manifest.piece_count;
    record.verified = true;
    record.stored_id = result.manifest_id;

    emit(progress, Stage::Done, 100, "Stored manifest " + result.manifest_id);
    BOOST_LOG_TRIVIAL(info) << "Pipeline: Uploaded '" << name << "' as " << result.manifest_id << " ("
                            << result.manifest.piece_count << " pieces x " << result.manifest.replication_factor << ")";
    return result;
  } catch (...) {
    emit_error(progress, std::current_exception());
    throw;
  }
}

sharding::Manifest PackagingPipeline::package(const Bytes& payload, const ProgressCallback& progress) {
  const auto& sharding_config = config_.sharding;

  if (payload.empty()) {
    BOOST_LOG_TRIVIAL(debug) << "Pipeline: Empty object, no pieces to store";
    return sharding::build_manifest(checksum_, payload, sharding_config.piece_size, {}, 1);
  }

  // Small objects, or sharding disabled, are stored directly as one piece
  if (!sharding_config.enabled || payload.size() <= sharding_config.piece_size) {
    const uint64_t piece_size = std::max<uint64_t>(sharding_config.piece_size, payload.size());
    auto pieces = sharding::Replicator::replicate({payload}, 1);
    auto manifest = sharding::build_manifest(checksum_, payload, piece_size, pieces, 1);
    store_pieces(pieces, manifest, progress);
    return manifest;
  }

  emit(progress, Stage::Chunking, 20, "Splitting " + std::to_string(payload.size()) + " bytes");
  auto chunks = sharding::Chunker::split(payload, sharding_config.piece_size, sharding_config.max_pieces);

  emit(progress, Stage::Replicating, 30,
       "Replicating " + std::to_string(chunks.size()) + " pieces x" + std::to_string(sharding_config.replication_factor));
  auto pieces = sharding::Replicator::replicate(std::move(chunks), sharding_config.replication_factor);

  auto manifest = sharding::build_manifest(checksum_, payload, sharding_config.piece_size,
                                           pieces, sharding_config.replication_factor);
  store_pieces(pieces, manifest, progress);
  return manifest;
}

void PackagingPipeline::store_pieces(const std::vector<sharding::Piece>& pieces,
                                     sharding::Manifest& manifest,
                                     const ProgressCallback& progress) {
  emit(progress, Stage::StoringPieces, 40, "Storing " + std::to_string(pieces.size()) + " pieces");

  std::atomic<size_t> stored{0};
  utils::run_indexed(pieces.size(), config_.concurrency.max_parallel_operations, [&](std::size_t k) {
    const auto& piece = pieces[k];
    manifest.pieces[k].content_id = store_.put(*piece.data);
    BOOST_LOG_TRIVIAL(trace) << "Pipeline: Stored piece " << piece.index << " as " << *manifest.pieces[k].content_id;

    const size_t done = ++stored;
    emit(progress, Stage::StoringPieces, 40 + static_cast<int>(done * 50 / pieces.size()),
         "Stored piece " + std::to_string(done) + " of " + std::to_string(pieces.size()));
  });
}

Bytes PackagingPipeline::download(const ContentId& manifest_id,
                                  const std::optional<std::string>& key,
                                  const ProgressCallback& progress) {
  BOOST_LOG_TRIVIAL(info) << "Pipeline: Downloading " << manifest_id;

  try {
    emit(progress, Stage::FetchingManifest, 0, "Fetching manifest " + manifest_id);
    sharding::Manifest manifest = fetch_manifest(manifest_id);

    emit(progress, Stage::Reconstructing, 30, "Reconstructing " + std::to_string(manifest.piece_count) + " pieces");
    Bytes data = reconstructor_.reconstruct(manifest);

    if (manifest.encryption) {
      std::string key_hex = key ? *key : config_.encryption.key_hex;
      if (key_hex.empty()) {
        BOOST_LOG_TRIVIAL(error) << "Pipeline: No key supplied for encrypted object " << manifest_id;
        throw crypto::DecryptionError("Key required for encrypted object");
      }

      emit(progress, Stage::Decrypting, 80, "Decrypting " + std::to_string(data.size()) + " bytes");
      crypto::EncryptionEnvelope envelope;
      envelope.iv = crypto::from_hex(manifest.encryption->iv);
      envelope.algorithm = manifest.encryption->algorithm;
      envelope.ciphertext = std::move(data);
      data = cipher_.decrypt(envelope, key_hex);
    }

    emit(progress, Stage::Done, 100, "Recovered " + std::to_string(data.size()) + " bytes");
    BOOST_LOG_TRIVIAL(info) << "Pipeline: Downloaded " << manifest_id << " (" << data.size() << " bytes)";
    return data;
  } catch (...) {
    emit_error(progress, std::current_exception());
    throw;
  }
}

sharding::VerificationReport PackagingPipeline::verify(const ContentId& manifest_id) {
  BOOST_LOG_TRIVIAL(info) << "Pipeline: Verifying " << manifest_id;
  return reconstructor_.verify(fetch_manifest(manifest_id));
}

sharding::Manifest PackagingPipeline::fetch_manifest(const ContentId& manifest_id) {
  Bytes bytes = store_.get(manifest_id);
  BOOST_LOG_TRIVIAL(debug) << "Pipeline: Fetched manifest " << manifest_id << " (" << bytes.size() << " bytes)";
  return sharding::parse_manifest(bytes);
}


//==============================================
// EXPORT/IMPORT
//==============================================

Bytes PackagingPipeline::export_archive(const std::vector<ContentId>& root_ids, const ProgressCallback& progress) {
  return export_archive(root_ids, config_.archive, progress);
}

Bytes PackagingPipeline::export_archive(const std::vector<ContentId>& root_ids,
                                        const config::ArchiveConfig& options,
                                        const ProgressCallback& progress) {
  BOOST_LOG_TRIVIAL(info) << "Pipeline: Exporting " << root_ids.size() << " objects";

  try {
    if (root_ids.empty()) {
      throw archive::ArchiveError("Pipeline: No objects to export");
    }

    std::vector<Bytes> payloads;
    payloads.reserve(root_ids.size());
    uint64_t total_size = 0;

    for (size_t i = 0; i < root_ids.size(); ++i) {
      const auto& id = root_ids[i];
      emit(progress, Stage::Exporting, static_cast<int>(i * 90 / root_ids.size()), "Collecting " + id);

      Bytes payload = store_.get(id);
      if (options.resolve_manifests) {
        auto manifest = sharding::try_parse_manifest(payload);
        if (manifest && manifest->is_encrypted()) {
          // Ciphertext is useless without the IV kept in the manifest
          BOOST_LOG_TRIVIAL(debug) << "Pipeline: Exporting encrypted manifest " << id << " unresolved";
        } else if (manifest) {
          BOOST_LOG_TRIVIAL(debug) << "Pipeline: Resolving manifest " << id;
          payload = reconstructor_.reconstruct(*manifest);
        }
      }

      total_size += payload.size();
      if (total_size > options.max_size) {
        BOOST_LOG_TRIVIAL(error) << "Pipeline: Export exceeds maximum size of " << options.max_size << " bytes";
        throw archive::ArchiveError("Pipeline: Export exceeds maximum size of " +
                                    std::to_string(options.max_size) + " bytes");
      }
      payloads.push_back(std::move(payload));
    }

    archive::Archive bundle;
    bundle.metadata = codec_.make_metadata(root_ids, payloads);
    bundle.payloads = std::move(payloads);
    Bytes encoded = codec_.encode(bundle, options.compress);

    emit(progress, Stage::Done, 100, "Exported " + std::to_string(root_ids.size()) + " objects");
    return encoded;
  } catch (...) {
    emit_error(progress, std::current_exception());
    throw;
  }
}

ImportResult PackagingPipeline::import_archive(const Bytes& data,
                                               const std::vector<ObjectRecord>& existing,
                                               const ProgressCallback& progress) {
  BOOST_LOG_TRIVIAL(info) << "Pipeline: Importing archive of " << data.size() << " bytes";

  try {
    emit(progress, Stage::Importing, 0, "Decoding archive");
    archive::Archive bundle = codec_.decode(data);

    ImportResult result;
    result.metadata = bundle.metadata;
    if (bundle.payloads.empty()) {
      result.warnings.push_back("Archive contains no items");
    }

    std::vector<ObjectRecord> known = existing;
    for (size_t i = 0; i < bundle.payloads.size(); ++i) {
      const auto& id = bundle.metadata.root_ids[i];
      const auto& payload = bundle.payloads[i];
      emit(progress, Stage::Importing, static_cast<int>(i * 90 / bundle.payloads.size()), "Importing " + id);

      auto match = std::find_if(known.begin(), known.end(), [&id](const ObjectRecord& record) {
        return record.id == id || record.source_id == id;
      });
      if (match != known.end()) {
        BOOST_LOG_TRIVIAL(warning) << "Pipeline: Duplicate item skipped: " << match->name;
        result.warnings.push_back("Duplicate item skipped: " + match->name);
        result.items.push_back(ImportedItem{*match, true});
        continue;
      }

      ObjectRecord record;
      record.source_id = id;
      record.name = "imported-" + id.substr(0, 8);
      record.created_at = current_time_millis();
      record.imported = true;

      if (auto manifest = sharding::try_parse_manifest(payload)) {
        record.stored_id = store_.put(payload);
        record.verified = record.stored_id == id;
        record.size = manifest->original_size;
        record.sharded = manifest->piece_count > 1;
        record.encrypted = manifest->is_encrypted();
        record.piece_count = manifest->piece_count;
      } else {
        // Object bytes are packaged under a manifest of their own
        BOOST_LOG_TRIVIAL(debug) << "Pipeline: Packaging imported payload " << id << " (" << payload.size() << " bytes)";
        sharding::Manifest imported = package(payload, nullptr);
        record.stored_id = store_.put(sharding::serialize_manifest(imported));
        record.verified = checksum_.digest(payload) == id;
        record.size = payload.size();
        record.sharded = imported.piece_count > 1;
        record.piece_count = imported.piece_count;
      }
      record.id = record.stored_id;

      if (!record.verified) {
        BOOST_LOG_TRIVIAL(warning) << "Pipeline: Payload for " << id << " stored as " << record.stored_id;
        result.warnings.push_back("Payload for " + id + " stored as " + record.stored_id);
      }

      known.push_back(record);
      result.items.push_back(ImportedItem{std::move(record), false});
    }

    emit(progress, Stage::Done, 100, "Imported " + std::to_string(result.items.size()) + " items");
    BOOST_LOG_TRIVIAL(info) << "Pipeline: Imported " << result.items.size() << " items with "
                            << result.warnings.size() << " warnings";
    return result;
  } catch (...) {
    emit_error(progress, std::current_exception());
    throw;
  }
}


//==============================================
// UTILITY METHODS
//==============================================

void PackagingPipeline::emit(const ProgressCallback& progress, Stage stage, int percent,
                             const std::string& message, std::exception_ptr error) {
  BOOST_LOG_TRIVIAL(debug) << "Pipeline: [" << to_string(stage) << " " << percent << "%] " << message;
  if (!progress) {
    return;
  }

  std::lock_guard<std::mutex> lock(progress_mutex_);
  try {
    progress(ProgressEvent{stage, percent, message, error});
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Pipeline: Progress callback threw: " << e.what();
  } catch (...) {
    BOOST_LOG_TRIVIAL(warning) << "Pipeline: Progress callback threw a non-standard exception";
  }
}

void PackagingPipeline::emit_error(const ProgressCallback& progress, std::exception_ptr error) {
  std::string message = "unknown error";
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    message = e.what();
  } catch (...) {
    // The original exception is rethrown by the caller
  }
  BOOST_LOG_TRIVIAL(error) << "Pipeline: " << message;
  emit(progress, Stage::Error, 100, message, error);
}

} // namespace pipeline
} // namespace shardpack
