#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "store/content_store.hpp"
#include "crypto/checksum.hpp"

namespace shardpack {
namespace store {

// Content store backed by a local directory. Identifiers are the hex SHA-256
// of the stored bytes.
class FileStore : public ContentStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FileStore(const std::string& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  // Stores bytes and returns their content identifier. Storing existing
  // content is a no-op.
  ContentId put(const Bytes& data) override;
  // Retrieves the bytes stored under id
  Bytes get(const ContentId& id) override;
  // Removes the object stored under id
  void remove(const ContentId& id);
  // Removes all stored data and reset store
  void clear();


  // ---- QUERY OPERATIONS ----
  bool has(const ContentId& id) const override;
  // Returns the size of the stored object in bytes
  std::uintmax_t get_object_size(const ContentId& id) const;
  // Lists every identifier currently stored
  std::vector<ContentId> list() const;
  // Identifier the store would assign to data
  ContentId content_id_for(const Bytes& data) const;
  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;
  crypto::Checksum checksum_;


  // ---- CAS STORAGE SUPPORT ----
  // {base_path}/{id[0:2]}/{id[2:4]}/{id[4:6]}/{remaining_id}
  std::filesystem::path get_path_for_id(const ContentId& id) const;
  // Throws StoreError unless id is a 64 character lowercase hex string
  void validate_id(const ContentId& id) const;


  // ---- UTILITY METHODS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Unique sibling path used to write an object before renaming it into place
  std::filesystem::path make_temp_path(const std::filesystem::path& final_path) const;
};

} // namespace store
} // namespace shardpack
