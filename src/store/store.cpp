#include "store/store.hpp"
#include <algorithm>
#include <atomic>
#include <fstream>
#include <functional>
#include <sstream>
#include <thread>
#include <boost/log/trivial.hpp>

namespace shardpack {
namespace store {

namespace {

constexpr size_t ID_LENGTH = crypto::Checksum::DIGEST_SIZE * 2;
constexpr const char* TEMP_MARKER = ".tmp.";

std::atomic<uint64_t> temp_counter{0};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
FileStore::FileStore(const std::string& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing FileStore with base path: " << base_path;
  check_directory_exists(base_path_);
  BOOST_LOG_TRIVIAL(debug) << "Store: Store directory created/verified at: " << base_path;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

ContentId FileStore::put(const Bytes& data) {
  ContentId id = content_id_for(data);
  BOOST_LOG_TRIVIAL(debug) << "Store: Storing " << data.size() << " bytes as: " << id;

  std::filesystem::path file_path = get_path_for_id(id);
  if (std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Content already present: " << id;
    return id;
  }

  check_directory_exists(file_path.parent_path());

  // Write to a unique temporary file, then rename into place so concurrent
  // readers never observe a partially written object
  std::filesystem::path temp_path = make_temp_path(file_path);
  {
    std::ofstream file(temp_path, std::ios::binary);
    if (!file) {
      throw StoreError("Store: Failed to create file: " + temp_path.string());
    }
    if (!data.empty()) {
      file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }
    if (!file) {
      BOOST_LOG_TRIVIAL(error) << "Store: Failed to write " << data.size() << " bytes to: " << temp_path.string();
      std::error_code ignored;
      std::filesystem::remove(temp_path, ignored);
      throw StoreError("Store: Failed to write file: " + temp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, file_path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to move object into place: " << ec.message();
    throw StoreError("Store: Failed to store object " + id + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Successfully stored " << data.size() << " bytes as: " << id;
  return id;
}

Bytes FileStore::get(const ContentId& id) {
  BOOST_LOG_TRIVIAL(debug) << "Store: Retrieving object: " << id;
  validate_id(id);

  std::filesystem::path file_path = get_path_for_id(id);
  std::error_code ec;
  auto size = std::filesystem::file_size(file_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Object not found: " << id;
    throw NotFoundError(id);
  }

  Bytes data(static_cast<size_t>(size));
  if (size == 0) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Retrieved empty object: " << id;
    return data;
  }

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw StoreError("Store: Failed to open file: " + file_path.string());
  }

  if (!file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()))) {
    BOOST_LOG_TRIVIAL(error) << "Store: Short read for object: " << id;
    throw StoreError("Store: Failed to read object: " + id);
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Read " << data.size() << " bytes for: " << id;
  return data;
}

void FileStore::remove(const ContentId& id) {
  BOOST_LOG_TRIVIAL(info) << "Store: Removing object: " << id;
  validate_id(id);

  std::filesystem::path file_path = get_path_for_id(id);
  if (!std::filesystem::remove(file_path)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to remove object: " << id;
    throw NotFoundError(id);
  }

  // Clean up empty parent directories up to base_path_
  auto current = file_path.parent_path();
  while (current != base_path_ && std::filesystem::is_empty(current)) {
    std::filesystem::remove(current);
    current = current.parent_path();
  }
}

void FileStore::clear() {
  BOOST_LOG_TRIVIAL(info) << "Store: Clearing entire store at: " << base_path_;
  std::filesystem::remove_all(base_path_);
  check_directory_exists(base_path_);
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool FileStore::has(const ContentId& id) const {
  if (id.size() != ID_LENGTH) {
    return false;
  }
  bool exists = std::filesystem::exists(get_path_for_id(id));
  BOOST_LOG_TRIVIAL(trace) << "Store: Object " << id << (exists ? " exists" : " not found");
  return exists;
}

std::uintmax_t FileStore::get_object_size(const ContentId& id) const {
  validate_id(id);
  std::error_code ec;
  auto size = std::filesystem::file_size(get_path_for_id(id), ec);
  if (ec) {
    throw NotFoundError(id);
  }
  return size;
}

std::vector<ContentId> FileStore::list() const {
  std::vector<ContentId> ids;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(base_path_)) {
    if (!entry.is_regular_file()) {
      continue;
    }

    // Skip in-flight temporary files
    auto relative = std::filesystem::relative(entry.path(), base_path_);
    if (relative.filename().string().find(TEMP_MARKER) != std::string::npos) {
      continue;
    }

    std::string id;
    for (const auto& part : relative) {
      id += part.string();
    }
    if (id.size() == ID_LENGTH) {
      ids.push_back(id);
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

ContentId FileStore::content_id_for(const Bytes& data) const {
  return checksum_.digest(data);
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::filesystem::path FileStore::get_path_for_id(const ContentId& id) const {
  std::filesystem::path path = base_path_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= id.substr(i, 2);
  }

  path /= id.substr(6);
  return path;
}

void FileStore::validate_id(const ContentId& id) const {
  bool valid = id.size() == ID_LENGTH &&
    std::all_of(id.begin(), id.end(), [](char c) {
      return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
  if (!valid) {
    BOOST_LOG_TRIVIAL(error) << "Store: Invalid content id: " << id;
    throw StoreError("Store: Invalid content id: " + id);
  }
}


//==============================================
// UTILITY METHODS
//==============================================

void FileStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

std::filesystem::path FileStore::make_temp_path(const std::filesystem::path& final_path) const {
  std::stringstream suffix;
  suffix << TEMP_MARKER << std::hash<std::thread::id>{}(std::this_thread::get_id())
         << "." << temp_counter.fetch_add(1);
  return final_path.string() + suffix.str();
}

} // namespace store
} // namespace shardpack
