#ifndef SHARDPACK_TEST_UTILS_HPP
#define SHARDPACK_TEST_UTILS_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <gmock/gmock.h>
#include "common/types.hpp"
#include "crypto/checksum.hpp"
#include "logger/logger.hpp"
#include "store/content_store.hpp"

namespace shardpack::test {

// Console output for test runs, warnings and above
inline void init_logging(logging::severity_level level = logging::severity_level::warning) {
  logging::init_console_logging(level);
}

inline Bytes make_bytes(const std::string& text) {
  return Bytes(text.begin(), text.end());
}

// Deterministic pseudo-random content
inline Bytes random_bytes(size_t size, uint32_t seed = 42) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<int> dis(0, 255);
  Bytes data(size);
  for (auto& byte : data) {
    byte = static_cast<uint8_t>(dis(gen));
  }
  return data;
}

inline std::filesystem::path unique_temp_dir(const std::string& prefix) {
  return std::filesystem::temp_directory_path() /
    (prefix + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
}

// What a single get() should do instead of returning the stored bytes
enum class Fault {
  Corrupt,     // return the bytes with the first one flipped
  Missing      // throw store::NotFoundError
};

// Thread-safe in-memory content store with SHA-256 ids. Faults queued for an
// id are consumed one per get(), so replicas sharing an id can be made to
// fail only on their first fetch.
class MemoryStore : public store::ContentStore {
public:
  ContentId put(const Bytes& data) override {
    ContentId id = checksum_.digest(data);
    std::lock_guard<std::mutex> lock(mutex_);
    ++puts_;
    objects_[id] = data;
    return id;
  }

  Bytes get(const ContentId& id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++gets_;
    auto it = objects_.find(id);
    if (it == objects_.end()) {
      throw store::NotFoundError(id);
    }

    auto& faults = faults_[id];
    if (!faults.empty()) {
      Fault fault = faults.front();
      faults.pop_front();
      if (fault == Fault::Missing) {
        throw store::NotFoundError(id);
      }
      Bytes damaged = it->second;
      if (damaged.empty()) {
        damaged.push_back(0);
      } else {
        damaged[0] ^= 0xFF;
      }
      return damaged;
    }
    return it->second;
  }

  bool has(const ContentId& id) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.count(id) > 0;
  }

  // ---- FAULT INJECTION ----
  void inject_fault(const ContentId& id, Fault fault, size_t times = 1) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < times; ++i) {
      faults_[id].push_back(fault);
    }
  }

  // Permanently flips one byte of the stored object
  void tamper(const ContentId& id, size_t offset = 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& data = objects_.at(id);
    data[offset % data.size()] ^= 0x01;
  }

  void erase(const ContentId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    objects_.erase(id);
  }

  // Stores bytes under an arbitrary id
  void put_raw(const ContentId& id, const Bytes& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    objects_[id] = data;
  }

  size_t put_count() const { return puts_.load(); }
  size_t get_count() const { return gets_.load(); }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.size();
  }

private:
  crypto::Checksum checksum_;
  mutable std::mutex mutex_;
  std::map<ContentId, Bytes> objects_;
  std::map<ContentId, std::deque<Fault>> faults_;
  std::atomic<size_t> puts_{0};
  std::atomic<size_t> gets_{0};
};

class MockContentStore : public store::ContentStore {
public:
  MOCK_METHOD(ContentId, put, (const Bytes& data), (override));
  MOCK_METHOD(Bytes, get, (const ContentId& id), (override));
  MOCK_METHOD(bool, has, (const ContentId& id), (const, override));
};

} // namespace shardpack::test

#endif // SHARDPACK_TEST_UTILS_HPP
