#pragma once

#include <stdexcept>
#include <string>
#include "common/types.hpp"

namespace shardpack {
namespace store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

class NotFoundError : public StoreError {
public:
  explicit NotFoundError(const ContentId& id)
    : StoreError("Store: Object not found: " + id)
    , id_(id) {}

  const ContentId& id() const { return id_; }

private:
  ContentId id_;
};

// Key/value service addressed by content identifiers. put() must return the
// same identifier for identical bytes. Implementations must allow concurrent
// calls from several threads.
class ContentStore {
public:
  virtual ~ContentStore() = default;

  virtual ContentId put(const Bytes& data) = 0;
  // Throws NotFoundError if no object is stored under id
  virtual Bytes get(const ContentId& id) = 0;
  virtual bool has(const ContentId& id) const = 0;
};

} // namespace store
} // namespace shardpack
