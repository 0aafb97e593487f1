#include <escrow/common/critical.hpp>
#include <escrow/storage/pending_state.hpp>

#include <iterator>

namespace escrow::storage {

pending_state::pending_state(const storage_t& storage) : storage_{storage} {}

std::optional<escrow::schema::bytes_t> pending_state::get_raw(
    const escrow::schema::bytes_t& key) const {
  if (auto staged = writes_.find(key); staged != std::end(writes_)) {
    return staged->second;
  }
  return storage_.get_raw(escrow::schema::make_bytes_view(key));
}

void pending_state::put_raw(const escrow::schema::bytes_t& key,
                            escrow::schema::bytes_t value) {
  auto existing = writes_.find(key);
  if (depth_ > 0) {
    if (existing == std::end(writes_)) {
      journal_.emplace_back(key, std::nullopt);
    } else {
      journal_.emplace_back(key, existing->second);
    }
  }
  if (existing == std::end(writes_)) {
    writes_.emplace(key, std::move(value));
  } else {
    existing->second = std::move(value);
  }
}

std::size_t pending_state::begin() {
  ++depth_;
  return journal_.size();
}

void pending_state::release(const std::size_t marker) {
  if (depth_ == 0 || marker > journal_.size()) {
    escrow::common::critical("pending_state release without matching begin");
  }
  --depth_;
  if (depth_ == 0) {
    journal_.clear();
  }
}

void pending_state::rollback(const std::size_t marker) {
  if (depth_ == 0 || marker > journal_.size()) {
    escrow::common::critical("pending_state rollback without matching begin");
  }
  while (journal_.size() > marker) {
    auto& [key, previous] = journal_.back();
    if (previous.has_value()) {
      writes_[key] = std::move(*previous);
    } else {
      writes_.erase(key);
    }
    journal_.pop_back();
  }
  --depth_;
  if (depth_ == 0) {
    journal_.clear();
  }
}

std::vector<key_value_entry_t> pending_state::drain() {
  if (depth_ != 0) {
    escrow::common::critical("pending_state drained inside an open scope");
  }
  auto entries = std::vector<key_value_entry_t>{};
  entries.reserve(writes_.size());
  for (auto& [key, value] : writes_) {
    entries.emplace_back(key, std::move(value));
  }
  writes_.clear();
  return entries;
}

}  // namespace escrow::storage
