#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

#include "notesd/store/note_store.hpp"

namespace notesd::store {

// Process-local, volatile note storage. Contents are lost when the process exits.
//
// Thread-safe: mutations hold the lock exclusively, reads share it, so no
// reader ever observes a half-applied change.
class MemoryStore : public NoteStore {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;
  using IdGenerator = std::function<core::NoteId()>;

  MemoryStore();
  explicit MemoryStore(Clock clock, IdGenerator id_generator = &core::NoteId::generate);
  ~MemoryStore() override = default;

  MemoryStore(const MemoryStore&) = delete;
  MemoryStore& operator=(const MemoryStore&) = delete;

  // NoteStore interface implementation
  Result<std::vector<core::Note>> list() override;
  Result<core::Note> create(const std::string& title, const std::string& content) override;
  Result<core::Note> get(const core::NoteId& id) override;
  Result<core::Note> update(const core::NoteId& id,
                            const std::optional<std::string>& title,
                            const std::optional<std::string>& content) override;
  Result<void> remove(const core::NoteId& id) override;
  Result<size_t> count() override;

  void setChangeCallback(ChangeCallback callback) override;

 private:
  Clock clock_;
  IdGenerator id_generator_;

  mutable std::shared_mutex mutex_;
  // Insertion sequence -> note; iteration order is insertion order
  std::map<uint64_t, core::Note> notes_;
  std::unordered_map<core::NoteId, uint64_t> index_;
  // Ids of deleted notes; never handed out again
  std::unordered_set<core::NoteId> retired_;
  uint64_t next_sequence_ = 0;

  std::mutex callback_mutex_;
  ChangeCallback change_callback_;

  static Error notFound(const core::NoteId& id);
  void notifyChange(const core::NoteId& id, const std::string& operation);
};

}  // namespace notesd::store
