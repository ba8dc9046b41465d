#include "notesd/store/memory_store.hpp"

#include <algorithm>

#include "notesd/util/time.hpp"

namespace notesd::store {

MemoryStore::MemoryStore() : MemoryStore(&util::Time::now) {}

MemoryStore::MemoryStore(Clock clock, IdGenerator id_generator)
    : clock_(std::move(clock)), id_generator_(std::move(id_generator)) {}

Result<std::vector<core::Note>> MemoryStore::list() {
  std::vector<core::Note> notes;
  {
    std::shared_lock lock(mutex_);
    notes.reserve(notes_.size());
    for (const auto& [sequence, note] : notes_) {
      notes.push_back(note);
    }
  }

  // notes_ is in insertion order, so a stable sort keeps it for equal timestamps
  std::stable_sort(notes.begin(), notes.end(), [](const core::Note& a, const core::Note& b) {
    return a.created() < b.created();
  });

  return notes;
}

Result<core::Note> MemoryStore::create(const std::string& title, const std::string& content) {
  std::optional<core::Note> created;
  {
    std::unique_lock lock(mutex_);

    // Ids are never reused, whether the earlier holder is live or deleted
    auto id = id_generator_();
    while (index_.contains(id) || retired_.contains(id)) {
      id = id_generator_();
    }

    auto now = clock_();
    auto sequence = next_sequence_++;
    index_.emplace(id, sequence);
    created = notes_.emplace(sequence, core::Note(id, title, content, now, now)).first->second;
  }

  notifyChange(created->id(), "create");
  return *created;
}

Result<core::Note> MemoryStore::get(const core::NoteId& id) {
  std::shared_lock lock(mutex_);

  auto it = index_.find(id);
  if (it == index_.end()) {
    return std::unexpected(notFound(id));
  }

  return notes_.at(it->second);
}

Result<core::Note> MemoryStore::update(const core::NoteId& id,
                                       const std::optional<std::string>& title,
                                       const std::optional<std::string>& content) {
  std::optional<core::Note> updated;
  {
    std::unique_lock lock(mutex_);

    auto it = index_.find(id);
    if (it == index_.end()) {
      return std::unexpected(notFound(id));
    }

    if (!title.has_value() && !content.has_value()) {
      return std::unexpected(makeError(ErrorCode::kValidationError,
                                       "At least one of 'title' or 'content' must be provided"));
    }

    // Build the replacement first, then swap it in as a whole
    auto& stored = notes_.at(it->second);
    auto replacement = stored.withChanges(title, content, clock_());
    stored = replacement;
    updated = std::move(replacement);
  }

  notifyChange(id, "update");
  return *updated;
}

Result<void> MemoryStore::remove(const core::NoteId& id) {
  {
    std::unique_lock lock(mutex_);

    auto it = index_.find(id);
    if (it == index_.end()) {
      return std::unexpected(notFound(id));
    }

    notes_.erase(it->second);
    index_.erase(it);
    retired_.insert(id);
  }

  notifyChange(id, "delete");
  return {};
}

Result<size_t> MemoryStore::count() {
  std::shared_lock lock(mutex_);
  return index_.size();
}

void MemoryStore::setChangeCallback(ChangeCallback callback) {
  std::lock_guard lock(callback_mutex_);
  change_callback_ = std::move(callback);
}

Error MemoryStore::notFound(const core::NoteId& id) {
  return makeError(ErrorCode::kNotFound, "Note with id " + id.toString() + " not found");
}

void MemoryStore::notifyChange(const core::NoteId& id, const std::string& operation) {
  ChangeCallback callback;
  {
    std::lock_guard lock(callback_mutex_);
    callback = change_callback_;
  }
  if (callback) {
    callback(id, operation);
  }
}

}  // namespace notesd::store
