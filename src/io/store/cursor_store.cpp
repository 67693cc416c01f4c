#include "cursor_store.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <filesystem>
#include <utility>

nlohmann::json cursor_to_json(const CursorState &state) {
  nlohmann::json j;
  j["bucket"] = state.bucket;
  if (state.last) {
    j["last_timestamp_ms"] = state.last->timestamp_ms;
    j["last_id"] = state.last->id;
    if (!state.last->stored.is_null())
      j["last_sort_values"] = state.last->stored;
  } else {
    j["last_timestamp_ms"] = nullptr;
    j["last_id"] = nullptr;
  }
  return j;
}

CursorState cursor_from_json(const nlohmann::json &j) {
  CursorState state;
  state.bucket = j.at("bucket").get<std::string>();
  const auto &last_id = j.at("last_id");
  if (!last_id.is_null()) {
    RecordKey key;
    key.id = last_id.get<std::string>();
    key.timestamp_ms = j.at("last_timestamp_ms").get<uint64_t>();
    // Cursors written before the sort values were kept resume by date.
    auto stored = j.find("last_sort_values");
    if (stored != j.end() && stored->is_object())
      key.stored = *stored;
    state.last = key;
  }
  return state;
}

FileCursorStore::FileCursorStore(std::string path) : path_(std::move(path)) {}

std::optional<CursorState> FileCursorStore::load() {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    LOG(LogLevel::INFO, LogComponent::STATE_PERSIST,
        "No cursor state at " << path_ << ". Starting from the lookback window.");
    return std::nullopt;
  }

  auto content = Utils::read_file(path_);
  if (!content)
    throw WafError("Cursor state " + path_ + " exists but cannot be read");

  try {
    CursorState state = cursor_from_json(nlohmann::json::parse(*content));
    LOG(LogLevel::INFO, LogComponent::STATE_PERSIST,
        "Resuming from bucket " << state.bucket << " after "
                                << (state.last ? state.last->id : "<start>"));
    return state;
  } catch (const nlohmann::json::exception &e) {
    throw WafError("Cursor state " + path_ + " is corrupt: " + e.what());
  }
}

void FileCursorStore::save(const CursorState &state) {
  if (!Utils::write_file_atomically(path_, cursor_to_json(state).dump()))
    throw StoreWriteError("Could not persist cursor state to " + path_);
  LOG(LogLevel::TRACE, LogComponent::STATE_PERSIST,
      "Cursor persisted at bucket " << state.bucket);
}
