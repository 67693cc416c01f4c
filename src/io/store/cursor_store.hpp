#ifndef CURSOR_STORE_HPP
#define CURSOR_STORE_HPP

#include "store_interfaces.hpp"

#include <nlohmann/json.hpp>
#include <string>

// CursorState as a small JSON file, replaced atomically on every save.
class FileCursorStore : public ICursorStore {
public:
  explicit FileCursorStore(std::string path);

  // nullopt when no file exists yet. A file that exists but cannot be read
  // back throws WafError rather than silently restarting from scratch.
  std::optional<CursorState> load() override;
  void save(const CursorState &state) override;

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

nlohmann::json cursor_to_json(const CursorState &state);
CursorState cursor_from_json(const nlohmann::json &j);

#endif // CURSOR_STORE_HPP
