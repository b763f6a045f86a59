#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "directory_watcher.hpp"
#include "extension_resolver.hpp"
#include "file_mover.hpp"
#include "log.hpp"

// One detected file ready to be relocated. Never queued or retried.
struct PendingMove {
  std::filesystem::path source;
  std::string extension;
  Destination destination;
};

struct SortOutcome {
  enum class Kind { Moved, Skipped, Vanished, Failed };
  Kind kind = Kind::Skipped;
  std::filesystem::path tracked_directory;
  std::filesystem::path source;
  std::filesystem::path destination;
  MoveError error = MoveError::None;
  std::string message;
};

const char* to_string(SortOutcome::Kind kind);

using OutcomeCallback = std::function<void(const SortOutcome&)>;

// Turns change notifications for one tracked directory into
// resolve + move actions. Nothing thrown while handling a single file
// escapes handle(); failures become SortOutcome::Kind::Failed.
class SortEventHandler {
public:
  SortEventHandler(std::filesystem::path tracked_directory,
                   bool recursive,
                   std::shared_ptr<const ExtensionResolver> resolver,
                   std::shared_ptr<const CollisionSafeMover> mover,
                   std::shared_ptr<Logger> logger,
                   OutcomeCallback on_outcome = nullptr);

  // Filters by event type and location only; touches no files.
  bool is_relevant(const ChangeEvent& event) const;

  // nullopt when the event is irrelevant or the file is already gone.
  std::optional<PendingMove> plan(const ChangeEvent& event) const;

  // nullopt when the event was filtered out.
  std::optional<SortOutcome> handle(const ChangeEvent& event);

  // Sorts files already present in the tracked directory.
  std::size_t sweep();

  const std::filesystem::path& tracked_directory() const { return tracked_directory_; }

private:
  SortOutcome execute(const PendingMove& pending);
  SortOutcome report(SortOutcome outcome);
  bool already_sorted(const PendingMove& pending) const;

  std::filesystem::path tracked_directory_;
  bool recursive_ = false;
  std::shared_ptr<const ExtensionResolver> resolver_;
  std::shared_ptr<const CollisionSafeMover> mover_;
  std::shared_ptr<Logger> logger_;
  OutcomeCallback on_outcome_;
};
