#include "event_handler.hpp"

#include <system_error>
#include <utility>
#include <vector>

#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

bool same_directory(const fs::path& a, const fs::path& b) {
  std::error_code ec;
  if(fs::equivalent(a, b, ec)) return true;
  return a.lexically_normal() == b.lexically_normal();
}

} // namespace

const char* to_string(SortOutcome::Kind kind) {
  switch(kind) {
    case SortOutcome::Kind::Moved: return "moved";
    case SortOutcome::Kind::Skipped: return "skipped";
    case SortOutcome::Kind::Vanished: return "vanished";
    case SortOutcome::Kind::Failed: return "failed";
  }
  return "unknown";
}

SortEventHandler::SortEventHandler(fs::path tracked_directory,
                                   bool recursive,
                                   std::shared_ptr<const ExtensionResolver> resolver,
                                   std::shared_ptr<const CollisionSafeMover> mover,
                                   std::shared_ptr<Logger> logger,
                                   OutcomeCallback on_outcome)
  : tracked_directory_(normalized_directory(tracked_directory)),
    recursive_(recursive),
    resolver_(resolver ? std::move(resolver) : std::make_shared<ExtensionResolver>()),
    mover_(mover ? std::move(mover) : std::make_shared<CollisionSafeMover>()),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("sort")),
    on_outcome_(std::move(on_outcome)) {
  logger_->debug("Initialized handler for '{}' (recursive={}, {} mapped extension(s))",
                 tracked_directory_.string(), recursive_, resolver_->size());
}

bool SortEventHandler::is_relevant(const ChangeEvent& event) const {
  if(event.is_directory) return false;
  const fs::path path = event.path.lexically_normal();
  if(!path.has_filename()) return false;
  if(!recursive_) {
    return path.parent_path() == tracked_directory_;
  }
  auto relative = path.lexically_relative(tracked_directory_);
  if(relative.empty()) return false;
  auto first = relative.begin();
  return first != relative.end() && *first != "..";
}

std::optional<PendingMove> SortEventHandler::plan(const ChangeEvent& event) const {
  if(!is_relevant(event)) return std::nullopt;

  std::error_code ec;
  auto status = fs::symlink_status(event.path, ec);
  if(ec || !fs::is_regular_file(status)) return std::nullopt;

  PendingMove pending;
  pending.source = event.path;
  pending.destination = resolver_->resolve(event.path);
  pending.extension = pending.destination.extension;
  return pending;
}

bool SortEventHandler::already_sorted(const PendingMove& pending) const {
  const fs::path target = mover_->target_directory(pending.destination.directory);
  return same_directory(pending.source.parent_path(), target);
}

std::optional<SortOutcome> SortEventHandler::handle(const ChangeEvent& event) {
  if(!is_relevant(event)) {
    logger_->debug("Ignoring {} event for '{}'", to_string(event.kind), event.path.string());
    return std::nullopt;
  }

  SortOutcome outcome;
  outcome.tracked_directory = tracked_directory_;
  outcome.source = event.path;

  try {
    std::error_code ec;
    auto status = fs::symlink_status(event.path, ec);
    if(status.type() == fs::file_type::not_found) {
      // Earlier notification for the same file already moved it.
      outcome.kind = SortOutcome::Kind::Vanished;
      outcome.error = MoveError::SourceVanished;
      return report(std::move(outcome));
    }
    if(ec) {
      outcome.kind = SortOutcome::Kind::Failed;
      outcome.error = (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted)
                        ? MoveError::PermissionDenied : MoveError::UnexpectedIOError;
      outcome.message = "cannot inspect source: " + ec.message();
      return report(std::move(outcome));
    }
    if(!fs::is_regular_file(status)) {
      logger_->debug("Skipping non-regular entry '{}'", event.path.string());
      return std::nullopt;
    }

    auto pending = plan(event);
    if(!pending) {
      outcome.kind = SortOutcome::Kind::Vanished;
      outcome.error = MoveError::SourceVanished;
      return report(std::move(outcome));
    }
    return execute(*pending);
  } catch(const std::exception& e) {
    outcome.kind = SortOutcome::Kind::Failed;
    outcome.error = MoveError::UnexpectedIOError;
    outcome.message = e.what();
    return report(std::move(outcome));
  }
}

SortOutcome SortEventHandler::execute(const PendingMove& pending) {
  SortOutcome outcome;
  outcome.tracked_directory = tracked_directory_;
  outcome.source = pending.source;

  if(!pending.destination.is_move()) {
    outcome.kind = SortOutcome::Kind::Skipped;
    outcome.message = "no path defined for extension '" + pending.extension +
                      "' and no path for undefined extensions";
    return report(std::move(outcome));
  }

  outcome.destination = pending.destination.directory;
  if(already_sorted(pending)) {
    outcome.kind = SortOutcome::Kind::Skipped;
    outcome.message = "already in its destination";
    return report(std::move(outcome));
  }

  logger_->debug("Got '{}' as destination for '{}'{}", pending.destination.directory.string(),
                 pending.source.string(), pending.destination.from_fallback ? " (undefined extension)" : "");

  auto result = mover_->move(pending.source, pending.destination.directory);
  outcome.error = result.error;
  outcome.message = result.message;
  if(result.success) {
    outcome.kind = SortOutcome::Kind::Moved;
    outcome.destination = result.destination;
  } else if(result.error == MoveError::SourceVanished) {
    outcome.kind = SortOutcome::Kind::Vanished;
  } else {
    outcome.kind = SortOutcome::Kind::Failed;
  }
  if(result.cross_device) {
    logger_->debug("'{}' was copied across devices", pending.source.string());
  }
  return report(std::move(outcome));
}

SortOutcome SortEventHandler::report(SortOutcome outcome) {
  switch(outcome.kind) {
    case SortOutcome::Kind::Moved:
      logger_->moved("Moved '{}' to '{}'", outcome.source.string(), outcome.destination.string());
      break;
    case SortOutcome::Kind::Skipped:
      logger_->warn("Skipping '{}': {}", outcome.source.string(), outcome.message);
      break;
    case SortOutcome::Kind::Vanished:
      logger_->debug("'{}' is gone, nothing to move", outcome.source.string());
      break;
    case SortOutcome::Kind::Failed:
      logger_->error("Failed to move '{}' ({}): {}", outcome.source.string(),
                     to_string(outcome.error), outcome.message);
      break;
  }

  if(on_outcome_) {
    try {
      on_outcome_(outcome);
    } catch(const std::exception& e) {
      logger_->error("Outcome callback failed for '{}': {}", outcome.source.string(), e.what());
    }
  }
  return outcome;
}

std::size_t SortEventHandler::sweep() {
  std::vector<fs::path> files;
  std::error_code ec;
  auto collect = [&](const fs::directory_entry& entry){
    std::error_code type_ec;
    if(entry.is_regular_file(type_ec) && !entry.is_symlink(type_ec)) {
      files.push_back(entry.path());
    }
  };
  if(recursive_) {
    for(fs::recursive_directory_iterator it(tracked_directory_, fs::directory_options::skip_permission_denied, ec), end;
        !ec && it != end; it.increment(ec)) {
      collect(*it);
    }
  } else {
    for(fs::directory_iterator it(tracked_directory_, ec), end; !ec && it != end; it.increment(ec)) {
      collect(*it);
    }
  }
  if(ec) {
    logger_->error("Unable to enumerate '{}': {}", tracked_directory_.string(), ec.message());
  }

  std::size_t moved = 0;
  for(const auto& file : files) {
    auto outcome = handle(ChangeEvent{file, ChangeEvent::Kind::Created, false});
    if(outcome && outcome->kind == SortOutcome::Kind::Moved) ++moved;
  }
  logger_->info("Initial sweep of '{}' moved {} file(s)", tracked_directory_.string(), moved);
  return moved;
}
