#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

enum class MoveError {
  None,
  SourceVanished,
  PermissionDenied,
  DestinationUnwritable,
  UnexpectedIOError
};

const char* to_string(MoveError error);

struct MoveResult {
  bool success = false;
  MoveError error = MoveError::None;
  std::filesystem::path destination;  // final path of the moved file
  bool cross_device = false;
  std::string message;
};

// Moves one file into a destination directory without ever replacing an
// existing entry. The final name is reserved with an exclusive create
// right before the rename, so concurrent movers targeting the same
// directory each end up with a distinct file.
class CollisionSafeMover {
public:
  struct Options {
    bool dated_subfolders = false;          // <dest>/<YYYY>/<Mon>/
    std::size_t max_collision_attempts = 10000;
  };

  CollisionSafeMover();
  explicit CollisionSafeMover(Options options);

  MoveResult move(const std::filesystem::path& source,
                  const std::filesystem::path& destination_dir) const;

  // "report.pdf", 0 -> "report.pdf"; "report.pdf", 2 -> "report (2).pdf"
  static std::filesystem::path candidate_name(const std::filesystem::path& filename,
                                              std::size_t attempt);
  // Directory a file will land in, including the dated sub-folders.
  std::filesystem::path target_directory(const std::filesystem::path& destination_dir) const;

  // Rename fallback for EXDEV: copies into the already reserved path,
  // keeps mtime and permissions where possible, then removes the source.
  MoveResult copy_then_remove(const std::filesystem::path& source,
                              const std::filesystem::path& reserved) const;

  const Options& options() const { return options_; }

private:
  Options options_;
};
