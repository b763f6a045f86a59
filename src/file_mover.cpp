#include "file_mover.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <ctime>
#include <system_error>

namespace fs = std::filesystem;

namespace {

bool is_permission_error(const std::error_code& ec) {
  return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted;
}

MoveError classify_destination_error(const std::error_code& ec) {
  if(is_permission_error(ec)) return MoveError::PermissionDenied;
  if(ec == std::errc::read_only_file_system ||
     ec == std::errc::not_a_directory ||
     ec == std::errc::file_exists ||
     ec == std::errc::is_a_directory ||
     ec == std::errc::filename_too_long) {
    return MoveError::DestinationUnwritable;
  }
  return MoveError::UnexpectedIOError;
}

MoveError classify_rename_error(const std::error_code& ec) {
  if(ec == std::errc::no_such_file_or_directory) return MoveError::SourceVanished;
  if(is_permission_error(ec) || ec == std::errc::device_or_resource_busy) {
    return MoveError::PermissionDenied;
  }
  if(ec == std::errc::read_only_file_system) return MoveError::DestinationUnwritable;
  return MoveError::UnexpectedIOError;
}

MoveResult failure(MoveError error, std::string message) {
  MoveResult result;
  result.error = error;
  result.message = std::move(message);
  return result;
}

std::string dated_component(const char* format) {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  char buffer[32];
  auto written = std::strftime(buffer, sizeof(buffer), format, &local);
  return std::string(buffer, written);
}

void discard(const fs::path& reserved) {
  std::error_code ec;
  fs::remove(reserved, ec);
}

} // namespace

const char* to_string(MoveError error) {
  switch(error) {
    case MoveError::None: return "none";
    case MoveError::SourceVanished: return "source-vanished";
    case MoveError::PermissionDenied: return "permission-denied";
    case MoveError::DestinationUnwritable: return "destination-unwritable";
    case MoveError::UnexpectedIOError: return "unexpected-io-error";
  }
  return "unknown";
}

CollisionSafeMover::CollisionSafeMover() : CollisionSafeMover(Options{}) {}

CollisionSafeMover::CollisionSafeMover(Options options)
  : options_(options) {
  if(options_.max_collision_attempts == 0) {
    options_.max_collision_attempts = 1;
  }
}

fs::path CollisionSafeMover::candidate_name(const fs::path& filename, std::size_t attempt) {
  if(attempt == 0) return filename;
  return filename.stem().string() + " (" + std::to_string(attempt) + ")" + filename.extension().string();
}

fs::path CollisionSafeMover::target_directory(const fs::path& destination_dir) const {
  if(!options_.dated_subfolders) return destination_dir;
  return destination_dir / dated_component("%Y") / dated_component("%b");
}

MoveResult CollisionSafeMover::move(const fs::path& source, const fs::path& destination_dir) const {
  std::error_code ec;
  auto status = fs::symlink_status(source, ec);
  if(ec || !fs::exists(status)) {
    if(ec && ec != std::errc::no_such_file_or_directory) {
      return failure(is_permission_error(ec) ? MoveError::PermissionDenied : MoveError::UnexpectedIOError,
                     "cannot stat '" + source.string() + "': " + ec.message());
    }
    return failure(MoveError::SourceVanished, "'" + source.string() + "' no longer exists");
  }
  if(!fs::is_regular_file(status)) {
    return failure(MoveError::UnexpectedIOError, "'" + source.string() + "' is not a regular file");
  }

  const fs::path directory = target_directory(destination_dir);
  fs::create_directories(directory, ec);
  if(ec) {
    return failure(classify_destination_error(ec),
                   "cannot create '" + directory.string() + "': " + ec.message());
  }
  if(!fs::is_directory(directory, ec)) {
    return failure(MoveError::DestinationUnwritable, "'" + directory.string() + "' is not a directory");
  }

  const fs::path filename = source.filename();
  for(std::size_t attempt = 0; attempt < options_.max_collision_attempts; ++attempt) {
    const fs::path candidate = directory / candidate_name(filename, attempt);

    // Claim the name first; whoever creates it owns it.
    int fd = ::open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if(fd < 0) {
      std::error_code open_ec(errno, std::generic_category());
      if(open_ec == std::errc::file_exists) continue;
      return failure(classify_destination_error(open_ec),
                     "cannot create '" + candidate.string() + "': " + open_ec.message());
    }
    ::close(fd);

    std::error_code rename_ec;
    fs::rename(source, candidate, rename_ec);
    if(!rename_ec) {
      MoveResult result;
      result.success = true;
      result.destination = candidate;
      return result;
    }

    if(rename_ec == std::errc::cross_device_link) {
      return copy_then_remove(source, candidate);
    }

    discard(candidate);
    return failure(classify_rename_error(rename_ec),
                   "cannot move '" + source.string() + "' to '" + candidate.string() + "': " + rename_ec.message());
  }

  return failure(MoveError::DestinationUnwritable,
                 "no free name for '" + filename.string() + "' in '" + directory.string() + "' after " +
                 std::to_string(options_.max_collision_attempts) + " attempts");
}

MoveResult CollisionSafeMover::copy_then_remove(const fs::path& source, const fs::path& reserved) const {
  std::error_code ec;
  fs::copy_file(source, reserved, fs::copy_options::overwrite_existing, ec);
  if(ec) {
    discard(reserved);
    MoveError error = ec == std::errc::no_such_file_or_directory
      ? MoveError::SourceVanished
      : (is_permission_error(ec) ? MoveError::PermissionDenied : MoveError::UnexpectedIOError);
    return failure(error, "cannot copy '" + source.string() + "' to '" + reserved.string() + "': " + ec.message());
  }

  // Metadata is best effort; the content is what matters.
  std::error_code meta_ec;
  auto modified = fs::last_write_time(source, meta_ec);
  if(!meta_ec) fs::last_write_time(reserved, modified, meta_ec);
  meta_ec.clear();
  auto permissions = fs::status(source, meta_ec).permissions();
  if(!meta_ec) fs::permissions(reserved, permissions, meta_ec);

  fs::remove(source, ec);
  if(ec && ec != std::errc::no_such_file_or_directory) {
    // Leaving both copies would duplicate the file on the next event.
    discard(reserved);
    return failure(is_permission_error(ec) ? MoveError::PermissionDenied : MoveError::UnexpectedIOError,
                   "copied '" + source.string() + "' but could not remove it: " + ec.message());
  }

  MoveResult result;
  result.success = true;
  result.destination = reserved;
  result.cross_device = true;
  return result;
}
