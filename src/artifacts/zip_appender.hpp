#ifndef ARGSMAP_ARTIFACTS_ZIP_APPENDER_HPP_
#define ARGSMAP_ARTIFACTS_ZIP_APPENDER_HPP_

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace argsmap::artifacts {

// Appends entries to an existing zip (jar) archive in place.
//
// Contract:
// - Open() acquires the archive handle and reads its central directory.
//   Existing entries, their data and the archive comment are never rewritten.
// - AddEntry() only stages an entry in memory.
// - Commit() writes all staged entries plus a rebuilt central directory in one
//   pass and closes the handle. If that write fails, the original central
//   directory is written back and the file is truncated to its original size.
// - Destroying or Close()-ing an appender without Commit() leaves the archive
//   byte-for-byte unchanged.
// - New entries are stored uncompressed with a fixed timestamp, so identical
//   content always produces identical archive bytes.
// - zip64 and multi-disk archives are rejected.
// - Same-path entries are not merged: adding a path that already exists
//   produces a second entry with that path (see HasEntry()).
class ZipAppender {
public:
  ZipAppender() = default;
  ~ZipAppender();

  ZipAppender(const ZipAppender&) = delete;
  ZipAppender& operator=(const ZipAppender&) = delete;

  bool Open(const std::filesystem::path& archive_path, std::string& error);

  bool IsOpen() const {
    return file_.is_open();
  }

  // True when an existing or staged entry has exactly this path.
  bool HasEntry(std::string_view entry_path) const;

  // Existing plus staged entries.
  std::size_t EntryCount() const {
    return entry_paths_.size() + pending_.size();
  }

  bool AddEntry(std::string entry_path, std::string_view content, std::string& error);

  bool Commit(std::string& error);

  // Releases the handle and drops staged entries.
  void Close();

private:
  struct PendingEntry {
    std::string path;
    std::string data;
    std::uint32_t crc32 = 0;
  };

  bool ReadCentralDirectory(std::string& error);
  bool RestoreOriginalTail(std::string& error);

  std::filesystem::path archive_path_;
  std::fstream file_;
  std::uint64_t original_size_ = 0;
  std::uint32_t central_dir_offset_ = 0;
  std::uint32_t central_dir_size_ = 0;
  // Everything from the central directory offset to EOF, kept for rollback.
  std::string original_tail_;
  std::string comment_;
  std::vector<std::string> entry_paths_;
  std::vector<PendingEntry> pending_;
};

} // namespace argsmap::artifacts

#endif // ARGSMAP_ARTIFACTS_ZIP_APPENDER_HPP_
