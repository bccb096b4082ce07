#include "artifacts/zip_appender.hpp"

#include <algorithm>
#include <array>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace argsmap::artifacts {

namespace {

constexpr std::uint32_t kLocalFileHeaderSignature = 0x04034b50U;
constexpr std::uint32_t kCentralDirectoryHeaderSignature = 0x02014b50U;
constexpr std::uint32_t kEndOfCentralDirectorySignature = 0x06054b50U;
constexpr std::uint32_t kZip64EndOfCentralDirectoryLocatorSignature = 0x07064b50U;
constexpr std::uint16_t kZipVersion = 20; // 2.0
constexpr std::uint16_t kCompressionMethodStore = 0;
constexpr std::uint16_t kDosTimeMidnight = 0;
constexpr std::uint16_t kDosDate1980Jan1 = (1U << 5) | 1U;

constexpr std::size_t kEndOfCentralDirectorySize = 22;
constexpr std::size_t kZip64LocatorSize = 20;
constexpr std::size_t kCentralDirectoryHeaderSize = 46;
constexpr std::size_t kMaxCommentSize = 0xFFFF;

constexpr std::uint32_t kCrc32Init = 0xFFFFFFFFU;
constexpr std::uint32_t kCrc32FinalXor = 0xFFFFFFFFU;

void AppendU16(std::string& out, std::uint16_t value) {
  out.push_back(static_cast<char>(value & 0xFFU));
  out.push_back(static_cast<char>((value >> 8) & 0xFFU));
}

void AppendU32(std::string& out, std::uint32_t value) {
  out.push_back(static_cast<char>(value & 0xFFU));
  out.push_back(static_cast<char>((value >> 8) & 0xFFU));
  out.push_back(static_cast<char>((value >> 16) & 0xFFU));
  out.push_back(static_cast<char>((value >> 24) & 0xFFU));
}

std::uint16_t ReadU16(std::string_view bytes, std::size_t offset) {
  return static_cast<std::uint16_t>(static_cast<std::uint8_t>(bytes[offset]) |
                                    (static_cast<std::uint8_t>(bytes[offset + 1]) << 8));
}

std::uint32_t ReadU32(std::string_view bytes, std::size_t offset) {
  return static_cast<std::uint32_t>(static_cast<std::uint8_t>(bytes[offset])) |
         (static_cast<std::uint32_t>(static_cast<std::uint8_t>(bytes[offset + 1])) << 8) |
         (static_cast<std::uint32_t>(static_cast<std::uint8_t>(bytes[offset + 2])) << 16) |
         (static_cast<std::uint32_t>(static_cast<std::uint8_t>(bytes[offset + 3])) << 24);
}

const std::array<std::uint32_t, 256>& Crc32Table() {
  static const std::array<std::uint32_t, 256> table = [] {
    std::array<std::uint32_t, 256> generated{};
    for (std::uint32_t i = 0; i < 256U; ++i) {
      std::uint32_t c = i;
      for (int bit = 0; bit < 8; ++bit) {
        if ((c & 1U) != 0U) {
          c = 0xEDB88320U ^ (c >> 1);
        } else {
          c >>= 1;
        }
      }
      generated[i] = c;
    }
    return generated;
  }();
  return table;
}

std::uint32_t Crc32(std::string_view data) {
  const auto& table = Crc32Table();
  std::uint32_t c = kCrc32Init;
  for (const char ch : data) {
    const std::uint8_t byte = static_cast<std::uint8_t>(ch);
    c = table[(c ^ byte) & 0xFFU] ^ (c >> 8);
  }
  return c ^ kCrc32FinalXor;
}

bool ValidateEntryPath(std::string_view entry_path, std::string& error) {
  if (entry_path.empty()) {
    error = "zip entry path cannot be empty";
    return false;
  }
  if (entry_path.size() > 0xFFFFU) {
    error = "zip entry path too long: " + std::string(entry_path);
    return false;
  }
  if (entry_path.front() == '/' || entry_path.find('\\') != std::string_view::npos) {
    error = "zip entry path must be relative and use '/': " + std::string(entry_path);
    return false;
  }
  if (entry_path == ".." || entry_path.rfind("../", 0) == 0U ||
      entry_path.find("/../") != std::string_view::npos) {
    error = "zip entry path escapes the archive root: " + std::string(entry_path);
    return false;
  }
  return true;
}

bool ReadExact(std::fstream& file, std::uint64_t offset, std::size_t size, std::string& out) {
  out.assign(size, '\0');
  file.clear();
  file.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  if (!file) {
    return false;
  }
  file.read(out.data(), static_cast<std::streamsize>(size));
  return file.gcount() == static_cast<std::streamsize>(size);
}

} // namespace

ZipAppender::~ZipAppender() {
  Close();
}

bool ZipAppender::Open(const fs::path& archive_path, std::string& error) {
  if (IsOpen()) {
    error = "zip appender is already open: " + archive_path_.string();
    return false;
  }

  std::error_code ec;
  if (!fs::exists(archive_path, ec) || ec) {
    error = "archive not found: " + archive_path.string();
    return false;
  }
  if (!fs::is_regular_file(archive_path, ec) || ec) {
    error = "archive path must be a regular file: " + archive_path.string();
    return false;
  }

  archive_path_ = archive_path;
  pending_.clear();
  entry_paths_.clear();

  file_.open(archive_path, std::ios::in | std::ios::out | std::ios::binary);
  if (!file_) {
    error = "failed to open archive for append: " + archive_path.string();
    file_.close();
    return false;
  }

  if (!ReadCentralDirectory(error)) {
    Close();
    return false;
  }
  return true;
}

bool ZipAppender::ReadCentralDirectory(std::string& error) {
  const std::string archive_name = archive_path_.string();

  file_.seekg(0, std::ios::end);
  const std::streamoff end = file_.tellg();
  if (end < 0) {
    error = "failed to determine archive size: " + archive_name;
    return false;
  }
  original_size_ = static_cast<std::uint64_t>(end);
  if (original_size_ < kEndOfCentralDirectorySize) {
    error = "not a zip archive (too small): " + archive_name;
    return false;
  }
  if (original_size_ > 0xFFFFFFFFULL) {
    error = "archive too large for zip32 support: " + archive_name;
    return false;
  }

  // The end record sits at the very end, followed only by the archive comment.
  const std::size_t search_size = static_cast<std::size_t>(std::min<std::uint64_t>(
      original_size_, kEndOfCentralDirectorySize + kMaxCommentSize));
  const std::uint64_t search_start = original_size_ - search_size;
  std::string tail;
  if (!ReadExact(file_, search_start, search_size, tail)) {
    error = "failed while reading archive tail: " + archive_name;
    return false;
  }

  std::size_t eocd_pos = std::string::npos;
  for (std::size_t pos = search_size - kEndOfCentralDirectorySize + 1; pos-- > 0;) {
    if (ReadU32(tail, pos) != kEndOfCentralDirectorySignature) {
      continue;
    }
    const std::uint16_t comment_size = ReadU16(tail, pos + 20);
    if (pos + kEndOfCentralDirectorySize + comment_size == search_size) {
      eocd_pos = pos;
      break;
    }
  }
  if (eocd_pos == std::string::npos) {
    error = "end of central directory record not found: " + archive_name;
    return false;
  }

  const std::uint16_t disk_number = ReadU16(tail, eocd_pos + 4);
  const std::uint16_t central_dir_disk = ReadU16(tail, eocd_pos + 6);
  const std::uint16_t entries_on_disk = ReadU16(tail, eocd_pos + 8);
  const std::uint16_t total_entries = ReadU16(tail, eocd_pos + 10);
  central_dir_size_ = ReadU32(tail, eocd_pos + 12);
  central_dir_offset_ = ReadU32(tail, eocd_pos + 16);
  comment_ = tail.substr(eocd_pos + kEndOfCentralDirectorySize);

  const std::uint64_t eocd_offset = search_start + eocd_pos;
  const bool has_zip64_locator =
      eocd_offset >= kZip64LocatorSize && eocd_pos >= kZip64LocatorSize &&
      ReadU32(tail, eocd_pos - kZip64LocatorSize) == kZip64EndOfCentralDirectoryLocatorSignature;
  if (has_zip64_locator || total_entries == 0xFFFFU || central_dir_size_ == 0xFFFFFFFFU ||
      central_dir_offset_ == 0xFFFFFFFFU) {
    error = "zip64 archives are not supported: " + archive_name;
    return false;
  }
  if (disk_number != 0U || central_dir_disk != 0U || entries_on_disk != total_entries) {
    error = "multi-disk zip archives are not supported: " + archive_name;
    return false;
  }
  if (static_cast<std::uint64_t>(central_dir_offset_) + central_dir_size_ > eocd_offset) {
    error = "zip central directory lies outside the archive: " + archive_name;
    return false;
  }

  const std::size_t tail_size =
      static_cast<std::size_t>(original_size_ - central_dir_offset_);
  if (!ReadExact(file_, central_dir_offset_, tail_size, original_tail_)) {
    error = "failed while reading zip central directory: " + archive_name;
    return false;
  }

  const std::string_view central_dir =
      std::string_view(original_tail_).substr(0, central_dir_size_);
  std::size_t offset = 0;
  while (offset < central_dir.size()) {
    if (central_dir.size() - offset < kCentralDirectoryHeaderSize ||
        ReadU32(central_dir, offset) != kCentralDirectoryHeaderSignature) {
      error = "malformed zip central directory entry at index " +
              std::to_string(entry_paths_.size()) + ": " + archive_name;
      return false;
    }
    const std::size_t name_size = ReadU16(central_dir, offset + 28);
    const std::size_t extra_size = ReadU16(central_dir, offset + 30);
    const std::size_t comment_size = ReadU16(central_dir, offset + 32);
    const std::size_t record_size =
        kCentralDirectoryHeaderSize + name_size + extra_size + comment_size;
    if (central_dir.size() - offset < record_size) {
      error = "truncated zip central directory entry at index " +
              std::to_string(entry_paths_.size()) + ": " + archive_name;
      return false;
    }
    entry_paths_.emplace_back(central_dir.substr(offset + kCentralDirectoryHeaderSize, name_size));
    offset += record_size;
  }

  if (entry_paths_.size() != total_entries) {
    error = "zip central directory lists " + std::to_string(entry_paths_.size()) +
            " entries but the end record declares " + std::to_string(total_entries) + ": " +
            archive_name;
    return false;
  }

  file_.clear();
  return true;
}

bool ZipAppender::HasEntry(std::string_view entry_path) const {
  if (std::find(entry_paths_.begin(), entry_paths_.end(), entry_path) != entry_paths_.end()) {
    return true;
  }
  return std::any_of(pending_.begin(), pending_.end(),
                     [entry_path](const PendingEntry& entry) { return entry.path == entry_path; });
}

bool ZipAppender::AddEntry(std::string entry_path, std::string_view content, std::string& error) {
  if (!IsOpen()) {
    error = "zip appender is not open";
    return false;
  }
  if (!ValidateEntryPath(entry_path, error)) {
    return false;
  }
  if (content.size() > 0xFFFFFFFFULL) {
    error = "zip entry too large for zip32 support: " + entry_path;
    return false;
  }
  if (EntryCount() + 1U > 0xFFFEU) {
    error = "too many entries for zip32 support: " + archive_path_.string();
    return false;
  }

  PendingEntry entry;
  entry.path = std::move(entry_path);
  entry.data = std::string(content);
  entry.crc32 = Crc32(entry.data);
  pending_.push_back(std::move(entry));
  return true;
}

bool ZipAppender::Commit(std::string& error) {
  if (!IsOpen()) {
    error = "zip appender is not open";
    return false;
  }
  if (pending_.empty()) {
    Close();
    return true;
  }

  const std::string archive_name = archive_path_.string();

  // New local entries overwrite the old central directory; the rebuilt
  // directory (old records first) and end record follow them.
  std::string tail;
  std::string new_central_records;
  for (const PendingEntry& entry : pending_) {
    const std::uint64_t local_offset = static_cast<std::uint64_t>(central_dir_offset_) + tail.size();
    if (local_offset > 0xFFFFFFFFULL) {
      error = "zip offset overflow while staging entry " + entry.path + ": " + archive_name;
      return false;
    }

    const auto name_size = static_cast<std::uint16_t>(entry.path.size());
    const auto data_size = static_cast<std::uint32_t>(entry.data.size());

    AppendU32(tail, kLocalFileHeaderSignature);
    AppendU16(tail, kZipVersion);
    AppendU16(tail, 0); // general purpose bit flag
    AppendU16(tail, kCompressionMethodStore);
    AppendU16(tail, kDosTimeMidnight);
    AppendU16(tail, kDosDate1980Jan1);
    AppendU32(tail, entry.crc32);
    AppendU32(tail, data_size); // compressed size (store)
    AppendU32(tail, data_size); // uncompressed size
    AppendU16(tail, name_size);
    AppendU16(tail, 0); // extra field length
    tail += entry.path;
    tail += entry.data;

    AppendU32(new_central_records, kCentralDirectoryHeaderSignature);
    AppendU16(new_central_records, kZipVersion); // version made by
    AppendU16(new_central_records, kZipVersion); // version needed to extract
    AppendU16(new_central_records, 0);           // general purpose bit flag
    AppendU16(new_central_records, kCompressionMethodStore);
    AppendU16(new_central_records, kDosTimeMidnight);
    AppendU16(new_central_records, kDosDate1980Jan1);
    AppendU32(new_central_records, entry.crc32);
    AppendU32(new_central_records, data_size);
    AppendU32(new_central_records, data_size);
    AppendU16(new_central_records, name_size);
    AppendU16(new_central_records, 0); // extra field length
    AppendU16(new_central_records, 0); // file comment length
    AppendU16(new_central_records, 0); // disk number start
    AppendU16(new_central_records, 0); // internal file attributes
    AppendU32(new_central_records, 0); // external file attributes
    AppendU32(new_central_records, static_cast<std::uint32_t>(local_offset));
    new_central_records += entry.path;
  }

  const std::uint64_t new_central_dir_offset =
      static_cast<std::uint64_t>(central_dir_offset_) + tail.size();
  const std::uint64_t new_central_dir_size =
      static_cast<std::uint64_t>(central_dir_size_) + new_central_records.size();
  if (new_central_dir_offset + new_central_dir_size > 0xFFFFFFFFULL) {
    error = "zip central directory offset overflow: " + archive_name;
    return false;
  }

  tail.append(original_tail_, 0, central_dir_size_);
  tail += new_central_records;

  const auto total_entries = static_cast<std::uint16_t>(EntryCount());
  AppendU32(tail, kEndOfCentralDirectorySignature);
  AppendU16(tail, 0); // number of this disk
  AppendU16(tail, 0); // number of the disk with the start of the central directory
  AppendU16(tail, total_entries);
  AppendU16(tail, total_entries);
  AppendU32(tail, static_cast<std::uint32_t>(new_central_dir_size));
  AppendU32(tail, static_cast<std::uint32_t>(new_central_dir_offset));
  AppendU16(tail, static_cast<std::uint16_t>(comment_.size()));
  tail += comment_;

  file_.clear();
  file_.seekp(static_cast<std::streamoff>(central_dir_offset_), std::ios::beg);
  file_.write(tail.data(), static_cast<std::streamsize>(tail.size()));
  file_.flush();
  if (!file_) {
    std::string restore_error;
    if (RestoreOriginalTail(restore_error)) {
      error = "failed while writing zip entries, archive restored: " + archive_name;
    } else {
      error = "failed while writing zip entries (" + restore_error + "): " + archive_name;
    }
    Close();
    return false;
  }
  file_.close();

  // Only reachable when the original had bytes between its central directory
  // and end record; the rewritten archive drops them.
  const std::uint64_t new_size = static_cast<std::uint64_t>(central_dir_offset_) + tail.size();
  if (new_size < original_size_) {
    std::error_code ec;
    fs::resize_file(archive_path_, new_size, ec);
    if (ec) {
      error = "failed to truncate archive after append: " + archive_name + ": " + ec.message();
      Close();
      return false;
    }
  }

  Close();
  return true;
}

bool ZipAppender::RestoreOriginalTail(std::string& error) {
  file_.clear();
  file_.seekp(static_cast<std::streamoff>(central_dir_offset_), std::ios::beg);
  file_.write(original_tail_.data(), static_cast<std::streamsize>(original_tail_.size()));
  file_.flush();
  const bool rewritten = static_cast<bool>(file_);
  file_.close();
  if (!rewritten) {
    error = "failed to restore original central directory";
    return false;
  }

  std::error_code ec;
  fs::resize_file(archive_path_, original_size_, ec);
  if (ec) {
    error = "failed to restore original archive size: " + ec.message();
    return false;
  }
  return true;
}

void ZipAppender::Close() {
  if (file_.is_open()) {
    file_.close();
  }
  file_.clear();
  pending_.clear();
  entry_paths_.clear();
  original_tail_.clear();
  comment_.clear();
  original_size_ = 0;
  central_dir_offset_ = 0;
  central_dir_size_ = 0;
}

} // namespace argsmap::artifacts
