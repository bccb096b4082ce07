#ifndef ARGSMAP_TESTS_COMMON_ZIP_FIXTURES_HPP_
#define ARGSMAP_TESTS_COMMON_ZIP_FIXTURES_HPP_

#include "assertions.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace argsmap::tests::common {

// Independent zip writer/reader so archive tests never validate the appender
// with its own parsing code.

struct ZipFixtureEntry {
  std::string path;
  std::string data;
};

struct ZipFixtureContents {
  std::vector<ZipFixtureEntry> entries;
  std::string comment;
};

namespace detail {

inline std::uint32_t FixtureCrc32(std::string_view data) {
  std::uint32_t crc = 0xFFFFFFFFU;
  for (const char ch : data) {
    crc ^= static_cast<std::uint8_t>(ch);
    for (int bit = 0; bit < 8; ++bit) {
      crc = (crc & 1U) != 0U ? (0xEDB88320U ^ (crc >> 1)) : (crc >> 1);
    }
  }
  return crc ^ 0xFFFFFFFFU;
}

inline void PutU16(std::string& out, std::uint32_t value) {
  out.push_back(static_cast<char>(value & 0xFFU));
  out.push_back(static_cast<char>((value >> 8) & 0xFFU));
}

inline void PutU32(std::string& out, std::uint32_t value) {
  PutU16(out, value & 0xFFFFU);
  PutU16(out, (value >> 16) & 0xFFFFU);
}

inline std::uint32_t GetU16(const std::string& bytes, std::size_t offset) {
  if (offset + 2 > bytes.size()) {
    Fail("zip fixture read past end");
  }
  return static_cast<std::uint32_t>(static_cast<std::uint8_t>(bytes[offset])) |
         (static_cast<std::uint32_t>(static_cast<std::uint8_t>(bytes[offset + 1])) << 8);
}

inline std::uint32_t GetU32(const std::string& bytes, std::size_t offset) {
  return GetU16(bytes, offset) | (GetU16(bytes, offset + 2) << 16);
}

} // namespace detail

// Writes a stored (uncompressed) zip with the given entries and comment.
inline void WriteFixtureZip(const std::filesystem::path& path,
                            const std::vector<ZipFixtureEntry>& entries,
                            std::string_view comment = {}) {
  std::string body;
  std::string central;
  for (const ZipFixtureEntry& entry : entries) {
    const auto offset = static_cast<std::uint32_t>(body.size());
    const std::uint32_t crc = detail::FixtureCrc32(entry.data);
    const auto size = static_cast<std::uint32_t>(entry.data.size());

    detail::PutU32(body, 0x04034b50U);
    detail::PutU16(body, 20);
    detail::PutU16(body, 0);
    detail::PutU16(body, 0);
    detail::PutU16(body, 0x6000);
    detail::PutU16(body, 0x5821);
    detail::PutU32(body, crc);
    detail::PutU32(body, size);
    detail::PutU32(body, size);
    detail::PutU16(body, static_cast<std::uint32_t>(entry.path.size()));
    detail::PutU16(body, 0);
    body += entry.path;
    body += entry.data;

    detail::PutU32(central, 0x02014b50U);
    detail::PutU16(central, 20);
    detail::PutU16(central, 20);
    detail::PutU16(central, 0);
    detail::PutU16(central, 0);
    detail::PutU16(central, 0x6000);
    detail::PutU16(central, 0x5821);
    detail::PutU32(central, crc);
    detail::PutU32(central, size);
    detail::PutU32(central, size);
    detail::PutU16(central, static_cast<std::uint32_t>(entry.path.size()));
    detail::PutU16(central, 0);
    detail::PutU16(central, 0);
    detail::PutU16(central, 0);
    detail::PutU16(central, 0);
    detail::PutU32(central, 0);
    detail::PutU32(central, offset);
    central += entry.path;
  }

  std::string archive = body + central;
  detail::PutU32(archive, 0x06054b50U);
  detail::PutU16(archive, 0);
  detail::PutU16(archive, 0);
  detail::PutU16(archive, static_cast<std::uint32_t>(entries.size()));
  detail::PutU16(archive, static_cast<std::uint32_t>(entries.size()));
  detail::PutU32(archive, static_cast<std::uint32_t>(central.size()));
  detail::PutU32(archive, static_cast<std::uint32_t>(body.size()));
  detail::PutU16(archive, static_cast<std::uint32_t>(comment.size()));
  archive += comment;

  WriteFileOrFail(path, archive);
}

// Reads a stored zip through its central directory, checking every local
// header and CRC. Aborts the test on any structural problem.
inline ZipFixtureContents ReadFixtureZip(const std::filesystem::path& path) {
  const std::string bytes = ReadFileToString(path);
  if (bytes.size() < 22) {
    Fail("zip fixture too small: " + path.string());
  }

  std::size_t eocd = std::string::npos;
  for (std::size_t pos = bytes.size() - 22 + 1; pos-- > 0;) {
    if (detail::GetU32(bytes, pos) == 0x06054b50U &&
        pos + 22 + detail::GetU16(bytes, pos + 20) == bytes.size()) {
      eocd = pos;
      break;
    }
  }
  if (eocd == std::string::npos) {
    Fail("zip fixture has no end of central directory: " + path.string());
  }

  ZipFixtureContents contents;
  contents.comment = bytes.substr(eocd + 22);
  const std::uint32_t count = detail::GetU16(bytes, eocd + 10);
  const std::uint32_t central_size = detail::GetU32(bytes, eocd + 12);
  std::size_t cursor = detail::GetU32(bytes, eocd + 16);
  if (cursor + central_size != eocd) {
    Fail("zip fixture central directory does not end at the end record: " + path.string());
  }

  for (std::uint32_t i = 0; i < count; ++i) {
    if (detail::GetU32(bytes, cursor) != 0x02014b50U) {
      Fail("zip fixture central directory signature mismatch: " + path.string());
    }
    const std::uint32_t method = detail::GetU16(bytes, cursor + 10);
    const std::uint32_t crc = detail::GetU32(bytes, cursor + 16);
    const std::uint32_t size = detail::GetU32(bytes, cursor + 20);
    const std::uint32_t name_size = detail::GetU16(bytes, cursor + 28);
    const std::uint32_t extra_size = detail::GetU16(bytes, cursor + 30);
    const std::uint32_t comment_size = detail::GetU16(bytes, cursor + 32);
    const std::uint32_t local_offset = detail::GetU32(bytes, cursor + 42);
    const std::string name = bytes.substr(cursor + 46, name_size);
    cursor += 46 + name_size + extra_size + comment_size;

    if (method != 0U) {
      Fail("zip fixture only reads stored entries: " + name);
    }
    if (detail::GetU32(bytes, local_offset) != 0x04034b50U) {
      Fail("zip fixture local header signature mismatch: " + name);
    }
    const std::uint32_t local_name_size = detail::GetU16(bytes, local_offset + 26);
    const std::uint32_t local_extra_size = detail::GetU16(bytes, local_offset + 28);
    if (bytes.substr(local_offset + 30, local_name_size) != name) {
      Fail("zip fixture local header name mismatch: " + name);
    }
    const std::size_t data_offset = local_offset + 30 + local_name_size + local_extra_size;
    if (data_offset + size > bytes.size()) {
      Fail("zip fixture entry data out of bounds: " + name);
    }

    ZipFixtureEntry entry;
    entry.path = name;
    entry.data = bytes.substr(data_offset, size);
    if (detail::FixtureCrc32(entry.data) != crc) {
      Fail("zip fixture crc mismatch: " + name);
    }
    contents.entries.push_back(std::move(entry));
  }

  return contents;
}

} // namespace argsmap::tests::common

#endif // ARGSMAP_TESTS_COMMON_ZIP_FIXTURES_HPP_
