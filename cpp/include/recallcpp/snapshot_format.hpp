#pragma once

#include "recallcpp/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace recallcpp {

struct SnapshotDocument {
  Document document{};
  std::vector<std::string> chunk_texts{};
};

struct Snapshot {
  std::uint32_t dimension = 0;
  DocumentId next_document_id = 0;
  std::vector<SnapshotDocument> documents{};
  std::vector<VectorEntry> entries{};
};

// Little-endian layout:
//   header  : magic "RCS1", u16 version, u8 flags, u8 similarity, u32 dimension,
//             u64 next_document_id, u64 document_count, u64 entry_count, 8 reserved zero bytes
//   document: u64 id, u8 type, i64 created_at_ms, u32 chunk_count, str source, chunk_count x str
//   entry   : u64 document_id, u32 chunk_index, dimension x f32
//   trailer : u64 FNV-1a over every preceding byte
// str is a u32 byte length followed by the bytes.
[[nodiscard]] std::vector<std::byte> EncodeSnapshot(const Snapshot& snapshot);

// Validates framing, checksum and referential integrity; throws StorageError on any violation.
[[nodiscard]] Snapshot DecodeSnapshot(std::span<const std::byte> bytes);

// Writes through a sibling temporary file and renames it over `path`.
void WriteSnapshotFile(const std::filesystem::path& path, const Snapshot& snapshot);
[[nodiscard]] Snapshot ReadSnapshotFile(const std::filesystem::path& path);

}  // namespace recallcpp
