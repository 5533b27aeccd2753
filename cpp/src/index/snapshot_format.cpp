#include "recallcpp/snapshot_format.hpp"
#include "recallcpp/errors.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <cstring>
#include <fstream>
#include <limits>
#include <set>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace recallcpp {
namespace {

constexpr std::size_t kHeaderSize = 44;
constexpr std::size_t kTrailerSize = sizeof(std::uint64_t);
constexpr std::array<std::byte, 4> kMagic = {
    std::byte{0x52},  // 'R'
    std::byte{0x43},  // 'C'
    std::byte{0x53},  // 'S'
    std::byte{0x31},  // '1'
};
constexpr std::uint16_t kVersion = 1;
constexpr std::uint8_t kSimilarityCosine = 0;

constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

StorageError SnapshotError(const std::string& message) {
  return StorageError("snapshot_format: " + message);
}

std::uint64_t Fnv1a(std::span<const std::byte> bytes) {
  std::uint64_t hash = kFnvOffset;
  for (const auto b : bytes) {
    hash ^= static_cast<std::uint64_t>(std::to_integer<std::uint8_t>(b));
    hash *= kFnvPrime;
  }
  return hash;
}

void AppendU8(std::vector<std::byte>& out, std::uint8_t value) {
  out.push_back(static_cast<std::byte>(value));
}

void AppendU16LE(std::vector<std::byte>& out, std::uint16_t value) {
  for (std::size_t i = 0; i < sizeof(value); ++i) {
    out.push_back(static_cast<std::byte>((value >> (8U * i)) & 0xFFU));
  }
}

void AppendU32LE(std::vector<std::byte>& out, std::uint32_t value) {
  for (std::size_t i = 0; i < sizeof(value); ++i) {
    out.push_back(static_cast<std::byte>((value >> (8U * i)) & 0xFFU));
  }
}

void AppendU64LE(std::vector<std::byte>& out, std::uint64_t value) {
  for (std::size_t i = 0; i < sizeof(value); ++i) {
    out.push_back(static_cast<std::byte>((value >> (8U * i)) & 0xFFU));
  }
}

void AppendF32LE(std::vector<std::byte>& out, float value) {
  std::uint32_t bits = 0;
  static_assert(sizeof(bits) == sizeof(value));
  std::memcpy(&bits, &value, sizeof(bits));
  AppendU32LE(out, bits);
}

void AppendString(std::vector<std::byte>& out, const std::string& value) {
  if (value.size() > static_cast<std::size_t>(std::numeric_limits<std::uint32_t>::max())) {
    throw SnapshotError("string field exceeds uint32 length");
  }
  AppendU32LE(out, static_cast<std::uint32_t>(value.size()));
  for (const char ch : value) {
    out.push_back(static_cast<std::byte>(static_cast<unsigned char>(ch)));
  }
}

bool TryMul(std::uint64_t lhs, std::uint64_t rhs, std::uint64_t& out) {
  if (lhs == 0 || rhs == 0) {
    out = 0;
    return true;
  }
  if (lhs > std::numeric_limits<std::uint64_t>::max() / rhs) {
    return false;
  }
  out = lhs * rhs;
  return true;
}

// Bounds-checked little-endian cursor over the snapshot body.
class ByteReader {
 public:
  explicit ByteReader(std::span<const std::byte> bytes) : bytes_(bytes) {}

  std::uint8_t ReadU8() {
    Require(1, "u8");
    return std::to_integer<std::uint8_t>(bytes_[cursor_++]);
  }

  std::uint16_t ReadU16() { return static_cast<std::uint16_t>(ReadLE(sizeof(std::uint16_t), "u16")); }
  std::uint32_t ReadU32() { return static_cast<std::uint32_t>(ReadLE(sizeof(std::uint32_t), "u32")); }
  std::uint64_t ReadU64() { return ReadLE(sizeof(std::uint64_t), "u64"); }

  float ReadF32() {
    const auto bits = ReadU32();
    float value = 0.0F;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
  }

  std::string ReadString() {
    const auto length = ReadU32();
    Require(length, "string");
    std::string out(length, '\0');
    for (std::size_t i = 0; i < length; ++i) {
      out[i] = static_cast<char>(std::to_integer<unsigned char>(bytes_[cursor_ + i]));
    }
    cursor_ += length;
    return out;
  }

  void Skip(std::size_t count) {
    Require(count, "skip");
    cursor_ += count;
  }

  [[nodiscard]] std::size_t remaining() const { return bytes_.size() - cursor_; }
  [[nodiscard]] std::size_t cursor() const { return cursor_; }

 private:
  void Require(std::size_t count, const char* what) const {
    if (count > bytes_.size() - cursor_) {
      throw SnapshotError(std::string(what) + " read out of bounds");
    }
  }

  std::uint64_t ReadLE(std::size_t width, const char* what) {
    Require(width, what);
    std::uint64_t out = 0;
    for (std::size_t i = 0; i < width; ++i) {
      out |= static_cast<std::uint64_t>(std::to_integer<std::uint8_t>(bytes_[cursor_ + i])) << (8U * i);
    }
    cursor_ += width;
    return out;
  }

  std::span<const std::byte> bytes_;
  std::size_t cursor_ = 0;
};

std::int64_t ToEpochMillis(Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

Timestamp FromEpochMillis(std::int64_t millis) {
  return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(millis)));
}

DocumentType DecodeDocumentType(std::uint8_t raw) {
  switch (raw) {
    case static_cast<std::uint8_t>(DocumentType::kText):
    case static_cast<std::uint8_t>(DocumentType::kPdf):
    case static_cast<std::uint8_t>(DocumentType::kImage):
    case static_cast<std::uint8_t>(DocumentType::kAudio):
      return static_cast<DocumentType>(raw);
    default:
      throw SnapshotError("invalid document type " + std::to_string(raw));
  }
}

void ValidateIntegrity(const Snapshot& snapshot) {
  std::unordered_map<DocumentId, std::uint32_t> expected_counts{};
  expected_counts.reserve(snapshot.documents.size());
  for (const auto& doc : snapshot.documents) {
    if (doc.document.id >= snapshot.next_document_id) {
      throw SnapshotError("document id " + std::to_string(doc.document.id) + " not below next_document_id");
    }
    if (!expected_counts.emplace(doc.document.id, doc.document.chunk_count).second) {
      throw SnapshotError("duplicate document id " + std::to_string(doc.document.id));
    }
  }

  std::unordered_map<DocumentId, std::uint32_t> actual_counts{};
  std::set<std::pair<DocumentId, std::uint32_t>> seen{};
  for (const auto& entry : snapshot.entries) {
    const auto expected = expected_counts.find(entry.document_id);
    if (expected == expected_counts.end()) {
      throw SnapshotError("entry references unknown document " + std::to_string(entry.document_id));
    }
    if (entry.chunk_index >= expected->second) {
      throw SnapshotError("entry chunk_index out of range for document " + std::to_string(entry.document_id));
    }
    if (!seen.emplace(entry.document_id, entry.chunk_index).second) {
      throw SnapshotError("duplicate entry for document " + std::to_string(entry.document_id));
    }
    double sum_sq = 0.0;
    for (const float value : entry.embedding) {
      if (!std::isfinite(value)) {
        throw SnapshotError("entry embedding has a non-finite component");
      }
      sum_sq += static_cast<double>(value) * static_cast<double>(value);
    }
    if (!(sum_sq > 0.0) || !std::isfinite(sum_sq)) {
      throw SnapshotError("entry embedding for document " + std::to_string(entry.document_id) + " has zero norm");
    }
    actual_counts[entry.document_id] += 1;
  }
  for (const auto& [id, count] : expected_counts) {
    const auto it = actual_counts.find(id);
    const std::uint32_t actual = it == actual_counts.end() ? 0 : it->second;
    if (actual != count) {
      throw SnapshotError("document " + std::to_string(id) + " chunk_count does not match its entries");
    }
  }
}

}  // namespace

std::vector<std::byte> EncodeSnapshot(const Snapshot& snapshot) {
  if (snapshot.dimension == 0) {
    throw SnapshotError("dimension must be positive");
  }
  std::vector<std::byte> out{};
  std::uint64_t vector_bytes = 0;
  if (!TryMul(snapshot.entries.size(), static_cast<std::uint64_t>(snapshot.dimension) * sizeof(float), vector_bytes)) {
    throw SnapshotError("vector byte size overflow");
  }
  out.reserve(kHeaderSize + static_cast<std::size_t>(vector_bytes) + snapshot.entries.size() * 12 + kTrailerSize);

  out.insert(out.end(), kMagic.begin(), kMagic.end());
  AppendU16LE(out, kVersion);
  AppendU8(out, 0);
  AppendU8(out, kSimilarityCosine);
  AppendU32LE(out, snapshot.dimension);
  AppendU64LE(out, snapshot.next_document_id);
  AppendU64LE(out, static_cast<std::uint64_t>(snapshot.documents.size()));
  AppendU64LE(out, static_cast<std::uint64_t>(snapshot.entries.size()));
  for (std::size_t i = 0; i < 8; ++i) {
    out.push_back(std::byte{0});
  }

  for (const auto& doc : snapshot.documents) {
    if (doc.chunk_texts.size() != doc.document.chunk_count) {
      throw SnapshotError("document " + std::to_string(doc.document.id) + " chunk text count mismatch");
    }
    AppendU64LE(out, doc.document.id);
    AppendU8(out, static_cast<std::uint8_t>(doc.document.type));
    AppendU64LE(out, static_cast<std::uint64_t>(ToEpochMillis(doc.document.created_at)));
    AppendU32LE(out, doc.document.chunk_count);
    AppendString(out, doc.document.source);
    for (const auto& text : doc.chunk_texts) {
      AppendString(out, text);
    }
  }

  for (const auto& entry : snapshot.entries) {
    if (entry.embedding.size() != snapshot.dimension) {
      throw SnapshotError("entry embedding dimension mismatch");
    }
    AppendU64LE(out, entry.document_id);
    AppendU32LE(out, entry.chunk_index);
    for (const float value : entry.embedding) {
      AppendF32LE(out, value);
    }
  }

  AppendU64LE(out, Fnv1a(out));
  return out;
}

Snapshot DecodeSnapshot(std::span<const std::byte> bytes) {
  if (bytes.size() < kHeaderSize + kTrailerSize) {
    throw SnapshotError("snapshot too small");
  }
  if (!std::equal(kMagic.begin(), kMagic.end(), bytes.begin())) {
    throw SnapshotError("magic mismatch");
  }
  const auto body = bytes.first(bytes.size() - kTrailerSize);
  ByteReader trailer(bytes.last(kTrailerSize));
  if (trailer.ReadU64() != Fnv1a(body)) {
    throw SnapshotError("checksum mismatch");
  }

  ByteReader reader(body);
  reader.Skip(kMagic.size());
  if (reader.ReadU16() != kVersion) {
    throw SnapshotError("unsupported version");
  }
  if (reader.ReadU8() != 0) {
    throw SnapshotError("unsupported flags");
  }
  if (reader.ReadU8() != kSimilarityCosine) {
    throw SnapshotError("unsupported similarity");
  }

  Snapshot snapshot{};
  snapshot.dimension = reader.ReadU32();
  if (snapshot.dimension == 0) {
    throw SnapshotError("dimension must be positive");
  }
  snapshot.next_document_id = reader.ReadU64();
  const auto document_count = reader.ReadU64();
  const auto entry_count = reader.ReadU64();
  for (std::size_t i = 0; i < 8; ++i) {
    if (reader.ReadU8() != 0) {
      throw SnapshotError("reserved bytes must be zero");
    }
  }

  // Cheap plausibility bounds before reserving: every document and entry needs at least this many bytes.
  constexpr std::uint64_t kMinDocumentBytes = 8 + 1 + 8 + 4 + 4;
  std::uint64_t min_entry_bytes = 0;
  std::uint64_t min_entries_total = 0;
  std::uint64_t min_documents_total = 0;
  if (!TryMul(snapshot.dimension, sizeof(float), min_entry_bytes) ||
      !TryMul(entry_count, min_entry_bytes + 12, min_entries_total) ||
      !TryMul(document_count, kMinDocumentBytes, min_documents_total) ||
      min_entries_total > reader.remaining() || min_documents_total > reader.remaining() - min_entries_total) {
    throw SnapshotError("declared counts exceed snapshot size");
  }

  snapshot.documents.reserve(static_cast<std::size_t>(document_count));
  for (std::uint64_t i = 0; i < document_count; ++i) {
    SnapshotDocument doc{};
    doc.document.id = reader.ReadU64();
    doc.document.type = DecodeDocumentType(reader.ReadU8());
    doc.document.created_at = FromEpochMillis(static_cast<std::int64_t>(reader.ReadU64()));
    doc.document.chunk_count = reader.ReadU32();
    doc.document.source = reader.ReadString();
    if (static_cast<std::uint64_t>(doc.document.chunk_count) * sizeof(std::uint32_t) > reader.remaining()) {
      throw SnapshotError("chunk count exceeds snapshot size");
    }
    doc.chunk_texts.reserve(doc.document.chunk_count);
    for (std::uint32_t c = 0; c < doc.document.chunk_count; ++c) {
      doc.chunk_texts.push_back(reader.ReadString());
    }
    snapshot.documents.push_back(std::move(doc));
  }

  snapshot.entries.reserve(static_cast<std::size_t>(entry_count));
  for (std::uint64_t i = 0; i < entry_count; ++i) {
    VectorEntry entry{};
    entry.document_id = reader.ReadU64();
    entry.chunk_index = reader.ReadU32();
    entry.embedding.reserve(snapshot.dimension);
    for (std::uint32_t d = 0; d < snapshot.dimension; ++d) {
      entry.embedding.push_back(reader.ReadF32());
    }
    snapshot.entries.push_back(std::move(entry));
  }
  if (reader.remaining() != 0) {
    throw SnapshotError("trailing bytes after entries");
  }

  ValidateIntegrity(snapshot);
  return snapshot;
}

void WriteSnapshotFile(const std::filesystem::path& path, const Snapshot& snapshot) {
  const auto bytes = EncodeSnapshot(snapshot);
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw SnapshotError("failed to create directory " + path.parent_path().string() + ": " + ec.message());
    }
  }

  auto temp_path = path;
  temp_path += ".tmp";
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw SnapshotError("failed to open for write: " + temp_path.string());
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
      std::filesystem::remove(temp_path, ec);
      throw SnapshotError("failed to write: " + temp_path.string());
    }
  }
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    const auto message = ec.message();
    std::filesystem::remove(temp_path, ec);
    throw SnapshotError("failed to move snapshot into place at " + path.string() + ": " + message);
  }
}

Snapshot ReadSnapshotFile(const std::filesystem::path& path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw SnapshotError("failed to stat " + path.string() + ": " + ec.message());
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw SnapshotError("failed to open for read: " + path.string());
  }
  std::vector<std::byte> bytes(static_cast<std::size_t>(size));
  in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (in.gcount() != static_cast<std::streamsize>(bytes.size())) {
    throw SnapshotError("short read from " + path.string());
  }
  return DecodeSnapshot(bytes);
}

}  // namespace recallcpp
