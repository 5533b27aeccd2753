#include "recallcpp/errors.hpp"
#include "recallcpp/snapshot_format.hpp"

#include "../test_logger.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

void RequireStorageError(const std::function<void()>& fn, const std::string& message) {
  bool threw = false;
  try {
    fn();
  } catch (const recallcpp::StorageError&) {
    threw = true;
  }
  Require(threw, message);
}

std::filesystem::path UniquePath(const std::string& stem) {
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() / ("recallcpp_" + stem + "_" + std::to_string(now) + ".rcs");
}

recallcpp::Snapshot SampleSnapshot() {
  recallcpp::Snapshot snapshot{};
  snapshot.dimension = 2;
  snapshot.next_document_id = 4;

  recallcpp::SnapshotDocument notes{};
  notes.document.id = 1;
  notes.document.source = "notes/today.md";
  notes.document.type = recallcpp::DocumentType::kText;
  notes.document.chunk_count = 2;
  notes.document.created_at = recallcpp::Timestamp(std::chrono::milliseconds(1700000000123));
  notes.chunk_texts = {"apple banana", "banana split"};
  snapshot.documents.push_back(notes);

  recallcpp::SnapshotDocument scan{};
  scan.document.id = 3;
  scan.document.source = "scan.pdf";
  scan.document.type = recallcpp::DocumentType::kPdf;
  scan.document.chunk_count = 1;
  scan.chunk_texts = {"rocket engine"};
  snapshot.documents.push_back(scan);

  snapshot.entries = {
      {1, 0, {1.0F, 0.0F}},
      {1, 1, {0.6F, 0.8F}},
      {3, 0, {0.0F, 1.0F}},
  };
  return snapshot;
}

// Recomputes the trailer so structural checks are reached past the checksum.
void Reseal(std::vector<std::byte>& bytes) {
  std::uint64_t hash = 1469598103934665603ULL;
  for (std::size_t i = 0; i < bytes.size() - 8; ++i) {
    hash ^= static_cast<std::uint64_t>(std::to_integer<std::uint8_t>(bytes[i]));
    hash *= 1099511628211ULL;
  }
  for (std::size_t i = 0; i < 8; ++i) {
    bytes[bytes.size() - 8 + i] = static_cast<std::byte>((hash >> (8U * i)) & 0xFFU);
  }
}

void ScenarioEncodeDecode() {
  recallcpp::tests::Log("scenario: encode/decode");
  const auto snapshot = SampleSnapshot();
  const auto bytes = recallcpp::EncodeSnapshot(snapshot);
  Require(bytes.size() > 44 + 8, "encoded snapshot too small");
  Require(bytes[0] == std::byte{'R'} && bytes[1] == std::byte{'C'} && bytes[2] == std::byte{'S'} &&
              bytes[3] == std::byte{'1'},
          "magic mismatch");

  const auto decoded = recallcpp::DecodeSnapshot(bytes);
  Require(decoded.dimension == 2 && decoded.next_document_id == 4, "header fields mismatch");
  Require(decoded.documents.size() == 2, "document count mismatch");
  Require(decoded.documents[0].document.source == "notes/today.md", "source mismatch");
  Require(decoded.documents[0].document.created_at == snapshot.documents[0].document.created_at,
          "created_at must survive at millisecond precision");
  Require(decoded.documents[0].chunk_texts == snapshot.documents[0].chunk_texts, "chunk texts mismatch");
  Require(decoded.documents[1].document.type == recallcpp::DocumentType::kPdf, "document type mismatch");
  Require(decoded.entries.size() == 3, "entry count mismatch");
  Require(decoded.entries[1].embedding == snapshot.entries[1].embedding, "embedding bits must be preserved");
  Require(recallcpp::EncodeSnapshot(decoded) == bytes, "re-encoding must be byte identical");
}

void ScenarioEmptySnapshot() {
  recallcpp::tests::Log("scenario: empty snapshot");
  recallcpp::Snapshot empty{};
  empty.dimension = 384;
  empty.next_document_id = 12;
  const auto decoded = recallcpp::DecodeSnapshot(recallcpp::EncodeSnapshot(empty));
  Require(decoded.dimension == 384 && decoded.next_document_id == 12, "empty snapshot header mismatch");
  Require(decoded.documents.empty() && decoded.entries.empty(), "empty snapshot must decode empty");
}

void ScenarioCorruptionIsDetected() {
  recallcpp::tests::Log("scenario: corruption is detected");
  const auto bytes = recallcpp::EncodeSnapshot(SampleSnapshot());

  RequireStorageError([&] { (void)recallcpp::DecodeSnapshot(std::vector<std::byte>(bytes.begin(), bytes.begin() + 20)); },
                      "truncated header must be rejected");
  RequireStorageError([&] { (void)recallcpp::DecodeSnapshot(std::vector<std::byte>(bytes.begin(), bytes.end() - 1)); },
                      "truncated body must be rejected");

  auto flipped = bytes;
  flipped[60] ^= std::byte{0x01};
  RequireStorageError([&] { (void)recallcpp::DecodeSnapshot(flipped); }, "payload bit flip must fail the checksum");

  auto bad_magic = bytes;
  bad_magic[0] = std::byte{'X'};
  Reseal(bad_magic);
  RequireStorageError([&] { (void)recallcpp::DecodeSnapshot(bad_magic); }, "bad magic must be rejected");

  auto bad_version = bytes;
  bad_version[4] = std::byte{9};
  Reseal(bad_version);
  RequireStorageError([&] { (void)recallcpp::DecodeSnapshot(bad_version); }, "unknown version must be rejected");

  auto bad_reserved = bytes;
  bad_reserved[40] = std::byte{1};
  Reseal(bad_reserved);
  RequireStorageError([&] { (void)recallcpp::DecodeSnapshot(bad_reserved); }, "non-zero reserved bytes must be rejected");

  auto huge_count = bytes;
  huge_count[31] = std::byte{0x7F};
  Reseal(huge_count);
  RequireStorageError([&] { (void)recallcpp::DecodeSnapshot(huge_count); }, "implausible counts must be rejected");
}

void ScenarioReferentialIntegrity() {
  recallcpp::tests::Log("scenario: referential integrity");
  auto orphan = SampleSnapshot();
  orphan.entries.push_back({8, 0, {1.0F, 0.0F}});
  const auto orphan_bytes = recallcpp::EncodeSnapshot(orphan);
  RequireStorageError([&] { (void)recallcpp::DecodeSnapshot(orphan_bytes); },
                      "entry for unknown document must be rejected");

  auto missing = SampleSnapshot();
  missing.entries.pop_back();
  const auto missing_bytes = recallcpp::EncodeSnapshot(missing);
  RequireStorageError([&] { (void)recallcpp::DecodeSnapshot(missing_bytes); },
                      "chunk_count without matching entries must be rejected");

  auto stale_counter = SampleSnapshot();
  stale_counter.next_document_id = 3;
  const auto stale_bytes = recallcpp::EncodeSnapshot(stale_counter);
  RequireStorageError([&] { (void)recallcpp::DecodeSnapshot(stale_bytes); },
                      "next_document_id must exceed every stored id");

  auto zero_vector = SampleSnapshot();
  zero_vector.entries[2].embedding = {0.0F, 0.0F};
  const auto zero_bytes = recallcpp::EncodeSnapshot(zero_vector);
  RequireStorageError([&] { (void)recallcpp::DecodeSnapshot(zero_bytes); },
                      "checksummed entry with a zero-norm embedding must be rejected");

  auto wrong_dims = SampleSnapshot();
  wrong_dims.entries[0].embedding.push_back(0.0F);
  RequireStorageError([&] { (void)recallcpp::EncodeSnapshot(wrong_dims); },
                      "encoding an entry of the wrong dimension must fail");
}

void ScenarioFileRoundTrip() {
  recallcpp::tests::Log("scenario: file write/read");
  const auto path = UniquePath("roundtrip");
  recallcpp::WriteSnapshotFile(path, SampleSnapshot());
  auto temp_path = path;
  temp_path += ".tmp";
  Require(std::filesystem::exists(path), "snapshot file must exist");
  Require(!std::filesystem::exists(temp_path), "temporary file must be renamed away");

  const auto loaded = recallcpp::ReadSnapshotFile(path);
  Require(loaded.documents.size() == 2 && loaded.entries.size() == 3, "file contents mismatch");

  {
    std::ofstream truncate(path, std::ios::binary | std::ios::trunc);
    truncate << "RCS1";
  }
  RequireStorageError([&] { (void)recallcpp::ReadSnapshotFile(path); }, "truncated file must be rejected");
  std::filesystem::remove(path);

  RequireStorageError([&] { (void)recallcpp::ReadSnapshotFile(UniquePath("missing")); },
                      "missing file must raise StorageError");
}

}  // namespace

int main() {
  try {
    recallcpp::tests::Log("snapshot_format_test: start");
    ScenarioEncodeDecode();
    ScenarioEmptySnapshot();
    ScenarioCorruptionIsDetected();
    ScenarioReferentialIntegrity();
    ScenarioFileRoundTrip();
    recallcpp::tests::Log("snapshot_format_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    recallcpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
