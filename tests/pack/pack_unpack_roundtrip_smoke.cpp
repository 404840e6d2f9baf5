#include "pack/packer.hpp"
#include "store/object_store.hpp"
#include "unpack/unpacker.hpp"
#include "../common/assertions.hpp"
#include "../common/store_fixtures.hpp"
#include "../common/temp_dir.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {

using lfspack::tests::common::AssertContains;
using lfspack::tests::common::AssertTrue;
using lfspack::tests::common::Fail;
using lfspack::tests::common::SampleOid;
using lfspack::tests::common::WriteFileOrFail;

constexpr std::uint64_t kMaxBinBytes = 4096;

std::size_t CountDirectoryEntries(const fs::path& dir) {
  std::size_t count = 0;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    (void)entry;
    ++count;
  }
  return count;
}

} // namespace

int main() {
  const fs::path root = lfspack::tests::common::CreateUniqueTempDir("lfspack-pack-unpack");
  const fs::path store_root = root / "source" / ".git" / "lfs";
  const fs::path out_dir = root / "packed";

  const std::vector<std::uint64_t> sizes = {1000, 3000, 500, kMaxBinBytes, 2000, 100, 4000};
  lfspack::tests::common::WriteSampleStore(store_root, sizes);
  // Neither of these is an object.
  WriteFileOrFail(store_root / "objects" / "README", "not an object\n");
  WriteFileOrFail(store_root / "objects" / "00" / "00" / (SampleOid(0) + ".tmp.1.2"), "partial");

  lfspack::store::ScanResult scan;
  std::string error;
  if (!lfspack::store::ScanObjectStore(store_root, scan, error)) {
    Fail("ScanObjectStore failed: " + error);
  }
  AssertTrue(scan.objects.size() == sizes.size(), "scan should find every object");
  AssertTrue(scan.ignored.size() == 1U, "scan should ignore the stray file");
  for (std::size_t i = 0; i < scan.objects.size(); ++i) {
    AssertTrue(scan.objects[i].oid == SampleOid(i), "scan order should follow object paths");
    AssertTrue(scan.objects[i].size_bytes == sizes[i], "scan size mismatch");
  }

  lfspack::pack::PackOptions options;
  options.output_dir = out_dir;
  options.max_bin_bytes = kMaxBinBytes;
  std::ostringstream log_stream;
  lfspack::core::logging::Logger logger(lfspack::core::logging::LogLevel::kInfo, log_stream);
  options.logger = &logger;

  lfspack::pack::PackResult packed;
  if (!lfspack::pack::PackObjects(scan.objects, options, packed, error)) {
    Fail("PackObjects failed: " + error);
  }
  AssertTrue(packed.archives.size() == 3U, "expected three archives");
  AssertTrue(packed.pack_count == 6U, "expected six packed objects");
  AssertTrue(packed.skipped.size() == 1U && packed.skipped[0].oid == SampleOid(3),
             "object at the bound should be skipped");
  AssertContains(log_stream.str(), SampleOid(3));
  for (std::size_t i = 0; i < packed.archives.size(); ++i) {
    const auto& record = packed.archives[i];
    AssertTrue(record.number == i + 1U, "archives must be numbered from one");
    AssertTrue(record.payload_bytes <= kMaxBinBytes, "archive payload over bound");
    AssertTrue(record.path == out_dir / lfspack::pack::ArchiveFileName(record.number),
               "unexpected archive path");
    AssertTrue(fs::exists(record.path), "archive missing: " + record.path.string());
  }
  AssertTrue(CountDirectoryEntries(out_dir) == 3U, "only compressed archives should remain");

  // Decoys next to real archives are not picked up.
  WriteFileOrFail(out_dir / "lfspack-x.tar.gz", "decoy");
  WriteFileOrFail(out_dir / "other.tar.gz", "decoy");
  WriteFileOrFail(out_dir / "lfspack-0.tar.gz", "decoy");

  std::vector<fs::path> archives;
  if (!lfspack::unpack::FindPackArchives(out_dir, archives, error)) {
    Fail("FindPackArchives failed: " + error);
  }
  AssertTrue(archives.size() == 3U, "expected three archives to unpack");
  AssertTrue(archives[2].filename() == "lfspack-3.tar.gz", "archives should be sorted by number");

  const fs::path restore_root = root / "clone" / ".git" / "lfs";
  lfspack::unpack::UnpackResult result;
  if (!lfspack::unpack::UnpackArchives(archives, restore_root, &logger, result, error)) {
    Fail("UnpackArchives failed: " + error);
  }
  AssertTrue(result.restored == packed.pack_count, "every packed object should be restored");
  for (std::size_t i = 0; i < sizes.size(); ++i) {
    const fs::path restored = restore_root / lfspack::store::RelativeObjectPath(SampleOid(i));
    if (i == 3U) {
      AssertTrue(!fs::exists(restored), "skipped object must not be restored");
      continue;
    }
    lfspack::tests::common::AssertSampleObjectRestored(restore_root, i, sizes[i]);
  }

  // Rerunning is a no-op for objects already in place.
  if (!lfspack::unpack::UnpackArchives(archives, restore_root, nullptr, result, error)) {
    Fail("second UnpackArchives failed: " + error);
  }
  AssertTrue(result.restored == 0U, "second run should write nothing");
  AssertTrue(result.already_present == packed.pack_count, "second run should find every object");

  // One corrupt archive does not stop the others.
  WriteFileOrFail(archives[0], std::string(1024, 'z'));
  const fs::path partial_root = root / "partial" / ".git" / "lfs";
  if (lfspack::unpack::UnpackArchives(archives, partial_root, nullptr, result, error)) {
    Fail("corrupt archive should fail the run");
  }
  AssertContains(error, "1 of 3 archives failed");
  AssertContains(error, "lfspack-1.tar.gz");
  AssertTrue(result.failures.size() == 1U, "exactly one failure expected");
  AssertTrue(result.restored == 4U, "healthy archives should still be restored");

  // Nothing to pack leaves no files behind.
  const fs::path empty_out = root / "empty-out";
  options.output_dir = empty_out;
  if (!lfspack::pack::PackObjects({}, options, packed, error)) {
    Fail("PackObjects on empty input failed: " + error);
  }
  AssertTrue(packed.archives.empty() && packed.pack_count == 0U, "empty pack should be empty");
  AssertTrue(!fs::exists(empty_out), "empty pack should not create its output directory");

  lfspack::tests::common::RemovePathBestEffort(root);
  std::cout << "pack_unpack_roundtrip_smoke: ok\n";
  return 0;
}
