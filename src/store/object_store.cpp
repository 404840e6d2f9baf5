#include "store/object_store.hpp"

#include "core/fs_utils.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace lfspack::store {

namespace {

constexpr std::size_t kOidLength = 64;

bool IsLowerHex(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

} // namespace

bool IsValidOid(std::string_view oid) {
  if (oid.size() != kOidLength) {
    return false;
  }
  return std::all_of(oid.begin(), oid.end(), IsLowerHex);
}

std::string RelativeObjectPath(std::string_view oid) {
  std::string path = "objects/";
  path.append(oid.substr(0, 2));
  path.push_back('/');
  path.append(oid.substr(2, 2));
  path.push_back('/');
  path.append(oid);
  return path;
}

bool ScanObjectStore(const fs::path& store_root, ScanResult& result, std::string& error) {
  result = ScanResult{};

  if (store_root.empty()) {
    error = "object store path cannot be empty";
    return false;
  }

  std::error_code ec;
  if (!fs::exists(store_root, ec) || ec) {
    error = "object store not found: " + store_root.string();
    return false;
  }
  if (!fs::is_directory(store_root, ec) || ec) {
    error = "object store path must be a directory: " + store_root.string();
    return false;
  }

  const fs::path objects_dir = store_root / "objects";
  if (!fs::exists(objects_dir, ec) || ec) {
    return true;
  }

  fs::recursive_directory_iterator it(objects_dir, ec);
  if (ec) {
    error = "failed to open object directory '" + objects_dir.string() + "': " + ec.message();
    return false;
  }
  const fs::recursive_directory_iterator end;
  for (; it != end; it.increment(ec)) {
    if (ec) {
      error = "failed while enumerating object store: " + objects_dir.string() + ": " +
              ec.message();
      return false;
    }
    if (!it->is_regular_file(ec) || ec) {
      ec.clear();
      continue;
    }

    const fs::path& path = it->path();
    if (core::IsAtomicTempPath(path)) {
      continue;
    }

    const std::string oid = path.filename().string();
    const std::string relative = fs::relative(path, store_root, ec).generic_string();
    if (ec) {
      error = "failed to compute object path relative to store: " + path.string();
      return false;
    }
    if (!IsValidOid(oid) || relative != RelativeObjectPath(oid)) {
      result.ignored.push_back(path);
      continue;
    }

    ObjectEntry entry;
    entry.path = path;
    entry.relative_path = relative;
    entry.oid = oid;
    entry.size_bytes = static_cast<std::uint64_t>(it->file_size(ec));
    if (ec) {
      error = "failed to read object size: " + path.string() + ": " + ec.message();
      return false;
    }
    result.objects.push_back(std::move(entry));
  }

  if (ec) {
    error = "failed while enumerating object store: " + objects_dir.string() + ": " +
            ec.message();
    return false;
  }

  std::sort(result.objects.begin(), result.objects.end(),
            [](const ObjectEntry& lhs, const ObjectEntry& rhs) {
              return lhs.relative_path < rhs.relative_path;
            });
  std::sort(result.ignored.begin(), result.ignored.end());
  return true;
}

} // namespace lfspack::store
