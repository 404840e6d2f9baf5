#include "artifacts/pack_manifest.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <fstream>
#include <iterator>
#include <sstream>

namespace fs = std::filesystem;

namespace lfspack::artifacts {

namespace {

namespace json = core::json;

bool ReadUnsignedField(const json::Value& object, std::string_view key, std::uint64_t& out,
                       std::string& error) {
  const json::Value* value = json::FindMember(object, key, json::Value::Type::kNumber, error);
  if (value == nullptr) {
    return false;
  }
  if (!json::AsUnsigned(*value, out, error)) {
    error = "field '" + std::string(key) + "': " + error;
    return false;
  }
  return true;
}

bool ReadStringField(const json::Value& object, std::string_view key, std::string& out,
                     std::string& error) {
  const json::Value* value = json::FindMember(object, key, json::Value::Type::kString, error);
  if (value == nullptr) {
    return false;
  }
  out = value->string_value;
  return true;
}

} // namespace

PackManifest BuildPackManifest(const pack::PackResult& result, std::string source_branch) {
  PackManifest manifest;
  manifest.source_branch = std::move(source_branch);
  manifest.max_bin_bytes = result.max_bin_bytes;
  manifest.pack_count = result.pack_count;

  for (const auto& archive : result.archives) {
    ManifestArchive entry;
    entry.name = archive.path.filename().string();
    entry.objects = archive.object_count;
    entry.payload_bytes = archive.payload_bytes;
    manifest.archives.push_back(std::move(entry));
  }
  for (const auto& object : result.skipped) {
    manifest.skipped.push_back(ManifestSkipped{object.oid, object.size_bytes});
  }
  return manifest;
}

std::string ToJson(const PackManifest& manifest) {
  std::ostringstream out;
  out << "{\n"
      << "  \"schema_version\":" << json::QuoteString(manifest.schema_version) << ",\n"
      << "  \"source_branch\":" << json::QuoteString(manifest.source_branch) << ",\n"
      << "  \"max_bin_bytes\":" << manifest.max_bin_bytes << ",\n"
      << "  \"pack_count\":" << manifest.pack_count << ",\n"
      << "  \"archives\":[";

  for (std::size_t i = 0; i < manifest.archives.size(); ++i) {
    const auto& archive = manifest.archives[i];
    out << (i == 0U ? "\n" : ",\n")
        << "    {\"name\":" << json::QuoteString(archive.name) << ","
        << "\"objects\":" << archive.objects << ","
        << "\"payload_bytes\":" << archive.payload_bytes << "}";
  }
  out << (manifest.archives.empty() ? "],\n" : "\n  ],\n") << "  \"skipped\":[";

  for (std::size_t i = 0; i < manifest.skipped.size(); ++i) {
    const auto& skipped = manifest.skipped[i];
    out << (i == 0U ? "\n" : ",\n")
        << "    {\"oid\":" << json::QuoteString(skipped.oid) << ","
        << "\"size_bytes\":" << skipped.size_bytes << "}";
  }
  out << (manifest.skipped.empty() ? "]\n" : "\n  ]\n") << "}\n";
  return out.str();
}

bool WritePackManifest(const fs::path& output_dir, const PackManifest& manifest,
                       fs::path& written_path, std::string& error) {
  if (!core::EnsureDirectory(output_dir, error)) {
    return false;
  }
  written_path = output_dir / std::string(kManifestFileName);
  return core::WriteTextFileAtomic(written_path, ToJson(manifest), error);
}

bool ParsePackManifest(std::string_view text, PackManifest& manifest, std::string& error) {
  manifest = PackManifest{};

  json::Value root;
  if (!json::Parse(text, root, error)) {
    return false;
  }
  if (root.type != json::Value::Type::kObject) {
    error = "pack manifest must be a JSON object";
    return false;
  }

  if (!ReadStringField(root, "schema_version", manifest.schema_version, error)) {
    return false;
  }
  if (manifest.schema_version != kManifestSchemaVersion) {
    error = "unsupported pack manifest schema_version: " + manifest.schema_version;
    return false;
  }
  if (!ReadStringField(root, "source_branch", manifest.source_branch, error) ||
      !ReadUnsignedField(root, "max_bin_bytes", manifest.max_bin_bytes, error) ||
      !ReadUnsignedField(root, "pack_count", manifest.pack_count, error)) {
    return false;
  }
  if (manifest.source_branch.empty()) {
    error = "field 'source_branch' cannot be empty";
    return false;
  }

  const json::Value* archives =
      json::FindMember(root, "archives", json::Value::Type::kArray, error);
  if (archives == nullptr) {
    return false;
  }
  std::uint64_t objects_in_archives = 0;
  for (const auto& item : archives->array_value) {
    ManifestArchive archive;
    if (!ReadStringField(item, "name", archive.name, error) ||
        !ReadUnsignedField(item, "objects", archive.objects, error) ||
        !ReadUnsignedField(item, "payload_bytes", archive.payload_bytes, error)) {
      error = "archives[" + std::to_string(manifest.archives.size()) + "]: " + error;
      return false;
    }
    objects_in_archives += archive.objects;
    manifest.archives.push_back(std::move(archive));
  }
  if (objects_in_archives != manifest.pack_count) {
    error = "pack_count " + std::to_string(manifest.pack_count) +
            " does not match archive object total " + std::to_string(objects_in_archives);
    return false;
  }

  const json::Value* skipped = json::FindMember(root, "skipped", json::Value::Type::kArray, error);
  if (skipped == nullptr) {
    return false;
  }
  for (const auto& item : skipped->array_value) {
    ManifestSkipped entry;
    if (!ReadStringField(item, "oid", entry.oid, error) ||
        !ReadUnsignedField(item, "size_bytes", entry.size_bytes, error)) {
      error = "skipped[" + std::to_string(manifest.skipped.size()) + "]: " + error;
      return false;
    }
    manifest.skipped.push_back(std::move(entry));
  }

  return true;
}

bool LoadPackManifest(const fs::path& manifest_path, PackManifest& manifest, std::string& error) {
  std::ifstream input(manifest_path, std::ios::binary);
  if (!input) {
    error = "pack manifest not found: " + manifest_path.string();
    return false;
  }
  const std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
  if (!ParsePackManifest(text, manifest, error)) {
    error = manifest_path.filename().string() + ": " + error;
    return false;
  }
  return true;
}

} // namespace lfspack::artifacts
