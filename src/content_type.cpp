#include <range-transfer/constants.hpp>
#include <range-transfer/content_type.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <unordered_map>
#include <vector>

namespace rangexfer {

namespace {

const std::unordered_map<std::string, std::string> &extensionTable() {
  static const std::unordered_map<std::string, std::string> table = {
      {".avif", "image/avif"},
      {".css", "text/css"},
      {".csv", "text/csv"},
      {".gif", "image/gif"},
      {".gz", "application/gzip"},
      {".htm", "text/html"},
      {".html", "text/html"},
      {".ico", "image/x-icon"},
      {".jpeg", "image/jpeg"},
      {".jpg", "image/jpeg"},
      {".js", "text/javascript"},
      {".json", "application/json"},
      {".mjs", "text/javascript"},
      {".mp3", "audio/mpeg"},
      {".mp4", "video/mp4"},
      {".pdf", "application/pdf"},
      {".png", "image/png"},
      {".svg", "image/svg+xml"},
      {".tar", "application/x-tar"},
      {".txt", "text/plain"},
      {".wasm", "application/wasm"},
      {".webm", "video/webm"},
      {".webp", "image/webp"},
      {".xml", "text/xml"},
      {".zip", "application/zip"},
      {".md", "text/markdown"},
      {".jsx", "application/javascript"},
      {".tsx", "application/javascript"},
      {".yaml", "application/yaml"},
      {".yml", "application/yaml"},
  };
  return table;
}

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

bool startsWithIgnoreCase(std::string_view data, std::string_view prefix) {
  if (data.size() < prefix.size()) {
    return false;
  }
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(data[i])) !=
        std::tolower(static_cast<unsigned char>(prefix[i]))) {
      return false;
    }
  }
  return true;
}

bool isBinaryControl(unsigned char c) {
  return c <= 0x08 || c == 0x0B || (c >= 0x0E && c <= 0x1A) ||
         (c >= 0x1C && c <= 0x1F);
}

} // namespace

std::optional<std::string>
contentTypeByExtension(const std::string &file_name) {
  auto extension = toLower(std::filesystem::path(file_name).extension().string());
  if (extension.empty()) {
    return std::nullopt;
  }
  const auto &table = extensionTable();
  auto it = table.find(extension);
  if (it == table.end()) {
    return std::nullopt;
  }
  return it->second.substr(0, it->second.find(';'));
}

std::string sniffContentType(std::string_view data) {
  struct Signature {
    std::string_view prefix;
    const char *type;
  };
  static constexpr std::array<Signature, 8> signatures{{
      {"%PDF-", "application/pdf"},
      {"\x89PNG\r\n\x1a\n", "image/png"},
      {"GIF87a", "image/gif"},
      {"GIF89a", "image/gif"},
      {"\xFF\xD8\xFF", "image/jpeg"},
      {"PK\x03\x04", "application/zip"},
      {"\x1F\x8B\x08", "application/x-gzip"},
      {"\xFE\xFF", "text/plain; charset=utf-16be"},
  }};

  for (const auto &signature : signatures) {
    if (data.starts_with(signature.prefix)) {
      return signature.type;
    }
  }
  if (data.starts_with("\xFF\xFE")) {
    return "text/plain; charset=utf-16le";
  }
  if (data.starts_with("\xEF\xBB\xBF")) {
    return "text/plain; charset=utf-8";
  }

  auto first = data.find_first_not_of("\t\n\x0C\r ");
  if (first != std::string_view::npos) {
    auto text = data.substr(first);
    for (std::string_view tag : {"<!DOCTYPE HTML", "<HTML", "<HEAD", "<BODY",
                                 "<SCRIPT", "<TITLE", "<TABLE", "<DIV", "<P"}) {
      if (startsWithIgnoreCase(text, tag) && text.size() > tag.size() &&
          (text[tag.size()] == ' ' || text[tag.size()] == '>')) {
        return "text/html; charset=utf-8";
      }
    }
    if (text.starts_with("<?xml")) {
      return "text/xml; charset=utf-8";
    }
  }

  if (data.empty() ||
      std::any_of(data.begin(), data.end(), [](char c) {
        return isBinaryControl(static_cast<unsigned char>(c));
      })) {
    return "application/octet-stream";
  }
  return "text/plain; charset=utf-8";
}

std::string classifyContentType(const std::string &file_name,
                                std::istream &content) {
  if (auto by_extension = contentTypeByExtension(file_name)) {
    return *by_extension;
  }

  auto position = content.tellg();
  if (position == std::streampos(-1)) {
    return "application/octet-stream";
  }

  std::vector<char> head(constants::compression::SNIFF_LENGTH);
  content.read(head.data(), static_cast<std::streamsize>(head.size()));
  auto count = content.gcount();

  content.clear();
  content.seekg(position);

  if (count <= 0 || !content) {
    return "application/octet-stream";
  }
  return sniffContentType(std::string_view(head.data(), static_cast<size_t>(count)));
}

bool isCompressibleType(std::string_view content_type) {
  static constexpr std::array<std::string_view, 5> compressible{
      "text/", "application/json", "application/xml",
      "application/javascript", "application/x-javascript"};
  return std::any_of(compressible.begin(), compressible.end(),
                     [content_type](std::string_view t) {
                       return content_type.find(t) != std::string_view::npos;
                     });
}

} // namespace rangexfer
