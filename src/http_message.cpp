#include <range-transfer/http_message.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <vector>

namespace rangexfer {

namespace {

constexpr std::string_view CRLF = "\r\n";
constexpr std::string_view HEAD_TERMINATOR = "\r\n\r\n";
constexpr std::string_view HTTP_VERSION = "HTTP/1.1";

std::string_view trim(std::string_view value) {
  auto first = value.find_first_not_of(" \t");
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = value.find_last_not_of(" \t");
  return value.substr(first, last - first + 1);
}

bool isToken(std::string_view value) {
  return !value.empty() &&
         std::all_of(value.begin(), value.end(), [](unsigned char c) {
           return std::isalnum(c) || std::string_view("!#$%&'*+-.^_`|~").find(c) !=
                                         std::string_view::npos;
         });
}

std::vector<std::string_view> splitLines(std::string_view head) {
  auto end = head.find(HEAD_TERMINATOR);
  if (end != std::string_view::npos) {
    head = head.substr(0, end);
  }
  std::vector<std::string_view> lines;
  while (true) {
    auto pos = head.find(CRLF);
    lines.push_back(head.substr(0, pos));
    if (pos == std::string_view::npos) {
      break;
    }
    head.remove_prefix(pos + CRLF.size());
  }
  return lines;
}

HttpHeaders parseHeaderLines(const std::vector<std::string_view> &lines) {
  HttpHeaders headers;
  for (size_t i = 1; i < lines.size(); ++i) {
    auto line = lines[i];
    if (line.empty()) {
      continue;
    }
    if (line.front() == ' ' || line.front() == '\t') {
      throw HttpParseError("folded header line");
    }
    auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      throw HttpParseError("header line without ':'");
    }
    auto name = line.substr(0, colon);
    if (!isToken(name)) {
      throw HttpParseError("invalid header name '" + std::string(name) + "'");
    }
    auto value = std::string(trim(line.substr(colon + 1)));
    auto [it, inserted] = headers.try_emplace(std::string(name), value);
    if (!inserted) {
      it->second += ", " + value;
    }
  }
  return headers;
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

} // namespace

bool CaseInsensitiveLess::operator()(const std::string &a,
                                     const std::string &b) const {
  return std::lexicographical_compare(
      a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) <
               std::tolower(static_cast<unsigned char>(y));
      });
}

std::optional<std::string> headerValue(const HttpHeaders &headers,
                                       const std::string &name) {
  if (auto it = headers.find(name); it != headers.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::optional<uint64_t> contentLength(const HttpHeaders &headers) {
  auto value = headerValue(headers, header::CONTENT_LENGTH);
  if (!value) {
    return std::nullopt;
  }
  uint64_t length = 0;
  const char *first = value->data();
  const char *last = value->data() + value->size();
  auto [ptr, ec] = std::from_chars(first, last, length);
  if (value->empty() || ec != std::errc() || ptr != last) {
    throw HttpParseError("invalid Content-Length '" + *value + "'");
  }
  return length;
}

size_t findHeadEnd(std::string_view buffer) {
  auto pos = buffer.find(HEAD_TERMINATOR);
  if (pos == std::string_view::npos) {
    return std::string_view::npos;
  }
  return pos + HEAD_TERMINATOR.size();
}

HttpRequest parseRequestHead(std::string_view head) {
  auto lines = splitLines(head);
  auto request_line = lines.front();

  auto first_space = request_line.find(' ');
  auto last_space = request_line.rfind(' ');
  if (first_space == std::string_view::npos || first_space == last_space) {
    throw HttpParseError("invalid request line");
  }

  HttpRequest request;
  request.method = std::string(request_line.substr(0, first_space));
  request.target = std::string(
      request_line.substr(first_space + 1, last_space - first_space - 1));
  auto version = request_line.substr(last_space + 1);

  if (!isToken(request.method) || request.target.empty() ||
      request.target.find(' ') != std::string::npos ||
      !version.starts_with("HTTP/1.")) {
    throw HttpParseError("invalid request line");
  }

  request.headers = parseHeaderLines(lines);
  return request;
}

HttpResponseHead parseResponseHead(std::string_view head) {
  auto lines = splitLines(head);
  auto status_line = lines.front();

  if (!status_line.starts_with("HTTP/1.")) {
    throw HttpParseError("invalid status line");
  }
  auto first_space = status_line.find(' ');
  if (first_space == std::string_view::npos) {
    throw HttpParseError("invalid status line");
  }
  auto rest = status_line.substr(first_space + 1);
  auto code = rest.substr(0, rest.find(' '));

  HttpResponseHead response;
  auto [ptr, ec] =
      std::from_chars(code.data(), code.data() + code.size(), response.status);
  if (code.size() != 3 || ec != std::errc() ||
      ptr != code.data() + code.size()) {
    throw HttpParseError("invalid status code '" + std::string(code) + "'");
  }
  if (rest.size() > code.size()) {
    response.reason = std::string(trim(rest.substr(code.size() + 1)));
  }
  response.headers = parseHeaderLines(lines);
  return response;
}

std::string serializeRequest(const HttpRequest &request) {
  std::string out = request.method + " " + request.target + " " +
                    std::string(HTTP_VERSION) + std::string(CRLF);
  for (const auto &[name, value] : request.headers) {
    out += name + ": " + value + std::string(CRLF);
  }
  out += CRLF;
  return out;
}

std::string serializeResponseHead(const HttpResponseHead &response) {
  std::string reason =
      response.reason.empty() ? statusReason(response.status) : response.reason;
  std::string out = std::string(HTTP_VERSION) + " " +
                    std::to_string(response.status) + " " + reason +
                    std::string(CRLF);
  for (const auto &[name, value] : response.headers) {
    out += name + ": " + value + std::string(CRLF);
  }
  out += CRLF;
  return out;
}

const char *statusReason(int status_code) {
  switch (status_code) {
  case 200:
    return "OK";
  case 206:
    return "Partial Content";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 408:
    return "Request Timeout";
  case 416:
    return "Requested Range Not Satisfiable";
  case 431:
    return "Request Header Fields Too Large";
  case 500:
    return "Internal Server Error";
  case 502:
    return "Bad Gateway";
  case 503:
    return "Service Unavailable";
  default:
    return "Unknown";
  }
}

std::string percentDecode(std::string_view text) {
  std::string decoded;
  decoded.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '%') {
      decoded += text[i];
      continue;
    }
    if (i + 2 >= text.size()) {
      throw HttpParseError("truncated percent escape");
    }
    int high = hexValue(text[i + 1]);
    int low = hexValue(text[i + 2]);
    if (high < 0 || low < 0) {
      throw HttpParseError("invalid percent escape");
    }
    decoded += static_cast<char>(high * 16 + low);
    i += 2;
  }
  return decoded;
}

std::string percentEncode(std::string_view text) {
  static constexpr char HEX[] = "0123456789ABCDEF";
  std::string encoded;
  for (unsigned char c : text) {
    if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
      encoded += static_cast<char>(c);
    } else {
      encoded += '%';
      encoded += HEX[c >> 4];
      encoded += HEX[c & 0x0F];
    }
  }
  return encoded;
}

} // namespace rangexfer
