#include <range-transfer/constants.hpp>
#include <range-transfer/request_handler.hpp>

#include <string_view>

namespace rangexfer {

void writeTextResponse(ResponseWriter &response, int status_code,
                       const std::string &text, bool head_only) {
  std::string body = text + "\n";

  HttpResponseHead head;
  head.status = status_code;
  head.headers[header::CONTENT_TYPE] = "text/plain; charset=utf-8";
  head.headers[header::CONTENT_TYPE_OPTIONS] = "nosniff";
  head.headers[header::CONTENT_LENGTH] = std::to_string(body.size());

  response.writeHead(head);
  if (!head_only) {
    response.writeBody(body.data(), body.size());
  }
}

std::optional<std::string> downloadRouteIdentifier(const std::string &target) {
  std::string_view path = target;
  path = path.substr(0, path.find('?'));

  std::string_view route = constants::http::DOWNLOAD_ROUTE;
  if (!path.starts_with(route)) {
    return std::nullopt;
  }
  path.remove_prefix(route.size());
  if (path.empty() || path.find('/') != std::string_view::npos) {
    return std::nullopt;
  }
  return percentDecode(path);
}

} // namespace rangexfer
