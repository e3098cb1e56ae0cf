#include <range-transfer/errors.hpp>
#include <range-transfer/fetch_service.hpp>
#include <range-transfer/logger.hpp>

#include <optional>

namespace rangexfer {

FetchService::FetchService(std::shared_ptr<ResumableFetcher> fetcher)
    : fetcher_(std::move(fetcher)) {}

std::shared_ptr<std::mutex>
FetchService::lockFor_(const std::string &identifier) {
  std::lock_guard lock(locks_mutex_);
  std::erase_if(locks_, [](const auto &entry) { return entry.second.expired(); });

  auto &slot = locks_[identifier];
  auto existing = slot.lock();
  if (existing) {
    return existing;
  }
  auto created = std::make_shared<std::mutex>();
  slot = created;
  return created;
}

void FetchService::handle(const HttpRequest &request,
                          ResponseWriter &response) {
  std::optional<std::string> identifier;
  try {
    identifier = downloadRouteIdentifier(request.target);
  } catch (const HttpParseError &) {
    writeTextResponse(response, status::BAD_REQUEST,
                      statusReason(status::BAD_REQUEST));
    return;
  }
  if (!identifier) {
    writeTextResponse(response, status::NOT_FOUND, "404 page not found");
    return;
  }
  if (request.method != "GET") {
    HttpResponseHead head;
    head.status = status::METHOD_NOT_ALLOWED;
    head.headers[header::ALLOW] = "GET";
    head.headers[header::CONTENT_LENGTH] = "0";
    response.writeHead(head);
    return;
  }
  if (!isValidIdentifier(*identifier)) {
    writeTextResponse(response, status::BAD_REQUEST,
                      statusReason(status::BAD_REQUEST));
    return;
  }

  FetchResult result{};
  {
    auto file_lock = lockFor_(*identifier);
    std::lock_guard serialized(*file_lock);
    try {
      result = fetcher_->fetchWithRetries(*identifier, response.stopToken());
    } catch (const CancelledError &) {
      Logger::log(LogLevel::WARN,
                  "Fetch of " + *identifier + " cancelled, client went away");
      if (!response.committed()) {
        writeTextResponse(response, status::INTERNAL_SERVER_ERROR,
                          "Transfer cancelled");
      }
      return;
    } catch (const UpstreamError &e) {
      Logger::log(LogLevel::ERROR, "Fetch of " + *identifier + " failed: " +
                                       e.what());
      HttpResponseHead head;
      head.status =
          e.status() >= status::BAD_REQUEST ? e.status() : status::BAD_GATEWAY;
      head.headers[header::CONTENT_TYPE] = "text/plain; charset=utf-8";
      head.headers[header::CONTENT_LENGTH] = std::to_string(e.body().size());
      response.writeHead(head);
      response.writeBody(e.body().data(), e.body().size());
      return;
    } catch (const std::exception &e) {
      Logger::log(LogLevel::ERROR, "Fetch of " + *identifier + " failed: " +
                                       e.what());
      writeTextResponse(response, status::INTERNAL_SERVER_ERROR, e.what());
      return;
    }
  }

  // Send failures from here on belong to the client connection.
  writeTextResponse(response, status::OK,
                    result.outcome == FetchOutcome::AlreadyComplete
                        ? "File already downloaded"
                        : "Download complete");
}

} // namespace rangexfer
