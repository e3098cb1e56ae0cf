#pragma once
#include "request_handler.hpp"
#include "resumable_fetcher.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace rangexfer {

/**
 * @brief HTTP front end of the fetcher
 *
 * GET /download/{fileName} brings {fileName} in the download directory up to
 * date with the Range Server and answers once the attempt is over. Requests
 * for the same name are serialized; different names run concurrently.
 */
class FetchService : public RequestHandler {
public:
  explicit FetchService(std::shared_ptr<ResumableFetcher> fetcher);

  ~FetchService() override = default;

  FetchService(const FetchService &) = delete;
  FetchService &operator=(const FetchService &) = delete;

  void handle(const HttpRequest &request, ResponseWriter &response) override;

private:
  std::shared_ptr<std::mutex> lockFor_(const std::string &identifier);

  std::shared_ptr<ResumableFetcher> fetcher_;
  std::mutex locks_mutex_;
  std::map<std::string, std::weak_ptr<std::mutex>> locks_;
};

} // namespace rangexfer
