#include <range-transfer/fetch_service.hpp>
#include <range-transfer/range_server.hpp>
#include <range-transfer/resumable_fetcher.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <stop_token>
#include <string>

using test_support::LoopbackTransport;
using test_support::MemoryResponseWriter;
using test_support::TempDir;

class FetchServiceTest : public ::testing::Test {
protected:
  FetchServiceTest()
      : server_dir_("fetch_service_remote"), client_dir_("fetch_service_local") {}

  void SetUp() override {
    source_ = test_support::makeText(700000);
    test_support::writeFile(server_dir_ / "report.txt", source_);

    transport_ = std::make_shared<LoopbackTransport>(
        std::make_shared<rangexfer::RangeServer>(server_dir_.path()));
    rangexfer::FetcherConfig config;
    config.download_dir = client_dir_.path();
    service_ = std::make_unique<rangexfer::FetchService>(
        std::make_shared<rangexfer::ResumableFetcher>(transport_, config));
  }

  MemoryResponseWriter request(const std::string &target,
                               const std::string &method = "GET") {
    MemoryResponseWriter response;
    service_->handle(rangexfer::HttpRequest{method, target, {}}, response);
    return response;
  }

  TempDir server_dir_;
  TempDir client_dir_;
  std::string source_;
  std::shared_ptr<LoopbackTransport> transport_;
  std::unique_ptr<rangexfer::FetchService> service_;
};

TEST_F(FetchServiceTest, DownloadsThenReportsAlreadyDownloaded) {
  auto first = request("/download/report.txt");
  EXPECT_EQ(first.status(), 200);
  EXPECT_EQ(first.body(), "Download complete\n");
  EXPECT_TRUE(test_support::readFile(client_dir_ / "report.txt") == source_);

  auto second = request("/download/report.txt");
  EXPECT_EQ(second.status(), 200);
  EXPECT_EQ(second.body(), "File already downloaded\n");
}

TEST_F(FetchServiceTest, InvalidIdentifierIsBadRequest) {
  auto response = request("/download/..");

  EXPECT_EQ(response.status(), 400);
  EXPECT_TRUE(transport_->requests().empty());
  EXPECT_TRUE(std::filesystem::is_empty(client_dir_.path()));
}

TEST_F(FetchServiceTest, UpstreamFailureIsRelayed) {
  transport_->setTamper([](rangexfer::HttpResponseHead &head, std::string &body) {
    if (head.status == 206) {
      head = rangexfer::HttpResponseHead{};
      head.status = 503;
      head.headers["Content-Length"] = "12";
      body = "maintenance\n";
    }
  });

  auto response = request("/download/report.txt");

  EXPECT_EQ(response.status(), 503);
  EXPECT_EQ(response.body(), "maintenance\n");
  EXPECT_EQ(response.header("Content-Length"), "12");
}

TEST_F(FetchServiceTest, NonErrorUpstreamStatusBecomesBadGateway) {
  transport_->setTamper([](rangexfer::HttpResponseHead &head, std::string &) {
    if (head.status == 200) {
      head.status = 304;
    }
  });

  auto response = request("/download/report.txt");

  EXPECT_EQ(response.status(), 502);
}

TEST_F(FetchServiceTest, MissingRemoteFileIsServerError) {
  auto response = request("/download/absent.txt");

  EXPECT_EQ(response.status(), 500);
}

TEST_F(FetchServiceTest, ProtocolViolationIsInternalError) {
  transport_->setTamper([](rangexfer::HttpResponseHead &head, std::string &) {
    if (head.status == 206) {
      head.headers["Content-Range"] = "bytes 0-0/1";
    }
  });

  auto response = request("/download/report.txt");

  EXPECT_EQ(response.status(), 500);
  EXPECT_NE(response.body().find("Protocol violation"), std::string::npos);
}

TEST_F(FetchServiceTest, UnreachableServerIsInternalError) {
  transport_->setUnreachable(true);

  auto response = request("/download/report.txt");

  EXPECT_EQ(response.status(), 500);
}

TEST_F(FetchServiceTest, RoutingAndMethods) {
  EXPECT_EQ(request("/status").status(), 404);

  auto response = request("/download/report.txt", "POST");
  EXPECT_EQ(response.status(), 405);
  EXPECT_EQ(response.header("Allow"), "GET");

  EXPECT_EQ(request("/download/%zz").status(), 400);
}

TEST_F(FetchServiceTest, ClientGoneBeforeFetchStartsIsCancelled) {
  std::stop_source client;
  client.request_stop();
  MemoryResponseWriter response;
  response.setStopToken(client.get_token());

  service_->handle(rangexfer::HttpRequest{"GET", "/download/report.txt", {}},
                   response);

  EXPECT_EQ(response.status(), 500);
  EXPECT_EQ(response.body(), "Transfer cancelled\n");
  EXPECT_TRUE(transport_->requests().empty());
}

TEST_F(FetchServiceTest, FailedReplyAfterDownloadIsNotReportedAsFetchFailure) {
  MemoryResponseWriter response;
  response.failAfter(0);

  EXPECT_THROW(
      service_->handle(rangexfer::HttpRequest{"GET", "/download/report.txt", {}},
                       response),
      rangexfer::IoError);

  EXPECT_EQ(response.status(), 200);
  EXPECT_TRUE(response.body().empty());
  EXPECT_TRUE(test_support::readFile(client_dir_ / "report.txt") == source_);
}
