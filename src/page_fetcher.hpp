#pragma once
/*
 * PageFetcher
 *
 * Purpose: build the page image locator and download + decode one page.
 * Design: IPageSource is the seam the frame driver uses; tests inject fakes.
 * Constraint: single blocking request, bounded timeout, no retries.
 */
#include <string>
#include "config.hpp"
#include "image.hpp"
#include "types.hpp"

typedef void CURL;

struct FetchError {
  enum class Kind { Transport, Timeout, HttpStatus, Decode };
  Kind kind = Kind::Transport;
  long http_status = 0;
  std::string message;
};

const char* fetch_error_kind_name(FetchError::Kind kind);

class IPageSource {
public:
  virtual ~IPageSource() = default;
  virtual bool fetch(const PageAddress& address, PixelGrid& out, FetchError& err) = 0;
};

// <base>/16_9_page-NNN[.P].png
std::string build_page_url(const std::string& base_url, const PageAddress& address);

class HttpPageFetcher : public IPageSource {
public:
  explicit HttpPageFetcher(std::string base_url = TV_IMAGE_BASE_URL,
                           long timeout_seconds = TV_FETCH_TIMEOUT_SECONDS);
  ~HttpPageFetcher() override;
  HttpPageFetcher(const HttpPageFetcher&) = delete;
  HttpPageFetcher& operator=(const HttpPageFetcher&) = delete;

  bool fetch(const PageAddress& address, PixelGrid& out, FetchError& err) override;
  bool download(const std::string& url, std::string& body, FetchError& err);

private:
  std::string base_url_;
  long timeout_seconds_;
  CURL* curl_ = nullptr;
};
