#include "page_fetcher.hpp"
#include "png_codec.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdio>

const char* fetch_error_kind_name(FetchError::Kind kind) {
  switch (kind) {
    case FetchError::Kind::Transport: return "transport";
    case FetchError::Kind::Timeout: return "timeout";
    case FetchError::Kind::HttpStatus: return "http-status";
    case FetchError::Kind::Decode: return "decode";
  }
  return "unknown";
}

std::string build_page_url(const std::string& base_url, const PageAddress& address) {
  char page[16];
  std::snprintf(page, sizeof(page), "%03d", address.page);
  std::string url = base_url;
  if (!url.empty() && url.back() == '/') url.pop_back();
  url += "/16_9_page-";
  url += page;
  if (address.sub_page) url += "." + std::to_string(*address.sub_page);
  url += ".png";
  return url;
}

static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

HttpPageFetcher::HttpPageFetcher(std::string base_url, long timeout_seconds)
    : base_url_(std::move(base_url)), timeout_seconds_(timeout_seconds) {
  curl_ = curl_easy_init();
  if (!curl_) spdlog::error("HttpPageFetcher: curl_easy_init failed");
}

HttpPageFetcher::~HttpPageFetcher() {
  if (curl_) curl_easy_cleanup(curl_);
}

bool HttpPageFetcher::download(const std::string& url, std::string& body, FetchError& err) {
  body.clear();
  if (!curl_) {
    err = {FetchError::Kind::Transport, 0, "fetch failed: http client unavailable"};
    return false;
  }
  char errbuf[CURL_ERROR_SIZE] = {0};
  curl_easy_reset(curl_);
  curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl_, CURLOPT_MAXREDIRS, 5L);
  curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_cb);
  curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(curl_, CURLOPT_USERAGENT, TV_USER_AGENT);
  curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds_);
  curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, timeout_seconds_);
  curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, errbuf);

  auto t0 = std::chrono::steady_clock::now();
  CURLcode rc = curl_easy_perform(curl_);
  long http_code = 0;
  curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();

  if (rc == CURLE_OPERATION_TIMEDOUT) {
    err = {FetchError::Kind::Timeout, 0,
           "fetch failed: timed out after " + std::to_string(timeout_seconds_) + "s"};
    spdlog::warn("fetch {}: timeout after {} ms", url, ms);
    return false;
  }
  if (rc != CURLE_OK) {
    std::string why = errbuf[0] ? errbuf : curl_easy_strerror(rc);
    err = {FetchError::Kind::Transport, 0, "fetch failed: " + why};
    spdlog::warn("fetch {}: curl error {} ({})", url, static_cast<int>(rc), why);
    return false;
  }
  if (http_code >= 400) {
    err = {FetchError::Kind::HttpStatus, http_code, "fetch failed: HTTP " + std::to_string(http_code)};
    spdlog::warn("fetch {}: HTTP {}", url, http_code);
    return false;
  }
  spdlog::info("fetch {}: HTTP {} ({} bytes, {} ms)", url, http_code, body.size(), ms);
  return true;
}

bool HttpPageFetcher::fetch(const PageAddress& address, PixelGrid& out, FetchError& err) {
  std::string url = build_page_url(base_url_, address);
  std::string body;
  if (!download(url, body, err)) return false;
  std::string msg;
  if (!decode_png(body, out, msg)) {
    err = {FetchError::Kind::Decode, 0, "decode failed: " + msg};
    spdlog::warn("page {}: {}", format_address(address), err.message);
    return false;
  }
  spdlog::debug("page {}: decoded {}x{}", format_address(address), out.width, out.height);
  return true;
}
