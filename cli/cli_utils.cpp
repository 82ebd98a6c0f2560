#include "cli_utils.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#ifdef PARTIALJSON_USE_CURL
#include <curl/curl.h>
#endif

namespace partialjson::cli {

namespace {

#ifdef PARTIALJSON_USE_CURL
size_t append_body(void* contents, size_t size, size_t nmemb, void* userp) {
  size_t total = size * nmemb;
  auto* out = static_cast<std::string*>(userp);
  out->append(static_cast<const char*>(contents), total);
  return total;
}

std::string fetch_url(const std::string& url, int timeout_ms) {
  CURL* curl = curl_easy_init();
  if (!curl) {
    throw std::runtime_error("Failed to initialize curl");
  }
  std::string buffer;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "partialjson/0.1");
  curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
  CURLcode res = curl_easy_perform(curl);
  curl_easy_cleanup(curl);
  if (res != CURLE_OK) {
    throw std::runtime_error(std::string("Failed to fetch URL: ") + curl_easy_strerror(res));
  }
  return buffer;
}
#endif

}  // namespace

std::string read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

std::string read_stdin() {
  std::ostringstream buffer;
  buffer << std::cin.rdbuf();
  return buffer.str();
}

bool is_url(const std::string& value) {
  return value.rfind("http://", 0) == 0 || value.rfind("https://", 0) == 0;
}

std::string load_input(const std::string& input, int timeout_ms) {
  if (input.empty()) {
    return read_stdin();
  }
  if (is_url(input)) {
#ifdef PARTIALJSON_USE_CURL
    return fetch_url(input, timeout_ms);
#else
    (void)timeout_ms;
    throw std::runtime_error("URL fetching is disabled (libcurl not available)");
#endif
  }
  return read_file(input);
}

}  // namespace partialjson::cli
