#include "util/Curl.hpp"
#include "util/Log.hpp"

namespace mapwatch::util {

CurlGlobal::CurlGlobal() {
  CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
  ok_ = (rc == CURLE_OK);
  if (!ok_) util::log(util::LogLevel::Error, "curl: global init failed: %s", curl_easy_strerror(rc));
}

CurlGlobal::~CurlGlobal() {
  if (ok_) curl_global_cleanup();
}

size_t curl_write_string(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

static int stop_progress_cb(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto* st = static_cast<const std::stop_token*>(clientp);
  return (st && st->stop_requested()) ? 1 : 0;
}

void curl_bind_stop(CURL* h, const std::stop_token* st) {
  curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, stop_progress_cb);
  curl_easy_setopt(h, CURLOPT_XFERINFODATA, const_cast<std::stop_token*>(st));
  curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
}

std::string curl_escape(CURL* h, std::string_view s) {
  char* esc = curl_easy_escape(h, s.data(), static_cast<int>(s.size()));
  if (!esc) return {};
  std::string out(esc);
  curl_free(esc);
  return out;
}

} // namespace mapwatch::util
