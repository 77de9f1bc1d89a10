#pragma once

#include <curl/curl.h>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

namespace mapwatch::util {

// Process-wide curl_global_init/cleanup. Create once in main before any thread uses curl.
class CurlGlobal {
public:
  CurlGlobal();
  ~CurlGlobal();
  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
  [[nodiscard]] bool ok() const { return ok_; }
private:
  bool ok_{false};
};

struct CurlEasyDeleter { void operator()(CURL* h) const { if (h) curl_easy_cleanup(h); } };
using CurlEasy = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlSlistDeleter { void operator()(curl_slist* l) const { if (l) curl_slist_free_all(l); } };
using CurlSlist = std::unique_ptr<curl_slist, CurlSlistDeleter>;

// Appends to the std::string passed as CURLOPT_WRITEDATA
size_t curl_write_string(char* ptr, size_t size, size_t nmemb, void* userdata);

// Routes transfer progress through the token: a stop request aborts the
// transfer with CURLE_ABORTED_BY_CALLBACK. The token must outlive the transfer.
void curl_bind_stop(CURL* h, const std::stop_token* st);

// application/x-www-form-urlencoded escaping
[[nodiscard]] std::string curl_escape(CURL* h, std::string_view s);

} // namespace mapwatch::util
