#include "net/http_client.hpp"
#include "common/logger.hpp"
#include <curl/curl.h>
#include <memory>

namespace {

struct EasyDeleter {
  void operator()(CURL* h) const { curl_easy_cleanup(h); }
};
struct SlistDeleter {
  void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

size_t AppendBody(char* data, size_t size, size_t count, void* target) {
  static_cast<std::string*>(target)->append(data, size * count);
  return size * count;
}

HeaderList BuildHeaders(const HttpHeaders& headers) {
  curl_slist* list = nullptr;
  for (const auto& kv : headers) {
    curl_slist* grown = curl_slist_append(list, (kv.first + ": " + kv.second).c_str());
    if (!grown) break;
    list = grown;
  }
  return HeaderList(list);
}

}

class CurlHttpClient : public HttpClient {
public:
  explicit CurlHttpClient(const HttpClientTuning& tuning) : tuning_(tuning) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
  }
  ~CurlHttpClient() override { curl_global_cleanup(); }

  HttpResponse Get(const std::string& url, const HttpHeaders& headers, int timeout_ms) override {
    HttpResponse out;
    EasyHandle h(curl_easy_init());
    if (!h) {
      out.error = "curl_easy_init failed";
      Logger::Error(out.error);
      return out;
    }
    const HeaderList header_list = BuildHeaders(headers);
    std::string body;
    CURL* c = h.get();
    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(c, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(c, CURLOPT_USERAGENT, tuning_.user_agent.c_str());
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, AppendBody);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(c, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(tuning_.connect_timeout_ms));
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);  // worker threads
    curl_easy_setopt(c, CURLOPT_TCP_KEEPALIVE, tuning_.tcp_keepalive ? 1L : 0L);
    curl_easy_setopt(c, CURLOPT_SSL_VERIFYPEER, tuning_.verify_tls ? 1L : 0L);
    curl_easy_setopt(c, CURLOPT_SSL_VERIFYHOST, tuning_.verify_tls ? 2L : 0L);

    const CURLcode rc = curl_easy_perform(c);
    if (rc != CURLE_OK) {
      out.error = curl_easy_strerror(rc);
      Logger::Error("GET " + url + " failed: " + out.error);
      return out;
    }
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &out.status);
    out.body = std::move(body);
    return out;
  }

private:
  HttpClientTuning tuning_;
};

HttpClient* CreateCurlHttpClient(const HttpClientTuning& tuning) {
  return new CurlHttpClient(tuning);
}
