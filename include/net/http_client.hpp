#pragma once
#include <string>
#include <unordered_map>

struct HttpResponse {
  long status = 0;      // 0 when the request never completed
  std::string body;
  std::string error;    // transport error text when status == 0
};

using HttpHeaders = std::unordered_map<std::string, std::string>;

// Blocking GET transport used by the HTTP price feed.
class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse Get(const std::string& url, const HttpHeaders& headers, int timeout_ms) = 0;
};

struct HttpClientTuning {
  int connect_timeout_ms = 1000;
  bool tcp_keepalive = true;
  bool verify_tls = true;
  std::string user_agent = "lending-engine/1.0";
};

// libcurl-backed client. Caller owns the result.
HttpClient* CreateCurlHttpClient(const HttpClientTuning& tuning = HttpClientTuning{});
