#include "cdpgate/common/http.hpp"

#include "cdpgate/common/fs.hpp"
#include "cdpgate/common/json_util.hpp"

#include <curl/curl.h>

#include <mutex>

namespace cdpgate::common {

namespace {

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<std::unordered_map<std::string, std::string> *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = to_lower(trim(header.substr(0, separator)));
    (*headers)[key] = trim(header.substr(separator + 1));
  }

  return total;
}

void ensure_curl_initialized() {
  static std::once_flag once;
  std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

} // namespace

HttpResponse http_get(const std::string &url, const std::uint64_t timeout_ms) {
  ensure_curl_initialized();
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "cdpgate/0.1");

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  curl_easy_cleanup(curl);
  return response;
}

Result<std::string> discover_browser_ws_url(const std::string &host, const std::uint16_t port,
                                            const std::uint64_t timeout_ms) {
  const std::string url = "http://" + host + ":" + std::to_string(port) + "/json/version";
  const auto response = http_get(url, timeout_ms);
  if (response.network_error) {
    return Result<std::string>::failure("DevTools endpoint " + url +
                                        " unreachable: " + response.network_error_message);
  }
  if (response.status != 200) {
    return Result<std::string>::failure("DevTools endpoint " + url + " returned HTTP " +
                                        std::to_string(response.status));
  }
  const auto fields = json_parse_object(response.body);
  auto ws_url = json_string_field(fields, "webSocketDebuggerUrl");
  if (!ws_url.has_value() || ws_url->empty()) {
    return Result<std::string>::failure("DevTools endpoint did not report webSocketDebuggerUrl");
  }
  return Result<std::string>::success(std::move(*ws_url));
}

} // namespace cdpgate::common
