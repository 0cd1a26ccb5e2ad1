#include "util/UnixHttp.hpp"

#include <curl/curl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <memory>
#include <mutex>
#include <utility>

namespace puls::util {

UnixHttpClient::UnixHttpClient(std::string socket_path, int timeout_ms)
  : path_(std::move(socket_path)), timeout_ms_(timeout_ms) {}

const char* to_string(HttpError e) {
  switch (e) {
    case HttpError::None: return "ok";
    case HttpError::NoSocket: return "socket not found";
    case HttpError::Refused: return "connection refused";
    case HttpError::PermissionDenied: return "permission denied";
    case HttpError::Timeout: return "timed out";
    case HttpError::Protocol: return "malformed response";
  }
  return "unknown";
}

namespace {

std::once_flag g_curl_init;

struct EasyDeleter { void operator()(CURL* c) const { curl_easy_cleanup(c); } };
struct SlistDeleter { void operator()(curl_slist* l) const { curl_slist_free_all(l); } };

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

// libcurl reports every failed connect() the same way; tell the cases apart
// from the socket file itself.
HttpError classify_connect_failure(const std::string& path) {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) return HttpError::NoSocket;
  if (!S_ISSOCK(st.st_mode)) return HttpError::Refused;
  if (::access(path.c_str(), R_OK | W_OK) != 0 && (errno == EACCES || errno == EPERM))
    return HttpError::PermissionDenied;
  return HttpError::Refused;
}

} // namespace

std::optional<HttpResponse> UnixHttpClient::get(const std::string& target, HttpError& err) const {
  err = HttpError::None;
  if (path_.empty()) { err = HttpError::NoSocket; return std::nullopt; }

  std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

  std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
  if (!curl) {
    std::fprintf(stderr, "puls: http: curl_easy_init failed\n");
    err = HttpError::Protocol;
    return std::nullopt;
  }

  std::string url = "http://localhost" + target;
  std::string body;
  std::unique_ptr<curl_slist, SlistDeleter> headers(
      curl_slist_append(nullptr, "Accept: application/json"));

  curl_easy_setopt(curl.get(), CURLOPT_UNIX_SOCKET_PATH, path_.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl.get());
  switch (res) {
    case CURLE_OK: break;
    case CURLE_OPERATION_TIMEDOUT:
      err = HttpError::Timeout;
      return std::nullopt;
    case CURLE_COULDNT_CONNECT:
      err = classify_connect_failure(path_);
      return std::nullopt;
    default:
      err = HttpError::Protocol;
      return std::nullopt;
  }

  long code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
  if (code <= 0) { err = HttpError::Protocol; return std::nullopt; }
  return HttpResponse{static_cast<int>(code), std::move(body)};
}

} // namespace puls::util
