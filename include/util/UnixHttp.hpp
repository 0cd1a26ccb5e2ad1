#pragma once
#include <optional>
#include <string>

namespace puls::util {

enum class HttpError {
  None,
  NoSocket,          // socket path missing
  Refused,           // nothing listening
  PermissionDenied,  // socket not accessible to this user
  Timeout,
  Protocol           // malformed or truncated response
};

struct HttpResponse {
  int status{0};
  std::string body;
};

// HTTP GET over an AF_UNIX stream socket, carried by libcurl.
class UnixHttpClient {
public:
  UnixHttpClient(std::string socket_path, int timeout_ms);

  [[nodiscard]] std::optional<HttpResponse> get(const std::string& target, HttpError& err) const;

  const std::string& socket_path() const { return path_; }

private:
  std::string path_;
  int timeout_ms_;
};

const char* to_string(HttpError e);

} // namespace puls::util
