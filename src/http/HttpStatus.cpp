#include "HttpStatus.hpp"

#include <sstream>

namespace http {

std::string reasonPhrase(Status status) {
  switch (status) {
    case S_200_OK:
      return "OK";
    case S_400_BAD_REQUEST:
      return "Bad Request";
    case S_403_FORBIDDEN:
      return "Forbidden";
    case S_404_NOT_FOUND:
      return "Not Found";
    case S_500_INTERNAL_SERVER_ERROR:
      return "Internal Server Error";
    case S_505_HTTP_VERSION_NOT_SUPPORTED:
      return "HTTP Version Not Supported";
    case S_0_UNKNOWN:
      break;
  }
  return "";
}

std::string statusWithReason(Status s) {
  std::ostringstream oss;
  oss << static_cast<int>(s);
  std::string reason = reasonPhrase(s);
  if (!reason.empty()) {
    oss << " " << reason;
  }
  return oss.str();
}

bool isSuccess(Status s) {
  return s >= 200 && s <= 299;
}

bool isClientError(Status s) {
  return s >= 400 && s <= 499;
}

bool isServerError(Status s) {
  return s >= 500 && s <= 599;
}

}  // namespace http
