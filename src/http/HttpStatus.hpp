#pragma once

#include <string>

namespace http {

// Statuses the preview server can answer with.
enum Status {
  S_0_UNKNOWN = 0,
  S_200_OK = 200,
  S_400_BAD_REQUEST = 400,
  S_403_FORBIDDEN = 403,
  S_404_NOT_FOUND = 404,
  S_500_INTERNAL_SERVER_ERROR = 500,
  S_505_HTTP_VERSION_NOT_SUPPORTED = 505
};

std::string reasonPhrase(Status s);

// Numeric status and reason phrase, e.g. "404 Not Found".
std::string statusWithReason(Status s);

bool isSuccess(Status status);
bool isClientError(Status status);
bool isServerError(Status status);

}  // namespace http
