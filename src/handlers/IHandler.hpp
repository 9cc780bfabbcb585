#pragma once

class Connection;

enum HandlerResult { HR_DONE = 0, HR_WOULD_BLOCK = 1, HR_ERROR = -1 };

// Produces the response for one routed request.
// Handlers write the serialized head (and small bodies) into the
// connection's write buffer; large bodies are streamed from resume().
class IHandler {
 public:
  virtual ~IHandler() {}

  // Called once when the handler is installed.
  // Returns HR_DONE if the response is complete, HR_WOULD_BLOCK if resume()
  // has more to send after the write buffer drains, HR_ERROR on failure.
  virtual HandlerResult start(Connection& conn) = 0;

  // Continue after the socket became writable again.
  virtual HandlerResult resume(Connection& conn) = 0;
};
