#pragma once

#define DEFAULT_CONFIG_NAME "nginx.conf"
#define MAX_CONFIG_MATCHES 50  // recursive lookup stops collecting after this
#define DEFAULT_LISTEN_HOST "0.0.0.0"
#define DEFAULT_LISTEN_PORT 80

#define DEFAULT_INDEX_PRIMARY "index.html"
#define DEFAULT_INDEX_SECONDARY "index.htm"

#define CRLF "\r\n"
#define HTTP_VERSION "HTTP/1.1"

#define LISTEN_BACKLOG 128
#define MAX_EVENTS 64
#define WRITE_BUF_SIZE 4096
#define MAX_HEADER_SIZE 16384  // Requests with larger headers get a 400
