#ifndef STREAMFETCH_HTTP_CLIENT_HPP
#define STREAMFETCH_HTTP_CLIENT_HPP

// HTTP Client functionality
#include <streamfetch/http/client/client.hpp>               // client glue (get, post, head)
#include <streamfetch/http/client/transport.hpp>            // transport interface
#include <streamfetch/http/client/asio_transport.hpp>       // blocking Boost.Asio transport

// Common HTTP types needed by client
#include <streamfetch/http/common/errors.hpp>
#include <streamfetch/http/common/http_request.hpp>
#include <streamfetch/http/common/http_response.hpp>

#endif // STREAMFETCH_HTTP_CLIENT_HPP
