#ifndef STREAMFETCH_STREAM_HPP
#define STREAMFETCH_STREAM_HPP

#include <streamfetch/http_client.hpp>

// Streaming of ranged and segmented resources
#include <streamfetch/stream/stream_types.hpp>          // chunk_source, stream_options, defaults
#include <streamfetch/stream/endpoint.hpp>              // URL with editable query parameters
#include <streamfetch/stream/range_stream.hpp>          // byte-range window streaming
#include <streamfetch/stream/sequential_stream.hpp>     // sequence-numbered segment streaming
#include <streamfetch/stream/size_resolver.hpp>         // memoized resource sizes

#endif // STREAMFETCH_STREAM_HPP
