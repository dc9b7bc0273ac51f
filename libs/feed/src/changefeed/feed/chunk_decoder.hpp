#pragma once

#include <changefeed/config.hpp>
#include <changefeed/core/result.hpp>
#include <changefeed/feed/event.hpp>

#include <cstdint>
#include <memory>
#include <string_view>

CHANGEFEED_NAMESPACE_BEGIN

//! \brief Sequential reader over the events of one chunk, in on-disk order
class ChunkReader
{
public:
    virtual ~ChunkReader() = default;

    virtual bool has_next() const = 0;

    //! \brief Decodes the next event. Must only be called when `has_next()`.
    virtual Result<ChangeFeedEvent> next() = 0;
};

//! \brief Opens chunks for reading. Decoding is restartable: opening the same
//! chunk at the same `event_offset` always yields the same remaining events.
class ChunkDecoder
{
public:
    virtual ~ChunkDecoder() = default;

    //! \brief Opens `chunk_path` positioned before the event with index
    //! `event_offset`. An offset past the last event yields an exhausted
    //! reader.
    virtual Result<std::unique_ptr<ChunkReader>>
    decode(std::string_view chunk_path, uint64_t event_offset) = 0;
};

CHANGEFEED_NAMESPACE_END
