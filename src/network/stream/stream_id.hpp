#ifndef CHUNKSYNC_NETWORK_STREAM_STREAM_ID_HPP
#define CHUNKSYNC_NETWORK_STREAM_STREAM_ID_HPP

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

#include <boost/functional/hash.hpp>

#include "scale/types.hpp"

namespace csync::network::stream
{
    using ByteArray = scale::ByteArray;

    /**
     * @brief Names one stream a peer can subscribe to: the stream kind, an optional
     * discriminating key and whether the live tail or the history is meant.
     * An empty key is the nil key.
     */
    class StreamID
    {
    public:
        StreamID() = default;

        StreamID( std::string name, ByteArray key, bool live );

        const std::string &Name() const
        {
            return name_;
        }

        const ByteArray &Key() const
        {
            return key_;
        }

        bool IsLive() const
        {
            return live_;
        }

        /**
         * @brief The historical counterpart of this stream (same name and key, live unset)
         */
        StreamID Historical() const;

        /**
         * @brief Printable form "name|hexkey|l" for live and "name|hexkey|h" for history
         */
        std::string ToString() const;

        bool operator==( const StreamID &other ) const;
        bool operator!=( const StreamID &other ) const;

        template <class Stream, typename = std::enable_if_t<Stream::is_encoder_stream>>
        friend Stream &operator<<( Stream &s, const StreamID &id )
        {
            return s << id.name_ << id.key_ << id.live_;
        }

        template <class Stream, typename = std::enable_if_t<Stream::is_decoder_stream>>
        friend Stream &operator>>( Stream &s, StreamID &id )
        {
            return s >> id.name_ >> id.key_ >> id.live_;
        }

    private:
        std::string name_;
        ByteArray   key_;
        bool        live_ = false;
    };

    std::ostream &operator<<( std::ostream &os, const StreamID &id );

    /**
     * @brief Cursor over the sequence space of a stream. to == 0 is open-ended.
     */
    struct Range
    {
        uint64_t from = 0;
        uint64_t to   = 0;

        bool operator==( const Range &other ) const
        {
            return from == other.from && to == other.to;
        }

        bool operator!=( const Range &other ) const
        {
            return !( *this == other );
        }
    };

    template <class Stream, typename = std::enable_if_t<Stream::is_encoder_stream>>
    Stream &operator<<( Stream &s, const Range &r )
    {
        return s << r.from << r.to;
    }

    template <class Stream, typename = std::enable_if_t<Stream::is_decoder_stream>>
    Stream &operator>>( Stream &s, Range &r )
    {
        return s >> r.from >> r.to;
    }

    /**
     * @brief Priority of outgoing messages, higher levels are written first
     */
    enum class Priority : uint8_t
    {
        Low  = 0,
        Mid  = 1,
        High = 2,
        Top  = 3,
    };

    constexpr size_t kPriorityLevels = 4;

    const char *ToString( Priority priority );
}

template <>
struct std::hash<csync::network::stream::StreamID>
{
    size_t operator()( const csync::network::stream::StreamID &id ) const
    {
        size_t seed = 0;
        boost::hash_combine( seed, id.Name() );
        boost::hash_combine( seed, boost::hash_range( id.Key().begin(), id.Key().end() ) );
        boost::hash_combine( seed, id.IsLive() );
        return seed;
    }
};

#endif // CHUNKSYNC_NETWORK_STREAM_STREAM_ID_HPP
