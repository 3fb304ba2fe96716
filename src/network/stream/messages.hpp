#ifndef CHUNKSYNC_NETWORK_STREAM_MESSAGES_HPP
#define CHUNKSYNC_NETWORK_STREAM_MESSAGES_HPP

#include <string>
#include <system_error>
#include <vector>

#include <boost/optional.hpp>
#include <boost/variant.hpp>
#include <gsl/span>

#include "base/blob.hpp"
#include "network/stream/stream_id.hpp"
#include "outcome/outcome.hpp"
#include "scale/scale_error.hpp"

namespace csync::network::stream
{
    /// Byte length of one chunk hash
    constexpr size_t kHashSize = 32;

    using ChunkHash = base::Hash256;

    static_assert( ChunkHash::size() == kHashSize, "chunk hash must be kHashSize bytes long" );

    /**
     * @brief Numeric codes of the stream protocol messages
     */
    enum class MessageCode : uint8_t
    {
        Unsubscribe         = 0,
        OfferedHashes       = 1,
        WantedHashes        = 2,
        TakeoverProof       = 3,
        Subscribe           = 4,
        ChunkDelivery       = 6,
        SubscribeError      = 7,
        RequestSubscription = 8,
    };

    const char *ToString( MessageCode code );

    /// Opaque attestation of the server that it offered a batch
    struct HandoverProof
    {
        ByteArray payload;

        bool operator==( const HandoverProof &other ) const
        {
            return payload == other.payload;
        }
    };

    /// Opaque attestation of the client that it received a batch in full
    struct TakeoverProof
    {
        ByteArray payload;

        bool operator==( const TakeoverProof &other ) const
        {
            return payload == other.payload;
        }
    };

    struct UnsubscribeMsg
    {
        StreamID stream;

        bool operator==( const UnsubscribeMsg &other ) const
        {
            return stream == other.stream;
        }
    };

    struct OfferedHashesMsg
    {
        StreamID      stream;
        uint64_t      from = 0;
        uint64_t      to   = 0;
        ByteArray     hashes;
        HandoverProof handover_proof;

        bool operator==( const OfferedHashesMsg &other ) const
        {
            return stream == other.stream && from == other.from && to == other.to && hashes == other.hashes &&
                   handover_proof == other.handover_proof;
        }
    };

    struct WantedHashesMsg
    {
        StreamID  stream;
        ByteArray want;
        uint64_t  from = 0;
        uint64_t  to   = 0;

        bool operator==( const WantedHashesMsg &other ) const
        {
            return stream == other.stream && want == other.want && from == other.from && to == other.to;
        }
    };

    struct TakeoverProofMsg
    {
        StreamID      stream;
        uint64_t      from = 0;
        uint64_t      to   = 0;
        TakeoverProof takeover_proof;

        bool operator==( const TakeoverProofMsg &other ) const
        {
            return stream == other.stream && from == other.from && to == other.to &&
                   takeover_proof == other.takeover_proof;
        }
    };

    struct SubscribeMsg
    {
        StreamID               stream;
        boost::optional<Range> history;
        Priority               priority = Priority::Low;

        bool operator==( const SubscribeMsg &other ) const
        {
            return stream == other.stream && history == other.history && priority == other.priority;
        }
    };

    struct ChunkDeliveryMsg
    {
        ChunkHash hash;
        ByteArray data;

        bool operator==( const ChunkDeliveryMsg &other ) const
        {
            return hash == other.hash && data == other.data;
        }
    };

    struct SubscribeErrorMsg
    {
        std::string error;

        bool operator==( const SubscribeErrorMsg &other ) const
        {
            return error == other.error;
        }
    };

    /// Asks the receiver to subscribe to the sender
    struct RequestSubscriptionMsg
    {
        StreamID               stream;
        boost::optional<Range> history;
        Priority               priority = Priority::Low;

        bool operator==( const RequestSubscriptionMsg &other ) const
        {
            return stream == other.stream && history == other.history && priority == other.priority;
        }
    };

    using Message = boost::variant<UnsubscribeMsg,
                                   OfferedHashesMsg,
                                   WantedHashesMsg,
                                   TakeoverProofMsg,
                                   SubscribeMsg,
                                   ChunkDeliveryMsg,
                                   SubscribeErrorMsg,
                                   RequestSubscriptionMsg>;

    /// Encoded message as written to the transport
    struct Frame
    {
        MessageCode code;
        ByteArray   payload;
    };

    MessageCode CodeOf( const Message &message );

    outcome::result<Frame> EncodeMessage( const Message &message );

    /**
     * @brief Decodes the payload of a received frame
     * @return UNKNOWN_MESSAGE_CODE for codes outside the protocol, a DecodeError for malformed payloads
     */
    outcome::result<Message> DecodeMessage( uint8_t code, gsl::span<const uint8_t> payload );

    /**
     * @brief Splits a flat hash buffer into hashes, in buffer order
     * @return INVALID_HASHES_LENGTH if the buffer is not a multiple of kHashSize
     */
    outcome::result<std::vector<ChunkHash>> SplitHashes( const ByteArray &hashes );

    template <class Stream, typename = std::enable_if_t<Stream::is_encoder_stream>>
    Stream &operator<<( Stream &s, Priority p )
    {
        return s << static_cast<uint8_t>( p );
    }

    template <class Stream, typename = std::enable_if_t<Stream::is_decoder_stream>>
    Stream &operator>>( Stream &s, Priority &p )
    {
        uint8_t value = 0;
        s >> value;
        if ( value >= kPriorityLevels )
        {
            throw std::system_error( make_error_code( scale::DecodeError::UNEXPECTED_VALUE ) );
        }
        p = static_cast<Priority>( value );
        return s;
    }

    template <class Stream, typename = std::enable_if_t<Stream::is_encoder_stream>>
    Stream &operator<<( Stream &s, const HandoverProof &v )
    {
        return s << v.payload;
    }

    template <class Stream, typename = std::enable_if_t<Stream::is_decoder_stream>>
    Stream &operator>>( Stream &s, HandoverProof &v )
    {
        return s >> v.payload;
    }

    template <class Stream, typename = std::enable_if_t<Stream::is_encoder_stream>>
    Stream &operator<<( Stream &s, const TakeoverProof &v )
    {
        return s << v.payload;
    }

    template <class Stream, typename = std::enable_if_t<Stream::is_decoder_stream>>
    Stream &operator>>( Stream &s, TakeoverProof &v )
    {
        return s >> v.payload;
    }

    template <class Stream, typename = std::enable_if_t<Stream::is_encoder_stream>>
    Stream &operator<<( Stream &s, const UnsubscribeMsg &m )
    {
        return s << m.stream;
    }

    template <class Stream, typename = std::enable_if_t<Stream::is_decoder_stream>>
    Stream &operator>>( Stream &s, UnsubscribeMsg &m )
    {
        return s >> m.stream;
    }

    template <class Stream, typename = std::enable_if_t<Stream::is_encoder_stream>>
    Stream &operator<<( Stream &s, const OfferedHashesMsg &m )
    {
        return s << m.stream << m.from << m.to << m.hashes << m.handover_proof;
    }

    template <class Stream, typename = std::enable_if_t<Stream::is_decoder_stream>>
    Stream &operator>>( Stream &s, OfferedHashesMsg &m )
    {
        return s >> m.stream >> m.from >> m.to >> m.hashes >> m.handover_proof;
    }

    template <class Stream, typename = std::enable_if_t<Stream::is_encoder_stream>>
    Stream &operator<<( Stream &s, const WantedHashesMsg &m )
    {
        return s << m.stream << m.want << m.from << m.to;
    }

    template <class Stream, typename = std::enable_if_t<Stream::is_decoder_stream>>
    Stream &operator>>( Stream &s, WantedHashesMsg &m )
    {
        return s >> m.stream >> m.want >> m.from >> m.to;
    }

    template <class Stream, typename = std::enable_if_t<Stream::is_encoder_stream>>
    Stream &operator<<( Stream &s, const TakeoverProofMsg &m )
    {
        return s << m.stream << m.from << m.to << m.takeover_proof;
    }

    template <class Stream, typename = std::enable_if_t<Stream::is_decoder_stream>>
    Stream &operator>>( Stream &s, TakeoverProofMsg &m )
    {
        return s >> m.stream >> m.from >> m.to >> m.takeover_proof;
    }

    template <class Stream, typename = std::enable_if_t<Stream::is_encoder_stream>>
    Stream &operator<<( Stream &s, const SubscribeMsg &m )
    {
        return s << m.stream << m.history << m.priority;
    }

    template <class Stream, typename = std::enable_if_t<Stream::is_decoder_stream>>
    Stream &operator>>( Stream &s, SubscribeMsg &m )
    {
        return s >> m.stream >> m.history >> m.priority;
    }

    template <class Stream, typename = std::enable_if_t<Stream::is_encoder_stream>>
    Stream &operator<<( Stream &s, const ChunkDeliveryMsg &m )
    {
        return s << m.hash << m.data;
    }

    template <class Stream, typename = std::enable_if_t<Stream::is_decoder_stream>>
    Stream &operator>>( Stream &s, ChunkDeliveryMsg &m )
    {
        return s >> m.hash >> m.data;
    }

    template <class Stream, typename = std::enable_if_t<Stream::is_encoder_stream>>
    Stream &operator<<( Stream &s, const SubscribeErrorMsg &m )
    {
        return s << m.error;
    }

    template <class Stream, typename = std::enable_if_t<Stream::is_decoder_stream>>
    Stream &operator>>( Stream &s, SubscribeErrorMsg &m )
    {
        return s >> m.error;
    }

    template <class Stream, typename = std::enable_if_t<Stream::is_encoder_stream>>
    Stream &operator<<( Stream &s, const RequestSubscriptionMsg &m )
    {
        return s << m.stream << m.history << m.priority;
    }

    template <class Stream, typename = std::enable_if_t<Stream::is_decoder_stream>>
    Stream &operator>>( Stream &s, RequestSubscriptionMsg &m )
    {
        return s >> m.stream >> m.history >> m.priority;
    }
}

#endif // CHUNKSYNC_NETWORK_STREAM_MESSAGES_HPP
