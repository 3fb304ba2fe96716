#include "network/stream/messages.hpp"

#include "network/stream/stream_error.hpp"
#include "scale/scale.hpp"

namespace csync::network::stream
{
    namespace
    {
        struct CodeVisitor : public boost::static_visitor<MessageCode>
        {
            MessageCode operator()( const UnsubscribeMsg & ) const
            {
                return MessageCode::Unsubscribe;
            }
            MessageCode operator()( const OfferedHashesMsg & ) const
            {
                return MessageCode::OfferedHashes;
            }
            MessageCode operator()( const WantedHashesMsg & ) const
            {
                return MessageCode::WantedHashes;
            }
            MessageCode operator()( const TakeoverProofMsg & ) const
            {
                return MessageCode::TakeoverProof;
            }
            MessageCode operator()( const SubscribeMsg & ) const
            {
                return MessageCode::Subscribe;
            }
            MessageCode operator()( const ChunkDeliveryMsg & ) const
            {
                return MessageCode::ChunkDelivery;
            }
            MessageCode operator()( const SubscribeErrorMsg & ) const
            {
                return MessageCode::SubscribeError;
            }
            MessageCode operator()( const RequestSubscriptionMsg & ) const
            {
                return MessageCode::RequestSubscription;
            }
        };

        template <class T>
        outcome::result<Message> DecodeAs( gsl::span<const uint8_t> payload )
        {
            OUTCOME_TRY( msg, scale::decode<T>( payload ) );
            return Message( std::move( msg ) );
        }
    }

    const char *ToString( MessageCode code )
    {
        switch ( code )
        {
            case MessageCode::Unsubscribe:
                return "Unsubscribe";
            case MessageCode::OfferedHashes:
                return "OfferedHashes";
            case MessageCode::WantedHashes:
                return "WantedHashes";
            case MessageCode::TakeoverProof:
                return "TakeoverProof";
            case MessageCode::Subscribe:
                return "Subscribe";
            case MessageCode::ChunkDelivery:
                return "ChunkDelivery";
            case MessageCode::SubscribeError:
                return "SubscribeError";
            case MessageCode::RequestSubscription:
                return "RequestSubscription";
        }
        return "Unknown";
    }

    MessageCode CodeOf( const Message &message )
    {
        return boost::apply_visitor( CodeVisitor(), message );
    }

    outcome::result<Frame> EncodeMessage( const Message &message )
    {
        auto payload = boost::apply_visitor( []( const auto &msg ) { return scale::encode( msg ); }, message );
        if ( !payload )
        {
            return payload.error();
        }
        return Frame{ CodeOf( message ), std::move( payload.value() ) };
    }

    outcome::result<Message> DecodeMessage( uint8_t code, gsl::span<const uint8_t> payload )
    {
        switch ( static_cast<MessageCode>( code ) )
        {
            case MessageCode::Unsubscribe:
                return DecodeAs<UnsubscribeMsg>( payload );
            case MessageCode::OfferedHashes:
                return DecodeAs<OfferedHashesMsg>( payload );
            case MessageCode::WantedHashes:
                return DecodeAs<WantedHashesMsg>( payload );
            case MessageCode::TakeoverProof:
                return DecodeAs<TakeoverProofMsg>( payload );
            case MessageCode::Subscribe:
                return DecodeAs<SubscribeMsg>( payload );
            case MessageCode::ChunkDelivery:
                return DecodeAs<ChunkDeliveryMsg>( payload );
            case MessageCode::SubscribeError:
                return DecodeAs<SubscribeErrorMsg>( payload );
            case MessageCode::RequestSubscription:
                return DecodeAs<RequestSubscriptionMsg>( payload );
        }
        return StreamError::UNKNOWN_MESSAGE_CODE;
    }

    outcome::result<std::vector<ChunkHash>> SplitHashes( const ByteArray &hashes )
    {
        if ( hashes.size() % kHashSize != 0 )
        {
            return StreamError::INVALID_HASHES_LENGTH;
        }
        std::vector<ChunkHash> result;
        result.reserve( hashes.size() / kHashSize );
        for ( size_t offset = 0; offset < hashes.size(); offset += kHashSize )
        {
            ChunkHash hash;
            std::copy( hashes.begin() + offset, hashes.begin() + offset + kHashSize, hash.begin() );
            result.push_back( hash );
        }
        return result;
    }
}
