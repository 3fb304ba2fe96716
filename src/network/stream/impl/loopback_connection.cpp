#include "network/stream/impl/loopback_connection.hpp"

#include "network/stream/stream_error.hpp"
#include "network/stream/streamer.hpp"

namespace csync::network::stream
{
    LoopbackConnection::LoopbackConnection( libp2p::peer::PeerId local, std::weak_ptr<Streamer> remote ) :
        local_( std::move( local ) ), remote_( std::move( remote ) )
    {
    }

    outcome::result<void> LoopbackConnection::Write( MessageCode code, const ByteArray &payload )
    {
        auto remote = remote_.lock();
        if ( !remote )
        {
            return StreamError::PEER_CLOSED;
        }
        return remote->HandleMessage( local_, static_cast<uint8_t>( code ), payload );
    }
}
