#ifndef CHUNKSYNC_NETWORK_STREAM_PEER_CONNECTION_HPP
#define CHUNKSYNC_NETWORK_STREAM_PEER_CONNECTION_HPP

#include "network/stream/messages.hpp"

namespace csync::network::stream
{
    /**
     * @brief Transport towards one connected peer. Frames written here are delivered to the
     * remote Streamer::HandleMessage in write order.
     */
    class PeerConnection
    {
    public:
        virtual ~PeerConnection() = default;

        virtual outcome::result<void> Write( MessageCode code, const ByteArray &payload ) = 0;
    };
}

#endif // CHUNKSYNC_NETWORK_STREAM_PEER_CONNECTION_HPP
