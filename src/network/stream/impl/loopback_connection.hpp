#ifndef CHUNKSYNC_NETWORK_STREAM_LOOPBACK_CONNECTION_HPP
#define CHUNKSYNC_NETWORK_STREAM_LOOPBACK_CONNECTION_HPP

#include <memory>

#include <libp2p/peer/peer_id.hpp>

#include "network/stream/peer_connection.hpp"

namespace csync::network::stream
{
    class Streamer;

    /**
     * @brief In-process transport: every written frame is handed to the remote Streamer as if it
     * was received from the local node
     */
    class LoopbackConnection : public PeerConnection
    {
    public:
        /**
         * @param local id the remote Streamer knows this node by
         * @param remote receiving Streamer, not owned
         */
        LoopbackConnection( libp2p::peer::PeerId local, std::weak_ptr<Streamer> remote );

        outcome::result<void> Write( MessageCode code, const ByteArray &payload ) override;

    private:
        libp2p::peer::PeerId    local_;
        std::weak_ptr<Streamer> remote_;
    };
}

#endif // CHUNKSYNC_NETWORK_STREAM_LOOPBACK_CONNECTION_HPP
