#ifndef CHUNKSYNC_NETWORK_STREAM_SERVER_HPP
#define CHUNKSYNC_NETWORK_STREAM_SERVER_HPP

#include <functional>
#include <memory>

#include <libp2p/peer/peer_id.hpp>

#include "network/stream/messages.hpp"

namespace csync::network::stream
{
    /**
     * @brief One batch produced by a Server: a flat buffer of hashes, the range it covers and the
     * proof of handing it over
     */
    struct Batch
    {
        ByteArray     hashes;
        uint64_t      from = 0;
        uint64_t      to   = 0;
        HandoverProof proof;
    };

    /**
     * @brief Offering side of one (peer, stream) subscription, supplied by the application
     */
    class Server
    {
    public:
        virtual ~Server() = default;

        /**
         * @brief Produces the batch following the cursor
         * @param from cursor start
         * @param to cursor end, 0 when open-ended
         * @return the batch, its hash buffer may be empty when nothing is available yet
         */
        virtual outcome::result<Batch> SetNextBatch( uint64_t from, uint64_t to ) = 0;

        /// Reads the bytes of a chunk the client wants
        virtual outcome::result<ByteArray> GetData( const ChunkHash &hash ) = 0;

        virtual void Close() = 0;
    };

    using ServerFunc = std::function<outcome::result<std::shared_ptr<Server>>( const libp2p::peer::PeerId &peer,
                                                                               const ByteArray            &key,
                                                                               bool                        live )>;
}

#endif // CHUNKSYNC_NETWORK_STREAM_SERVER_HPP
