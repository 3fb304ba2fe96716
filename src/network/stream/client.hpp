#ifndef CHUNKSYNC_NETWORK_STREAM_CLIENT_HPP
#define CHUNKSYNC_NETWORK_STREAM_CLIENT_HPP

#include <functional>
#include <memory>

#include <libp2p/peer/peer_id.hpp>

#include "network/stream/fetch_handle.hpp"
#include "network/stream/messages.hpp"

namespace csync::network::stream
{
    /// Produces the takeover proof of a fully received batch
    using TakeoverFunc = std::function<outcome::result<TakeoverProof>()>;

    /**
     * @brief Requesting side of one (peer, stream) subscription, supplied by the application
     */
    class Client
    {
    public:
        virtual ~Client() = default;

        /**
         * @brief Checks whether a chunk is still needed
         * @param hash address of the offered chunk
         * @return nullptr when the chunk is already present, otherwise the handle resolved when it arrives
         */
        virtual std::shared_ptr<FetchHandle> NeedData( const ChunkHash &hash ) = 0;

        /**
         * @brief Called once every wanted chunk of a batch arrived
         * @param stream subscription the batch belongs to
         * @param from start of the batch range as offered
         * @param hashes offered hash buffer
         * @param handover proof the server attached to the batch
         * @return function producing the takeover proof, empty when no proof is produced
         */
        virtual TakeoverFunc BatchDone( const StreamID      &stream,
                                        uint64_t             from,
                                        const ByteArray     &hashes,
                                        const HandoverProof &handover ) = 0;

        /// Released with its subscription
        virtual void Close() = 0;
    };

    using ClientFunc = std::function<outcome::result<std::shared_ptr<Client>>( const libp2p::peer::PeerId &peer,
                                                                               const ByteArray            &key,
                                                                               bool                        live )>;
}

#endif // CHUNKSYNC_NETWORK_STREAM_CLIENT_HPP
