#include "network/stream/peer.hpp"

#include "network/stream/client_fetcher.hpp"
#include "network/stream/server_negotiator.hpp"
#include "network/stream/stream_error.hpp"

namespace csync::network::stream
{
    Peer::Peer( libp2p::peer::PeerId id, std::shared_ptr<PeerConnection> connection, size_t queue_capacity ) :
        id_( std::move( id ) ), connection_( std::move( connection ) ), queue_( queue_capacity )
    {
    }

    Peer::~Peer()
    {
        Stop();
    }

    void Peer::Start()
    {
        std::lock_guard<std::mutex> lock( writer_mutex_ );
        if ( writer_.joinable() || queue_.IsClosed() )
        {
            return;
        }
        writer_ = std::thread( [this] { WriteLoop(); } );
        logger_->info( "Session with {} started", id_.toBase58() );
    }

    void Peer::Stop()
    {
        queue_.Close();

        std::thread writer;
        {
            std::lock_guard<std::mutex> lock( writer_mutex_ );
            writer.swap( writer_ );
        }
        if ( !writer.joinable() )
        {
            return;
        }
        if ( writer.get_id() == std::this_thread::get_id() )
        {
            // stopped from a message handler running on the writer itself
            writer.detach();
        }
        else
        {
            writer.join();
        }
        logger_->info( "Session with {} stopped", id_.toBase58() );
    }

    outcome::result<void> Peer::Send( const Message &message, Priority priority )
    {
        OUTCOME_TRY( frame, EncodeMessage( message ) );
        logger_->debug( "Queue {} to {} on {}", ToString( frame.code ), id_.toBase58(), ToString( priority ) );
        return queue_.Push( priority, std::move( frame ) );
    }

    outcome::result<void> Peer::AddClient( const StreamID &stream, const SubscribeRequest &request )
    {
        std::lock_guard<std::mutex> lock( table_mutex_ );
        if ( clients_.count( stream ) != 0 )
        {
            return StreamError::ALREADY_SUBSCRIBED;
        }
        clients_.emplace( stream, ClientSubscription{ request, nullptr } );
        return outcome::success();
    }

    boost::optional<ClientSubscription> Peer::FindClient( const StreamID &stream ) const
    {
        std::lock_guard<std::mutex> lock( table_mutex_ );
        auto                        it = clients_.find( stream );
        if ( it == clients_.end() )
        {
            return boost::none;
        }
        return it->second;
    }

    std::shared_ptr<ClientFetcher> Peer::ActivateClient( const StreamID &stream, std::shared_ptr<ClientFetcher> fetcher )
    {
        std::lock_guard<std::mutex> lock( table_mutex_ );
        auto                        it = clients_.find( stream );
        if ( it == clients_.end() )
        {
            return nullptr;
        }
        if ( !it->second.fetcher )
        {
            it->second.fetcher = std::move( fetcher );
        }
        return it->second.fetcher;
    }

    boost::optional<ClientSubscription> Peer::RemoveClient( const StreamID                       &stream,
                                                            const std::shared_ptr<ClientFetcher> &expected )
    {
        std::lock_guard<std::mutex> lock( table_mutex_ );
        auto                        it = clients_.find( stream );
        if ( it == clients_.end() || ( expected && it->second.fetcher != expected ) )
        {
            return boost::none;
        }
        auto entry = std::move( it->second );
        clients_.erase( it );
        return entry;
    }

    std::vector<StreamID> Peer::RemovePendingClients( const std::function<bool( const StreamID & )> &match )
    {
        std::vector<StreamID>       removed;
        std::lock_guard<std::mutex> lock( table_mutex_ );
        for ( auto it = clients_.begin(); it != clients_.end(); )
        {
            if ( !it->second.fetcher && match( it->first ) )
            {
                removed.push_back( it->first );
                it = clients_.erase( it );
            }
            else
            {
                ++it;
            }
        }
        return removed;
    }

    bool Peer::AddServer( const StreamID &stream, std::shared_ptr<ServerNegotiator> negotiator )
    {
        std::lock_guard<std::mutex> lock( table_mutex_ );
        return servers_.emplace( stream, std::move( negotiator ) ).second;
    }

    std::shared_ptr<ServerNegotiator> Peer::FindServer( const StreamID &stream ) const
    {
        std::lock_guard<std::mutex> lock( table_mutex_ );
        auto                        it = servers_.find( stream );
        return it == servers_.end() ? nullptr : it->second;
    }

    std::shared_ptr<ServerNegotiator> Peer::RemoveServer( const StreamID                          &stream,
                                                          const std::shared_ptr<ServerNegotiator> &expected )
    {
        std::lock_guard<std::mutex> lock( table_mutex_ );
        auto                        it = servers_.find( stream );
        if ( it == servers_.end() || ( expected && it->second != expected ) )
        {
            return nullptr;
        }
        auto negotiator = std::move( it->second );
        servers_.erase( it );
        return negotiator;
    }

    void Peer::TakeAll( std::vector<ClientSubscription> &clients, std::vector<std::shared_ptr<ServerNegotiator>> &servers )
    {
        std::lock_guard<std::mutex> lock( table_mutex_ );
        for ( auto &entry : clients_ )
        {
            clients.push_back( std::move( entry.second ) );
        }
        for ( auto &entry : servers_ )
        {
            servers.push_back( std::move( entry.second ) );
        }
        clients_.clear();
        servers_.clear();
    }

    void Peer::WriteLoop()
    {
        while ( auto queued = queue_.Pop() )
        {
            auto written = connection_->Write( queued->frame.code, queued->frame.payload );
            if ( !written )
            {
                logger_->error( "Writing {} to {} failed: {}",
                                ToString( queued->frame.code ),
                                id_.toBase58(),
                                written.error().message() );
            }
        }
    }
}
