#include "network/stream/streamer.hpp"

#include "network/stream/client_fetcher.hpp"
#include "network/stream/server_negotiator.hpp"
#include "network/stream/stream_error.hpp"

namespace csync::network::stream
{
    namespace
    {
        std::function<outcome::result<void>( const Message &, Priority )> MakeSender( const std::weak_ptr<Peer> &weak_peer )
        {
            return [weak_peer]( const Message &message, Priority priority ) -> outcome::result<void>
            {
                auto peer = weak_peer.lock();
                if ( !peer )
                {
                    return StreamError::PEER_CLOSED;
                }
                return peer->Send( message, priority );
            };
        }
    }

    Streamer::Streamer( std::shared_ptr<CapabilityRegistry> registry, StreamOptions options ) :
        registry_( std::move( registry ) ),
        options_( std::move( options ) ),
        work_guard_( boost::asio::make_work_guard( context_ ) )
    {
        registry_->Seal();
        auto threads = std::max<size_t>( 1, options_.worker_threads );
        for ( size_t i = 0; i < threads; ++i )
        {
            workers_.emplace_back( [this] { context_.run(); } );
        }
        logger_->info( "Streamer started with {} workers", threads );
    }

    Streamer::~Streamer()
    {
        Stop();
    }

    outcome::result<void> Streamer::AddPeer( const PeerId &peer, std::shared_ptr<PeerConnection> connection )
    {
        if ( stopped_.load() )
        {
            return StreamError::PEER_CLOSED;
        }
        auto session = std::make_shared<Peer>( peer, std::move( connection ), options_.queue_capacity );
        {
            std::lock_guard<std::mutex> lock( peers_mutex_ );
            if ( !peers_.emplace( peer, session ).second )
            {
                logger_->warn( "Peer {} is already connected", peer.toBase58() );
                return StreamError::PEER_ALREADY_CONNECTED;
            }
        }
        session->Start();
        return outcome::success();
    }

    outcome::result<void> Streamer::RemovePeer( const PeerId &peer )
    {
        std::shared_ptr<Peer> session;
        {
            std::lock_guard<std::mutex> lock( peers_mutex_ );
            auto                        it = peers_.find( peer );
            if ( it == peers_.end() )
            {
                return StreamError::UNKNOWN_PEER;
            }
            session = std::move( it->second );
            peers_.erase( it );
        }
        session->Stop();

        std::vector<ClientSubscription>                clients;
        std::vector<std::shared_ptr<ServerNegotiator>> servers;
        session->TakeAll( clients, servers );
        logger_->info( "Peer {} removed with {} client and {} server subscriptions",
                       peer.toBase58(),
                       clients.size(),
                       servers.size() );
        Release( clients, servers );
        return outcome::success();
    }

    outcome::result<void> Streamer::Subscribe( const PeerId                 &peer,
                                               const StreamID               &stream,
                                               const boost::optional<Range> &history,
                                               Priority                      priority )
    {
        if ( !registry_->GetClientFunc( stream.Name() ) )
        {
            logger_->warn( "Subscribe to {} refused: no client registered", stream.ToString() );
            return outcome::failure( MakeNotRegisteredError( stream.Name() ) );
        }

        auto session = FindPeer( peer );
        if ( !session )
        {
            return StreamError::UNKNOWN_PEER;
        }
        return AddSubscription( session, stream, history, priority );
    }

    outcome::result<void> Streamer::Unsubscribe( const PeerId &peer, const StreamID &stream )
    {
        auto session = FindPeer( peer );
        if ( !session )
        {
            return StreamError::UNKNOWN_PEER;
        }
        if ( !DropEntries( session, stream ) )
        {
            return outcome::success();
        }
        logger_->info( "Unsubscribed from {} at {}", stream.ToString(), peer.toBase58() );
        return session->Send( UnsubscribeMsg{ stream }, Priority::Top );
    }

    outcome::result<void> Streamer::AddSubscription( const std::shared_ptr<Peer>  &session,
                                                     const StreamID               &stream,
                                                     const boost::optional<Range> &history,
                                                     Priority                      priority )
    {
        SubscribeRequest request{ history, priority };
        OUTCOME_TRY( session->AddClient( stream, request ) );
        bool twin_added = false;
        if ( stream.IsLive() && history )
        {
            // the peer serves the requested history as an independent historical stream
            twin_added = session->AddClient( stream.Historical(), request ).has_value();
            if ( !twin_added )
            {
                logger_->warn( "History of {} is already subscribed", stream.ToString() );
            }
        }

        auto sent = session->Send( SubscribeMsg{ stream, history, priority }, priority );
        if ( !sent )
        {
            std::vector<ClientSubscription>                clients;
            std::vector<std::shared_ptr<ServerNegotiator>> servers;
            if ( auto client = session->RemoveClient( stream ) )
            {
                clients.push_back( std::move( *client ) );
            }
            if ( twin_added )
            {
                if ( auto twin = session->RemoveClient( stream.Historical() ) )
                {
                    clients.push_back( std::move( *twin ) );
                }
            }
            Release( clients, servers );
            return sent.error();
        }
        logger_->info( "Subscribed to {} at {}", stream.ToString(), session->Id().toBase58() );
        return outcome::success();
    }

    outcome::result<void> Streamer::RequestSubscription( const PeerId                 &peer,
                                                         const StreamID               &stream,
                                                         const boost::optional<Range> &history,
                                                         Priority                      priority )
    {
        auto session = FindPeer( peer );
        if ( !session )
        {
            return StreamError::UNKNOWN_PEER;
        }
        return session->Send( RequestSubscriptionMsg{ stream, history, priority }, priority );
    }

    outcome::result<void> Streamer::HandleMessage( const PeerId &peer, uint8_t code, gsl::span<const uint8_t> payload )
    {
        auto message = DecodeMessage( code, payload );
        if ( !message )
        {
            logger_->warn( "Malformed message {} from {}: {}", code, peer.toBase58(), message.error().message() );
            return message.error();
        }
        auto session = FindPeer( peer );
        if ( !session )
        {
            logger_->warn( "Message {} from unknown peer {} discarded", code, peer.toBase58() );
            return StreamError::UNKNOWN_PEER;
        }

        auto message_code = CodeOf( message.value() );
        logger_->debug( "Received {} from {}", ToString( message_code ), peer.toBase58() );
        switch ( message_code )
        {
            case MessageCode::Unsubscribe:
                return OnUnsubscribe( session, boost::get<UnsubscribeMsg>( message.value() ) );
            case MessageCode::OfferedHashes:
                return OnOfferedHashes( session, std::move( boost::get<OfferedHashesMsg>( message.value() ) ) );
            case MessageCode::WantedHashes:
                return OnWantedHashes( session, std::move( boost::get<WantedHashesMsg>( message.value() ) ) );
            case MessageCode::TakeoverProof:
                return OnTakeoverProof( session, std::move( boost::get<TakeoverProofMsg>( message.value() ) ) );
            case MessageCode::Subscribe:
                return OnSubscribe( session, boost::get<SubscribeMsg>( message.value() ) );
            case MessageCode::ChunkDelivery:
                return OnChunkDelivery( session, boost::get<ChunkDeliveryMsg>( message.value() ) );
            case MessageCode::SubscribeError:
                return OnSubscribeError( session, boost::get<SubscribeErrorMsg>( message.value() ) );
            case MessageCode::RequestSubscription:
                return OnRequestSubscription( session, boost::get<RequestSubscriptionMsg>( message.value() ) );
        }
        return StreamError::UNKNOWN_MESSAGE_CODE;
    }

    void Streamer::Stop()
    {
        if ( stopped_.exchange( true ) )
        {
            return;
        }

        std::unordered_map<PeerId, std::shared_ptr<Peer>> peers;
        {
            std::lock_guard<std::mutex> lock( peers_mutex_ );
            peers.swap( peers_ );
        }
        for ( auto &entry : peers )
        {
            entry.second->Stop();
            std::vector<ClientSubscription>                clients;
            std::vector<std::shared_ptr<ServerNegotiator>> servers;
            entry.second->TakeAll( clients, servers );
            Release( clients, servers );
        }

        work_guard_.reset();
        context_.stop();
        for ( auto &worker : workers_ )
        {
            if ( !worker.joinable() )
            {
                continue;
            }
            if ( worker.get_id() == std::this_thread::get_id() )
            {
                worker.detach();
            }
            else
            {
                worker.join();
            }
        }
        logger_->info( "Streamer stopped" );
    }

    void Streamer::SetSubscriptionErrorHandler( SubscriptionErrorHandler handler )
    {
        std::lock_guard<std::mutex> lock( handlers_mutex_ );
        subscription_error_handler_ = std::move( handler );
    }

    void Streamer::SetSubscribeErrorHandler( SubscribeErrorHandler handler )
    {
        std::lock_guard<std::mutex> lock( handlers_mutex_ );
        subscribe_error_handler_ = std::move( handler );
    }

    void Streamer::SetChunkDeliveryHandler( ChunkDeliveryHandler handler )
    {
        std::lock_guard<std::mutex> lock( handlers_mutex_ );
        chunk_delivery_handler_ = std::move( handler );
    }

    bool Streamer::HasClientSubscription( const PeerId &peer, const StreamID &stream ) const
    {
        auto session = FindPeer( peer );
        return session && session->FindClient( stream ).has_value();
    }

    bool Streamer::HasServerSubscription( const PeerId &peer, const StreamID &stream ) const
    {
        auto session = FindPeer( peer );
        return session && session->FindServer( stream ) != nullptr;
    }

    boost::optional<TakeoverProof> Streamer::LastTakeoverProof( const PeerId &peer, const StreamID &stream ) const
    {
        auto session = FindPeer( peer );
        if ( !session )
        {
            return boost::none;
        }
        auto negotiator = session->FindServer( stream );
        if ( !negotiator )
        {
            return boost::none;
        }
        return negotiator->LastTakeoverProof();
    }

    std::shared_ptr<Peer> Streamer::FindPeer( const PeerId &peer ) const
    {
        std::lock_guard<std::mutex> lock( peers_mutex_ );
        auto                        it = peers_.find( peer );
        return it == peers_.end() ? nullptr : it->second;
    }

    outcome::result<void> Streamer::OnUnsubscribe( const std::shared_ptr<Peer> &peer, const UnsubscribeMsg &msg )
    {
        if ( DropEntries( peer, msg.stream ) )
        {
            logger_->info( "Peer {} ended {}", peer->Id().toBase58(), msg.stream.ToString() );
        }
        return outcome::success();
    }

    outcome::result<void> Streamer::OnOfferedHashes( const std::shared_ptr<Peer> &peer, OfferedHashesMsg msg )
    {
        auto entry = peer->FindClient( msg.stream );
        if ( !entry )
        {
            logger_->warn( "Offer for unsubscribed {} from {} discarded", msg.stream.ToString(), peer->Id().toBase58() );
            return outcome::success();
        }

        auto fetcher = entry->fetcher;
        if ( !fetcher )
        {
            auto activated = ActivateClient( peer, msg.stream, entry->request );
            if ( !activated )
            {
                if ( peer->RemoveClient( msg.stream ) )
                {
                    logger_->error( "Client of {} could not be created: {}",
                                    msg.stream.ToString(),
                                    activated.error().message() );
                    ReportFailure( peer, msg.stream, activated.error() );
                }
                return outcome::success();
            }
            fetcher = activated.value();
        }
        fetcher->OnOfferedHashes( std::move( msg ) );
        return outcome::success();
    }

    outcome::result<void> Streamer::OnWantedHashes( const std::shared_ptr<Peer> &peer, WantedHashesMsg msg )
    {
        auto negotiator = peer->FindServer( msg.stream );
        if ( !negotiator )
        {
            logger_->warn( "Wanted hashes for unknown {} from {} discarded", msg.stream.ToString(), peer->Id().toBase58() );
            return outcome::success();
        }
        negotiator->OnWantedHashes( std::move( msg ) );
        return outcome::success();
    }

    outcome::result<void> Streamer::OnTakeoverProof( const std::shared_ptr<Peer> &peer, TakeoverProofMsg msg )
    {
        auto negotiator = peer->FindServer( msg.stream );
        if ( !negotiator )
        {
            logger_->warn( "Takeover proof for unknown {} from {} discarded", msg.stream.ToString(), peer->Id().toBase58() );
            return outcome::success();
        }
        negotiator->OnTakeoverProof( std::move( msg ) );
        return outcome::success();
    }

    outcome::result<void> Streamer::OnSubscribe( const std::shared_ptr<Peer> &peer, const SubscribeMsg &msg )
    {
        auto server_func = registry_->GetServerFunc( msg.stream.Name() );
        if ( !server_func )
        {
            auto refusal = NotRegisteredMessage( msg.stream.Name() );
            logger_->warn( "Subscribe from {} refused: {}", peer->Id().toBase58(), refusal );
            return peer->Send( SubscribeErrorMsg{ refusal }, Priority::Top );
        }

        if ( !msg.stream.IsLive() )
        {
            StartServer( peer, server_func.value(), msg.stream, msg.history.value_or( Range{} ), msg.history, msg.priority );
            return outcome::success();
        }

        StartServer( peer, server_func.value(), msg.stream, Range{}, boost::none, msg.priority );
        if ( msg.history )
        {
            StartServer( peer, server_func.value(), msg.stream.Historical(), *msg.history, msg.history, msg.priority );
        }
        return outcome::success();
    }

    outcome::result<void> Streamer::OnChunkDelivery( const std::shared_ptr<Peer> &peer, const ChunkDeliveryMsg &msg )
    {
        ChunkDeliveryHandler handler;
        {
            std::lock_guard<std::mutex> lock( handlers_mutex_ );
            handler = chunk_delivery_handler_;
        }
        if ( !handler )
        {
            logger_->debug( "Chunk {} from {} discarded", msg.hash.toHex(), peer->Id().toBase58() );
            return outcome::success();
        }
        handler( peer->Id(), msg );
        return outcome::success();
    }

    outcome::result<void> Streamer::OnSubscribeError( const std::shared_ptr<Peer> &peer, const SubscribeErrorMsg &msg )
    {
        logger_->warn( "Peer {} refused subscription: {}", peer->Id().toBase58(), msg.error );
        auto refused = peer->RemovePendingClients( [&msg]( const StreamID &stream )
                                                   { return NotRegisteredMessage( stream.Name() ) == msg.error; } );
        for ( const auto &stream : refused )
        {
            logger_->info( "Pending subscription to {} at {} dropped", stream.ToString(), peer->Id().toBase58() );
        }

        SubscribeErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock( handlers_mutex_ );
            handler = subscribe_error_handler_;
        }
        if ( handler )
        {
            handler( peer->Id(), msg.error );
        }
        return outcome::success();
    }

    outcome::result<void> Streamer::OnRequestSubscription( const std::shared_ptr<Peer>  &peer,
                                                           const RequestSubscriptionMsg &msg )
    {
        std::string refusal;
        if ( !registry_->GetClientFunc( msg.stream.Name() ) )
        {
            refusal = NotRegisteredMessage( msg.stream.Name() );
        }
        else
        {
            auto subscribed = AddSubscription( peer, msg.stream, msg.history, msg.priority );
            if ( subscribed )
            {
                return outcome::success();
            }
            refusal = subscribed.error().message();
        }
        logger_->warn( "Requested subscription to {} failed: {}", msg.stream.ToString(), refusal );
        return peer->Send( SubscribeErrorMsg{ refusal }, Priority::Top );
    }

    void Streamer::StartServer( const std::shared_ptr<Peer>  &peer,
                                const ServerFunc             &server_func,
                                const StreamID               &stream,
                                Range                         start,
                                const boost::optional<Range> &bound,
                                Priority                      priority )
    {
        if ( peer->FindServer( stream ) )
        {
            logger_->warn( "Duplicate subscribe to {} from {} ignored", stream.ToString(), peer->Id().toBase58() );
            return;
        }
        auto server = server_func( peer->Id(), stream.Key(), stream.IsLive() );
        if ( !server )
        {
            logger_->error( "Server of {} could not be created: {}", stream.ToString(), server.error().message() );
            auto refused = peer->Send( SubscribeErrorMsg{ server.error().message() }, Priority::Top );
            if ( !refused )
            {
                logger_->error( "Refusal of {} not sent: {}", stream.ToString(), refused.error().message() );
            }
            return;
        }

        std::weak_ptr<Peer> weak_peer = peer;
        auto negotiator = std::make_shared<ServerNegotiator>(
            context_,
            stream,
            server.value(),
            start,
            bound,
            priority,
            MakeSender( weak_peer ),
            [weak_self = weak_from_this(), weak_peer]( const std::shared_ptr<ServerNegotiator> &finished,
                                                       outcome::result<void>                    result )
            {
                if ( auto self = weak_self.lock() )
                {
                    self->OnServerFinished( weak_peer, finished, result );
                }
            },
            options_.empty_batch_retry );

        if ( !peer->AddServer( stream, negotiator ) )
        {
            logger_->warn( "Duplicate subscribe to {} from {} ignored", stream.ToString(), peer->Id().toBase58() );
            negotiator->Stop();
            return;
        }
        negotiator->Start();
    }

    outcome::result<std::shared_ptr<ClientFetcher>> Streamer::ActivateClient( const std::shared_ptr<Peer> &peer,
                                                                               const StreamID              &stream,
                                                                               const SubscribeRequest      &request )
    {
        OUTCOME_TRY( client_func, registry_->GetClientFunc( stream.Name() ) );
        OUTCOME_TRY( client, client_func( peer->Id(), stream.Key(), stream.IsLive() ) );

        std::weak_ptr<Peer> weak_peer = peer;
        auto fetcher = std::make_shared<ClientFetcher>(
            context_,
            stream,
            client,
            request.priority,
            MakeSender( weak_peer ),
            [weak_self = weak_from_this(), weak_peer]( const std::shared_ptr<ClientFetcher> &failed,
                                                       const std::error_code                &error )
            {
                if ( auto self = weak_self.lock() )
                {
                    self->OnClientFailed( weak_peer, failed, error );
                }
            } );

        auto active = peer->ActivateClient( stream, fetcher );
        if ( active != fetcher )
        {
            fetcher->Stop();
        }
        if ( !active )
        {
            return StreamError::NOT_SUBSCRIBED;
        }
        logger_->debug( "Client of {} created", stream.ToString() );
        return active;
    }

    void Streamer::OnServerFinished( const std::weak_ptr<Peer>               &weak_peer,
                                     const std::shared_ptr<ServerNegotiator> &negotiator,
                                     outcome::result<void>                    result )
    {
        auto peer = weak_peer.lock();
        if ( !peer || !peer->RemoveServer( negotiator->Stream(), negotiator ) )
        {
            return;
        }
        negotiator->Stop();
        if ( result )
        {
            return;
        }
        logger_->error( "Serving {} to {} failed: {}",
                        negotiator->Stream().ToString(),
                        peer->Id().toBase58(),
                        result.error().message() );
        ReportFailure( peer, negotiator->Stream(), result.error() );
    }

    void Streamer::OnClientFailed( const std::weak_ptr<Peer>            &weak_peer,
                                   const std::shared_ptr<ClientFetcher> &fetcher,
                                   const std::error_code                &error )
    {
        auto peer = weak_peer.lock();
        if ( !peer || !peer->RemoveClient( fetcher->Stream(), fetcher ) )
        {
            return;
        }
        fetcher->Stop();
        logger_->error( "Fetching {} from {} failed: {}", fetcher->Stream().ToString(), peer->Id().toBase58(), error.message() );
        ReportFailure( peer, fetcher->Stream(), error );
    }

    void Streamer::ReportFailure( const std::shared_ptr<Peer> &peer, const StreamID &stream, const std::error_code &error )
    {
        auto sent = peer->Send( UnsubscribeMsg{ stream }, Priority::Top );
        if ( !sent )
        {
            logger_->warn( "Unsubscribe of {} not sent: {}", stream.ToString(), sent.error().message() );
        }

        SubscriptionErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock( handlers_mutex_ );
            handler = subscription_error_handler_;
        }
        if ( handler )
        {
            handler( peer->Id(), stream, error );
        }
    }

    bool Streamer::DropEntries( const std::shared_ptr<Peer> &peer, const StreamID &stream )
    {
        std::vector<ClientSubscription>                clients;
        std::vector<std::shared_ptr<ServerNegotiator>> servers;

        auto take = [&]( const StreamID &key )
        {
            if ( auto client = peer->RemoveClient( key ) )
            {
                clients.push_back( std::move( *client ) );
            }
            if ( auto server = peer->RemoveServer( key ) )
            {
                servers.push_back( std::move( server ) );
            }
        };
        take( stream );
        if ( stream.IsLive() )
        {
            take( stream.Historical() );
        }

        bool dropped = !clients.empty() || !servers.empty();
        Release( clients, servers );
        return dropped;
    }

    void Streamer::Release( std::vector<ClientSubscription>                &clients,
                            std::vector<std::shared_ptr<ServerNegotiator>> &servers )
    {
        for ( auto &client : clients )
        {
            if ( client.fetcher )
            {
                client.fetcher->Stop();
            }
        }
        for ( auto &server : servers )
        {
            server->Stop();
        }
    }
}
