#include "network/stream/client_fetcher.hpp"

#include <boost/asio/post.hpp>

#include "network/stream/want_mask.hpp"

namespace csync::network::stream
{
    ClientFetcher::ClientFetcher( boost::asio::io_context &context,
                                  StreamID                 stream,
                                  std::shared_ptr<Client>  client,
                                  Priority                 priority,
                                  Sender                   send,
                                  FailureHandler           failed ) :
        stream_( std::move( stream ) ),
        client_( std::move( client ) ),
        priority_( priority ),
        send_( std::move( send ) ),
        failed_( std::move( failed ) ),
        strand_( boost::asio::make_strand( context ) )
    {
    }

    void ClientFetcher::OnOfferedHashes( OfferedHashesMsg msg )
    {
        boost::asio::post( strand_,
                           [weak = weak_from_this(), msg = std::move( msg )]
                           {
                               if ( auto self = weak.lock() )
                               {
                                   self->HandleOffer( msg );
                               }
                           } );
    }

    void ClientFetcher::Stop()
    {
        if ( stopped_.exchange( true ) )
        {
            return;
        }
        std::map<uint64_t, std::shared_ptr<FetchBarrier>> barriers;
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            barriers.swap( barriers_ );
        }
        for ( auto &entry : barriers )
        {
            entry.second->Abort();
        }
        client_->Close();
        logger_->info( "Stopped fetching {}, {} batches aborted", stream_.ToString(), barriers.size() );
    }

    size_t ClientFetcher::OutstandingBatches() const
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        return barriers_.size();
    }

    void ClientFetcher::HandleOffer( const OfferedHashesMsg &msg )
    {
        if ( stopped_.load() )
        {
            return;
        }
        auto hashes = SplitHashes( msg.hashes );
        if ( !hashes )
        {
            logger_->warn( "Offer of {} with {} hash bytes discarded", stream_.ToString(), msg.hashes.size() );
            return;
        }

        WantMask                                  want( hashes.value().size() );
        std::vector<std::shared_ptr<FetchHandle>> handles;
        for ( size_t i = 0; i < hashes.value().size(); ++i )
        {
            if ( auto handle = client_->NeedData( hashes.value()[i] ) )
            {
                want.Set( i );
                handles.push_back( std::move( handle ) );
            }
        }

        logger_->debug( "Want {} of {} hashes of {} for {}-{}",
                        handles.size(),
                        hashes.value().size(),
                        stream_.ToString(),
                        msg.from,
                        msg.to );
        auto sent = send_( WantedHashesMsg{ stream_, want.Bytes(), msg.to, 0 }, priority_ );
        if ( !sent )
        {
            Fail( sent.error() );
            return;
        }

        uint64_t batch_id = 0;
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            batch_id = next_batch_id_++;
        }
        auto barrier = FetchBarrier::Create( std::move( handles ),
                                             [weak = weak_from_this(), strand = strand_, batch_id, msg]( outcome::result<void> result )
                                             {
                                                 // resolved on whatever thread delivered the last chunk
                                                 boost::asio::post( strand,
                                                                    [weak, batch_id, msg, result]
                                                                    {
                                                                        if ( auto self = weak.lock() )
                                                                        {
                                                                            self->OnBatchFetched( batch_id, msg, result );
                                                                        }
                                                                    } );
                                             } );

        std::lock_guard<std::mutex> lock( mutex_ );
        if ( stopped_.load() )
        {
            barrier->Abort();
            return;
        }
        barriers_.emplace( batch_id, std::move( barrier ) );
    }

    void ClientFetcher::OnBatchFetched( uint64_t batch_id, const OfferedHashesMsg &msg, outcome::result<void> result )
    {
        {
            std::lock_guard<std::mutex> lock( mutex_ );
            if ( stopped_.load() || barriers_.erase( batch_id ) == 0 )
            {
                return;
            }
        }
        if ( !result )
        {
            logger_->error( "Fetching batch {}-{} of {} failed: {}",
                            msg.from,
                            msg.to,
                            stream_.ToString(),
                            result.error().message() );
            Fail( result.error() );
            return;
        }
        auto completed = CompleteBatch( msg );
        if ( !completed )
        {
            Fail( completed.error() );
        }
    }

    outcome::result<void> ClientFetcher::CompleteBatch( const OfferedHashesMsg &msg )
    {
        auto takeover = client_->BatchDone( stream_, msg.from, msg.hashes, msg.handover_proof );
        completed_batches_.fetch_add( 1 );
        if ( !takeover )
        {
            return outcome::success();
        }
        OUTCOME_TRY( proof, takeover() );
        return send_( TakeoverProofMsg{ stream_, msg.from, msg.to, std::move( proof ) }, priority_ );
    }

    void ClientFetcher::Fail( const std::error_code &error )
    {
        if ( stopped_.load() || failed_called_.exchange( true ) )
        {
            return;
        }
        if ( failed_ )
        {
            failed_( shared_from_this(), error );
        }
    }
}
