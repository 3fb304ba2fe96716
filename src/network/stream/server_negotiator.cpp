#include "network/stream/server_negotiator.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>

#include "network/stream/stream_error.hpp"
#include "network/stream/want_mask.hpp"

namespace csync::network::stream
{
    ServerNegotiator::ServerNegotiator( boost::asio::io_context   &context,
                                        StreamID                   stream,
                                        std::shared_ptr<Server>    server,
                                        Range                      start,
                                        boost::optional<Range>     bound,
                                        Priority                   priority,
                                        Sender                     send,
                                        FinishedHandler            finished,
                                        std::chrono::milliseconds  empty_batch_retry ) :
        stream_( std::move( stream ) ),
        server_( std::move( server ) ),
        bound_( std::move( bound ) ),
        priority_( priority ),
        send_( std::move( send ) ),
        finished_( std::move( finished ) ),
        empty_batch_retry_( empty_batch_retry ),
        strand_( boost::asio::make_strand( context ) ),
        retry_timer_( context ),
        cursor_( start )
    {
    }

    void ServerNegotiator::Start()
    {
        logger_->info( "Serving {} from {} to {}", stream_.ToString(), cursor_.from, cursor_.to );
        boost::asio::post( strand_,
                           [weak = weak_from_this()]
                           {
                               if ( auto self = weak.lock() )
                               {
                                   self->ProduceBatch();
                               }
                           } );
    }

    void ServerNegotiator::Stop()
    {
        if ( stopped_.exchange( true ) )
        {
            return;
        }
        {
            std::lock_guard<std::mutex> lock( state_mutex_ );
            outstanding_.reset();
        }
        // the timer is only touched from the strand
        boost::asio::post( strand_,
                           [self = shared_from_this()]
                           {
                               boost::system::error_code ignored;
                               self->retry_timer_.cancel( ignored );
                           } );
        server_->Close();
        logger_->info( "Stopped serving {}", stream_.ToString() );
    }

    void ServerNegotiator::OnWantedHashes( WantedHashesMsg msg )
    {
        boost::asio::post( strand_,
                           [weak = weak_from_this(), msg = std::move( msg )]
                           {
                               if ( auto self = weak.lock() )
                               {
                                   self->HandleWanted( msg );
                               }
                           } );
    }

    void ServerNegotiator::OnTakeoverProof( TakeoverProofMsg msg )
    {
        if ( stopped_.load() )
        {
            return;
        }
        logger_->debug( "Takeover proof of {} for {}-{}: {} bytes",
                        stream_.ToString(),
                        msg.from,
                        msg.to,
                        msg.takeover_proof.payload.size() );
        std::lock_guard<std::mutex> lock( state_mutex_ );
        last_takeover_ = std::move( msg.takeover_proof );
    }

    Range ServerNegotiator::Cursor() const
    {
        std::lock_guard<std::mutex> lock( state_mutex_ );
        return cursor_;
    }

    boost::optional<TakeoverProof> ServerNegotiator::LastTakeoverProof() const
    {
        std::lock_guard<std::mutex> lock( state_mutex_ );
        return last_takeover_;
    }

    bool ServerNegotiator::HasOutstandingOffer() const
    {
        std::lock_guard<std::mutex> lock( state_mutex_ );
        return outstanding_.has_value();
    }

    void ServerNegotiator::ProduceBatch()
    {
        if ( stopped_.load() )
        {
            return;
        }
        auto cursor = Cursor();

        auto batch = server_->SetNextBatch( cursor.from, cursor.to );
        if ( !batch )
        {
            logger_->error( "Producing batch {}-{} of {} failed: {}",
                            cursor.from,
                            cursor.to,
                            stream_.ToString(),
                            batch.error().message() );
            Finish( outcome::failure( batch.error() ) );
            return;
        }
        if ( batch.value().hashes.size() % kHashSize != 0 )
        {
            logger_->error( "Batch of {} has {} hash bytes", stream_.ToString(), batch.value().hashes.size() );
            Finish( outcome::failure( make_error_code( StreamError::INVALID_HASHES_LENGTH ) ) );
            return;
        }
        if ( batch.value().hashes.empty() )
        {
            ScheduleRetry();
            return;
        }

        OfferedHashesMsg offer{ stream_,
                                batch.value().from,
                                batch.value().to,
                                batch.value().hashes,
                                batch.value().proof };
        {
            std::lock_guard<std::mutex> lock( state_mutex_ );
            if ( stopped_.load() )
            {
                return;
            }
            outstanding_ = std::move( batch.value() );
        }

        logger_->debug( "Offer {} hashes of {} for {}-{}",
                        offer.hashes.size() / kHashSize,
                        stream_.ToString(),
                        offer.from,
                        offer.to );
        auto sent = send_( offer, priority_ );
        if ( !sent )
        {
            Finish( outcome::failure( sent.error() ) );
        }
    }

    void ServerNegotiator::HandleWanted( const WantedHashesMsg &msg )
    {
        if ( stopped_.load() )
        {
            return;
        }
        boost::optional<Batch> batch;
        {
            std::lock_guard<std::mutex> lock( state_mutex_ );
            batch.swap( outstanding_ );
        }
        if ( !batch )
        {
            logger_->warn( "Wanted hashes of {} without outstanding offer, discarded", stream_.ToString() );
            return;
        }

        auto delivered = DeliverWanted( *batch, msg );
        if ( !delivered )
        {
            Finish( outcome::failure( delivered.error() ) );
            return;
        }

        bool exhausted = false;
        {
            std::lock_guard<std::mutex> lock( state_mutex_ );
            if ( stream_.IsLive() || !bound_ )
            {
                cursor_ = Range{ msg.from, msg.to };
            }
            else
            {
                cursor_   = Range{ msg.from, bound_->to };
                exhausted = bound_->to != 0 && msg.from >= bound_->to;
            }
        }
        if ( exhausted )
        {
            logger_->info( "History of {} served up to {}", stream_.ToString(), msg.from );
            Finish( outcome::success() );
            return;
        }
        ProduceBatch();
    }

    outcome::result<void> ServerNegotiator::DeliverWanted( const Batch &batch, const WantedHashesMsg &msg )
    {
        OUTCOME_TRY( hashes, SplitHashes( batch.hashes ) );
        OUTCOME_TRY( mask, WantMask::FromBytes( hashes.size(), msg.want ) );

        logger_->debug( "{} of {} hashes of {} wanted", mask.Count(), hashes.size(), stream_.ToString() );
        for ( size_t i = 0; i < hashes.size(); ++i )
        {
            if ( !mask.Test( i ) )
            {
                continue;
            }
            OUTCOME_TRY( data, server_->GetData( hashes[i] ) );
            OUTCOME_TRY( send_( ChunkDeliveryMsg{ hashes[i], std::move( data ) }, priority_ ) );
        }
        return outcome::success();
    }

    void ServerNegotiator::ScheduleRetry()
    {
        retry_timer_.expires_from_now( boost::posix_time::milliseconds( empty_batch_retry_.count() ) );
        retry_timer_.async_wait( boost::asio::bind_executor( strand_,
                                                             [weak = weak_from_this()]( const boost::system::error_code &ec )
                                                             {
                                                                 auto self = weak.lock();
                                                                 if ( !self || ec )
                                                                 {
                                                                     return;
                                                                 }
                                                                 self->ProduceBatch();
                                                             } ) );
    }

    void ServerNegotiator::Finish( outcome::result<void> result )
    {
        if ( stopped_.load() || finished_called_.exchange( true ) )
        {
            return;
        }
        if ( finished_ )
        {
            finished_( shared_from_this(), result );
        }
    }
}
