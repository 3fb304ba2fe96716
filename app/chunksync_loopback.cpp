#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>

#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>
#include <libp2p/crypto/protobuf/protobuf_key.hpp>
#include <libp2p/peer/peer_id.hpp>

#include "base/logger.hpp"
#include "network/stream/impl/loopback_connection.hpp"
#include "network/stream/stream_error.hpp"
#include "network/stream/streamer.hpp"
#include "storage/in_memory/memory_stream_client.hpp"
#include "storage/in_memory/memory_stream_server.hpp"

using namespace csync;
using network::stream::CapabilityRegistry;
using network::stream::StreamID;
using network::stream::Streamer;
using network::stream::StreamOptions;

namespace
{
    constexpr const char *kStreamName = "SYNC";

    // cmd line options
    struct Options
    {
        std::string config;
        size_t      chunks     = 1000;
        size_t      batch      = 128;
        size_t      timeout_ms = 30000;
    };

    boost::optional<Options> parseCommandLine( int argc, char **argv )
    {
        namespace po = boost::program_options;
        try
        {
            Options o;

            po::options_description desc( "chunk stream loopback options" );
            desc.add_options()( "help,h", "print usage message" )
                ( "config,c", po::value( &o.config ), "JSON file with the \"stream\" options" )
                ( "chunks,n", po::value( &o.chunks ), "number of chunks seeded into the upstream store" )
                ( "batch,b", po::value( &o.batch ), "maximal number of hashes offered per batch" )
                ( "timeout,t", po::value( &o.timeout_ms ), "milliseconds to wait for the chunks" );

            po::variables_map vm;
            po::store( parse_command_line( argc, argv, desc ), vm );
            po::notify( vm );

            if ( vm.count( "help" ) != 0 )
            {
                std::cerr << desc << "\n";
                return boost::none;
            }
            return o;
        }
        catch ( const std::exception &e )
        {
            std::cerr << e.what() << std::endl;
        }
        return boost::none;
    }

    libp2p::peer::PeerId makePeerId( const std::string &seed )
    {
        libp2p::crypto::ProtobufKey key( std::vector<uint8_t>( seed.begin(), seed.end() ) );
        return libp2p::peer::PeerId::fromPublicKey( key ).value();
    }

    /// Node of the demo: a store served and filled through one streamer
    struct Node
    {
        std::shared_ptr<storage::MemoryChunkStore> store;
        std::shared_ptr<Streamer>                  streamer;
    };

    Node makeNode( const StreamOptions &options, size_t batch_size, const base::Logger &logger )
    {
        Node node;
        node.store = std::make_shared<storage::MemoryChunkStore>();

        auto registry = std::make_shared<CapabilityRegistry>();
        auto store    = node.store;
        auto client_registered = registry->RegisterClientFunc(
            kStreamName,
            [store]( const libp2p::peer::PeerId &, const network::stream::ByteArray &, bool )
                -> outcome::result<std::shared_ptr<network::stream::Client>>
            { return std::make_shared<storage::MemoryStreamClient>( store ); } );
        auto server_registered = registry->RegisterServerFunc(
            kStreamName,
            [store, batch_size]( const libp2p::peer::PeerId &, const network::stream::ByteArray &, bool )
                -> outcome::result<std::shared_ptr<network::stream::Server>>
            { return std::make_shared<storage::MemoryStreamServer>( store, batch_size ); } );
        if ( !client_registered || !server_registered )
        {
            logger->error( "Stream {} could not be registered", kStreamName );
        }

        node.streamer = std::make_shared<Streamer>( registry, options );
        node.streamer->SetChunkDeliveryHandler(
            [store, logger]( const libp2p::peer::PeerId &, const network::stream::ChunkDeliveryMsg &delivery )
            {
                auto stored = store->put( delivery.hash, delivery.data );
                if ( !stored )
                {
                    logger->warn( "Chunk {} rejected: {}", delivery.hash.toHex(), stored.error().message() );
                }
            } );
        node.streamer->SetSubscriptionErrorHandler(
            [logger]( const libp2p::peer::PeerId &peer, const StreamID &stream, const std::error_code &error )
            { logger->error( "Subscription {} at {} failed: {}", stream.ToString(), peer.toBase58(), error.message() ); } );
        return node;
    }
}

int main( int argc, char **argv )
{
    auto options = parseCommandLine( argc, argv );
    if ( !options )
    {
        return EXIT_FAILURE;
    }

    auto logger = base::createLogger( "ChunkSyncLoopback" );

    StreamOptions stream_options;
    if ( !options->config.empty() )
    {
        auto loaded = network::stream::LoadStreamOptions( options->config );
        if ( !loaded )
        {
            logger->error( "Reading {} failed: {}", options->config, loaded.error().message() );
            return EXIT_FAILURE;
        }
        stream_options = loaded.value();
    }
    base::setLoggingLevel( stream_options.log_level );

    auto upstream_id   = makePeerId( "chunksync-loopback-upstream" );
    auto downstream_id = makePeerId( "chunksync-loopback-downstream" );

    auto upstream   = makeNode( stream_options, options->batch, logger );
    auto downstream = makeNode( stream_options, options->batch, logger );

    for ( size_t i = 0; i < options->chunks; ++i )
    {
        auto text = ( boost::format( "chunk %1% of %2%" ) % i % options->chunks ).str();
        upstream.store->put( network::stream::ByteArray( text.begin(), text.end() ) );
    }

    auto connected = upstream.streamer->AddPeer(
        downstream_id,
        std::make_shared<network::stream::LoopbackConnection>( upstream_id, downstream.streamer ) );
    if ( connected )
    {
        connected = downstream.streamer->AddPeer(
            upstream_id,
            std::make_shared<network::stream::LoopbackConnection>( downstream_id, upstream.streamer ) );
    }
    if ( !connected )
    {
        logger->error( "Connecting the nodes failed: {}", connected.error().message() );
        return EXIT_FAILURE;
    }

    StreamID stream( kStreamName, {}, false );
    network::stream::Range history{ 0, upstream.store->size() };
    auto subscribed = downstream.streamer->Subscribe( upstream_id, stream, history, stream_options.default_priority );
    if ( !subscribed )
    {
        logger->error( "Subscribing to {} failed: {}", stream.ToString(), subscribed.error().message() );
        return EXIT_FAILURE;
    }

    auto start    = std::chrono::steady_clock::now();
    auto deadline = start + std::chrono::milliseconds( options->timeout_ms );
    while ( downstream.store->size() < upstream.store->size() && std::chrono::steady_clock::now() < deadline )
    {
        std::this_thread::sleep_for( std::chrono::milliseconds( 10 ) );
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>( std::chrono::steady_clock::now() - start );

    auto received = downstream.store->size();
    auto unsubscribed = downstream.streamer->Unsubscribe( upstream_id, stream );
    if ( !unsubscribed )
    {
        logger->warn( "Unsubscribing from {} failed: {}", stream.ToString(), unsubscribed.error().message() );
    }
    downstream.streamer->Stop();
    upstream.streamer->Stop();

    if ( received < upstream.store->size() )
    {
        logger->error( "Received {} of {} chunks in {} ms", received, upstream.store->size(), elapsed.count() );
        return EXIT_FAILURE;
    }
    logger->info( "Received all {} chunks in {} ms", received, elapsed.count() );
    return EXIT_SUCCESS;
}
