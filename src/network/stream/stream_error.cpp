#include "network/stream/stream_error.hpp"

#include <map>
#include <memory>
#include <mutex>

#include <boost/format.hpp>

OUTCOME_CPP_DEFINE_CATEGORY_3( csync::network::stream, StreamError, e )
{
    using E = csync::network::stream::StreamError;
    switch ( e )
    {
        case E::STREAM_NOT_REGISTERED:
            return "stream not registered";
        case E::REGISTRY_SEALED:
            return "stream registry is sealed";
        case E::UNKNOWN_PEER:
            return "unknown peer";
        case E::PEER_ALREADY_CONNECTED:
            return "peer already connected";
        case E::ALREADY_SUBSCRIBED:
            return "stream already subscribed";
        case E::NOT_SUBSCRIBED:
            return "stream not subscribed";
        case E::INVALID_HASHES_LENGTH:
            return "hashes length is not a multiple of the hash size";
        case E::INVALID_WANT_MASK:
            return "want mask does not match the offered batch";
        case E::UNKNOWN_MESSAGE_CODE:
            return "unknown message code";
        case E::FETCH_ABORTED:
            return "fetch aborted";
        case E::QUEUE_FULL:
            return "outgoing queue is full";
        case E::PEER_CLOSED:
            return "peer session closed";
    }
    return "unknown StreamError";
}

namespace csync::network::stream
{
    namespace
    {
        /**
         * Category carrying the name of one unregistered stream.
         * Instances live for the whole process, error codes keep a pointer to them.
         */
        class NotRegisteredCategory : public std::error_category
        {
        public:
            explicit NotRegisteredCategory( std::string stream_name ) : stream_name_( std::move( stream_name ) )
            {
            }

            const char *name() const noexcept override
            {
                return "StreamNotRegistered";
            }

            std::string message( int ) const override
            {
                return NotRegisteredMessage( stream_name_ );
            }

            std::error_condition default_error_condition( int ) const noexcept override
            {
                return std::error_condition( static_cast<int>( StreamError::STREAM_NOT_REGISTERED ),
                                             make_error_code( StreamError::STREAM_NOT_REGISTERED ).category() );
            }

        private:
            std::string stream_name_;
        };
    }

    std::string NotRegisteredMessage( const std::string &name )
    {
        return ( boost::format( "stream %1% not registered" ) % name ).str();
    }

    std::error_code MakeNotRegisteredError( const std::string &name )
    {
        static std::mutex                                                  mutex;
        static std::map<std::string, std::unique_ptr<NotRegisteredCategory>> categories;

        std::lock_guard<std::mutex> lock( mutex );
        auto                        it = categories.find( name );
        if ( it == categories.end() )
        {
            if ( categories.size() >= kMaxNamedErrors )
            {
                return make_error_code( StreamError::STREAM_NOT_REGISTERED );
            }
            it = categories.emplace( name, std::make_unique<NotRegisteredCategory>( name ) ).first;
        }
        return std::error_code( static_cast<int>( StreamError::STREAM_NOT_REGISTERED ), *it->second );
    }

    bool IsNotRegisteredError( const std::error_code &error )
    {
        return error.default_error_condition() ==
               make_error_code( StreamError::STREAM_NOT_REGISTERED ).default_error_condition();
    }
}
