#ifndef CHUNKSYNC_NETWORK_STREAM_STREAM_ERROR_HPP
#define CHUNKSYNC_NETWORK_STREAM_STREAM_ERROR_HPP

#include <cstddef>
#include <string>
#include <system_error>

#include "outcome/outcome.hpp"

namespace csync::network::stream
{
    /**
     * @brief Failures of the stream subscription layer
     */
    enum class StreamError
    {
        STREAM_NOT_REGISTERED = 1, ///< no factory registered for the stream name
        REGISTRY_SEALED,           ///< registration attempted after the registry was sealed
        UNKNOWN_PEER,              ///< no session for the peer
        PEER_ALREADY_CONNECTED,    ///< a session for the peer already exists
        ALREADY_SUBSCRIBED,        ///< an entry for the stream already exists
        NOT_SUBSCRIBED,            ///< no entry for the stream
        INVALID_HASHES_LENGTH,     ///< hash buffer is not a multiple of the hash size
        INVALID_WANT_MASK,         ///< want mask does not match the offered batch
        UNKNOWN_MESSAGE_CODE,      ///< message code is not part of the protocol
        FETCH_ABORTED,             ///< fetch handle was aborted before it resolved
        QUEUE_FULL,                ///< outgoing queue of the priority is at capacity
        PEER_CLOSED,               ///< peer session was closed
    };

    /// Text of the refusal for a stream name without registered factory
    std::string NotRegisteredMessage( const std::string &name );

    /**
     * @brief Makes the error returned to a local caller when a stream name has no registered factory.
     * The message is NotRegisteredMessage( name ), the default error condition is the one of
     * StreamError::STREAM_NOT_REGISTERED. Past kMaxNamedErrors distinct names the plain
     * STREAM_NOT_REGISTERED code is returned.
     * @param name stream kind name
     */
    std::error_code MakeNotRegisteredError( const std::string &name );

    /// Number of distinct names MakeNotRegisteredError keeps a category for
    constexpr size_t kMaxNamedErrors = 256;

    /**
     * @brief Checks whether the error reports a stream without registered factory
     */
    bool IsNotRegisteredError( const std::error_code &error );
}

OUTCOME_HPP_DECLARE_ERROR_2( csync::network::stream, StreamError );

#endif // CHUNKSYNC_NETWORK_STREAM_STREAM_ERROR_HPP
