#include "network/stream/want_mask.hpp"

#include "network/stream/stream_error.hpp"

namespace csync::network::stream
{
    namespace
    {
        size_t ByteCount( size_t length )
        {
            return ( length + 7 ) / 8;
        }
    }

    WantMask::WantMask( size_t length ) : length_( length ), bytes_( ByteCount( length ), 0 )
    {
    }

    outcome::result<WantMask> WantMask::FromBytes( size_t length, const ByteArray &bytes )
    {
        if ( bytes.size() != ByteCount( length ) )
        {
            return StreamError::INVALID_WANT_MASK;
        }
        WantMask mask( length );
        mask.bytes_ = bytes;
        for ( size_t bit = length; bit < bytes.size() * 8; ++bit )
        {
            if ( mask.Test( bit ) )
            {
                return StreamError::INVALID_WANT_MASK;
            }
        }
        return mask;
    }

    void WantMask::Set( size_t index )
    {
        bytes_[index / 8] |= static_cast<uint8_t>( 1u << ( index % 8 ) );
    }

    bool WantMask::Test( size_t index ) const
    {
        return ( bytes_[index / 8] & ( 1u << ( index % 8 ) ) ) != 0;
    }

    size_t WantMask::Count() const
    {
        size_t count = 0;
        for ( size_t i = 0; i < length_; ++i )
        {
            if ( Test( i ) )
            {
                ++count;
            }
        }
        return count;
    }
}
