#include "network/stream/stream_id.hpp"

#include "base/hexutil.hpp"

namespace csync::network::stream
{
    StreamID::StreamID( std::string name, ByteArray key, bool live ) :
        name_( std::move( name ) ), key_( std::move( key ) ), live_( live )
    {
    }

    StreamID StreamID::Historical() const
    {
        return StreamID( name_, key_, false );
    }

    std::string StreamID::ToString() const
    {
        return name_ + "|" + base::hex_lower( key_ ) + ( live_ ? "|l" : "|h" );
    }

    bool StreamID::operator==( const StreamID &other ) const
    {
        return live_ == other.live_ && name_ == other.name_ && key_ == other.key_;
    }

    bool StreamID::operator!=( const StreamID &other ) const
    {
        return !( *this == other );
    }

    std::ostream &operator<<( std::ostream &os, const StreamID &id )
    {
        return os << id.ToString();
    }

    const char *ToString( Priority priority )
    {
        switch ( priority )
        {
            case Priority::Low:
                return "low";
            case Priority::Mid:
                return "mid";
            case Priority::High:
                return "high";
            case Priority::Top:
                return "top";
        }
        return "unknown";
    }
}
