#ifndef CHUNKSYNC_NETWORK_STREAM_WANT_MASK_HPP
#define CHUNKSYNC_NETWORK_STREAM_WANT_MASK_HPP

#include <cstddef>

#include "network/stream/stream_id.hpp"
#include "outcome/outcome.hpp"

namespace csync::network::stream
{
    /**
     * @brief Selection of the hashes of one offered batch the client still needs.
     * One bit per offered hash, index 0 is the first hash of the offer. Bit i is stored in
     * byte i / 8 at bit position i % 8, counting from the least significant bit.
     */
    class WantMask
    {
    public:
        /**
         * @param length number of hashes in the offered batch
         */
        explicit WantMask( size_t length );

        /**
         * @brief Interprets received mask bytes for a batch of the given length
         * @return INVALID_WANT_MASK when the byte count does not match or a bit past the batch is set
         */
        static outcome::result<WantMask> FromBytes( size_t length, const ByteArray &bytes );

        void Set( size_t index );

        bool Test( size_t index ) const;

        size_t Length() const
        {
            return length_;
        }

        /// Number of set bits
        size_t Count() const;

        const ByteArray &Bytes() const
        {
            return bytes_;
        }

    private:
        size_t    length_;
        ByteArray bytes_;
    };
}

#endif // CHUNKSYNC_NETWORK_STREAM_WANT_MASK_HPP
