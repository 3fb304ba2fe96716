#ifndef CHUNKSYNC_NETWORK_STREAM_FETCH_BARRIER_HPP
#define CHUNKSYNC_NETWORK_STREAM_FETCH_BARRIER_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "network/stream/fetch_handle.hpp"

namespace csync::network::stream
{
    /**
     * @brief Join over the fetch handles of one batch.
     * The completion runs exactly once: with success after every handle resolved successfully,
     * or with the first failure. An aborted barrier never runs its completion.
     */
    class FetchBarrier : public std::enable_shared_from_this<FetchBarrier>
    {
        /// Restricts construction to Create
        struct CreateToken
        {
            explicit CreateToken() = default;
        };

    public:
        using Completion = std::function<void( outcome::result<void> )>;

        static std::shared_ptr<FetchBarrier> Create( std::vector<std::shared_ptr<FetchHandle>> handles,
                                                     Completion                                completion );

        FetchBarrier( CreateToken, std::vector<std::shared_ptr<FetchHandle>> handles, Completion completion );

        /// Detaches the barrier from its handles, the handles themselves stay untouched
        void Abort();

        bool IsDone() const;

        size_t Pending() const;

    private:
        void Start();

        void OnHandleResolved( const outcome::result<void> &result );

        mutable std::mutex                        mutex_;
        std::vector<std::shared_ptr<FetchHandle>> handles_;
        Completion                                completion_;
        size_t                                    pending_;
        bool                                      done_ = false;
    };
}

#endif // CHUNKSYNC_NETWORK_STREAM_FETCH_BARRIER_HPP
