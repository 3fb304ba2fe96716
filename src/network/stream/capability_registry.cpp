#include "network/stream/capability_registry.hpp"

#include "network/stream/stream_error.hpp"

namespace csync::network::stream
{
    outcome::result<void> CapabilityRegistry::RegisterClientFunc( const std::string &name, ClientFunc func )
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        if ( sealed_.load() )
        {
            logger_->warn( "Client of stream {} registered after sealing", name );
            return StreamError::REGISTRY_SEALED;
        }
        entries_[name].client = std::move( func );
        logger_->debug( "Client of stream {} registered", name );
        return outcome::success();
    }

    outcome::result<void> CapabilityRegistry::RegisterServerFunc( const std::string &name, ServerFunc func )
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        if ( sealed_.load() )
        {
            logger_->warn( "Server of stream {} registered after sealing", name );
            return StreamError::REGISTRY_SEALED;
        }
        entries_[name].server = std::move( func );
        logger_->debug( "Server of stream {} registered", name );
        return outcome::success();
    }

    outcome::result<ClientFunc> CapabilityRegistry::GetClientFunc( const std::string &name ) const
    {
        auto entry = Find( name );
        if ( !entry || !entry->client )
        {
            return StreamError::STREAM_NOT_REGISTERED;
        }
        return entry->client;
    }

    outcome::result<ServerFunc> CapabilityRegistry::GetServerFunc( const std::string &name ) const
    {
        auto entry = Find( name );
        if ( !entry || !entry->server )
        {
            return StreamError::STREAM_NOT_REGISTERED;
        }
        return entry->server;
    }

    void CapabilityRegistry::Seal()
    {
        std::lock_guard<std::mutex> lock( mutex_ );
        if ( !sealed_.exchange( true ) )
        {
            logger_->info( "Registry sealed with {} stream kinds", entries_.size() );
        }
    }

    bool CapabilityRegistry::IsSealed() const
    {
        return sealed_.load();
    }

    boost::optional<CapabilityRegistry::Entry> CapabilityRegistry::Find( const std::string &name ) const
    {
        boost::optional<Entry> entry;
        if ( sealed_.load() )
        {
            auto it = entries_.find( name );
            if ( it != entries_.end() )
            {
                entry = it->second;
            }
            return entry;
        }
        std::lock_guard<std::mutex> lock( mutex_ );
        auto                        it = entries_.find( name );
        if ( it != entries_.end() )
        {
            entry = it->second;
        }
        return entry;
    }
}
