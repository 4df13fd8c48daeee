#include "Config.h"
#include "Settings.h"
#include "Logger.h"

namespace homepair {

	const char* Config::maxPeersKey = "max_peers";

	Config::Config( std::shared_ptr<Settings> settings_ ) :
		m_settings( settings_ )
	{
	};

	bool Config::getMaxPeers( unsigned int& maxPeers_ ) const {
		if ( ! this->m_settings->contains( Config::maxPeersKey ) ) {
			return false;
		}
		try {
			maxPeers_ = this->m_settings->get<unsigned int>( Config::maxPeersKey );
			return true;
		} catch( const std::invalid_argument& ) {
			Logger::logr( Logger::LogLevel::WARNING, this, "Ignoring invalid %s setting.", Config::maxPeersKey );
			return false;
		}
	};

	void Config::setMaxPeers( unsigned int maxPeers_ ) {
		this->m_settings->put( Config::maxPeersKey, maxPeers_ );
	};

	void Config::clearMaxPeers() {
		this->m_settings->remove( Config::maxPeersKey );
	};

}; // namespace homepair
