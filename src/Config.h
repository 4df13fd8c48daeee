#pragma once

#include <memory>
#include <ostream>

namespace homepair {

	class Settings;

	// ======
	// Config
	// ======

	// Typed access to the settings that influence pairing management.

	class Config final {

	public:
		static const char* maxPeersKey;

		Config( std::shared_ptr<Settings> settings_ );

		friend std::ostream& operator<<( std::ostream& out_, const Config* ) { out_ << "Config"; return out_; }

		// Returns false when no limit is configured, otherwise stores the limit in maxPeers_.
		bool getMaxPeers( unsigned int& maxPeers_ ) const;
		void setMaxPeers( unsigned int maxPeers_ );
		void clearMaxPeers();

	private:
		std::shared_ptr<Settings> m_settings;

	}; // class Config

}; // namespace homepair
