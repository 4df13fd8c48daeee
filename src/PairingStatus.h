#pragma once

#include <memory>

#include "Event.h"

namespace homepair {

	class Settings;
	class PairingStore;

	// =============
	// PairingStatus
	// =============

	// Keeps the paired setting in sync with the pairings in the store. The accessory advertises itself as
	// unpaired once the last pairing is removed.

	class PairingStatus final : public EventEmitter::Listener {

	public:
		static const char* pairedKey;

		PairingStatus( std::shared_ptr<Settings> settings_, std::shared_ptr<PairingStore> store_ );

		friend std::ostream& operator<<( std::ostream& out_, const PairingStatus* ) { out_ << "Status"; return out_; }

		void onEvent( const Event& event_ ) override;
		bool isPaired() const;

	private:
		std::shared_ptr<Settings> m_settings;
		std::shared_ptr<PairingStore> m_store;

	}; // class PairingStatus

}; // namespace homepair
