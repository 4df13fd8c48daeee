#include "PairingStatus.h"

#include "Settings.h"
#include "PairingStore.h"
#include "Logger.h"

namespace homepair {

	const char* PairingStatus::pairedKey = "paired";

	PairingStatus::PairingStatus( std::shared_ptr<Settings> settings_, std::shared_ptr<PairingStore> store_ ) :
		m_settings( settings_ ),
		m_store( store_ )
	{
	};

	void PairingStatus::onEvent( const Event& event_ ) {
		switch( event_.getType() ) {
			case Event::Type::CONTROLLER_PAIRED:
				if ( ! this->isPaired() ) {
					Logger::log( Logger::LogLevel::NORMAL, this, "Accessory paired." );
				}
				this->m_settings->put( PairingStatus::pairedKey, true );
				break;

			case Event::Type::CONTROLLER_UNPAIRED: {
				unsigned int count;
				{
					auto lock = this->m_store->lock();
					count = this->m_store->count();
				}
				if ( count == 0 ) {
					Logger::log( Logger::LogLevel::NORMAL, this, "Last pairing removed, accessory is no longer paired." );
					this->m_settings->put( PairingStatus::pairedKey, false );
				}
				break;
			}
		}
	};

	bool PairingStatus::isPaired() const {
		return this->m_settings->get<bool>( PairingStatus::pairedKey, false );
	};

}; // namespace homepair
