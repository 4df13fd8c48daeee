#include "Event.h"
#include "Logger.h"

namespace homepair {

	const std::map<Event::Type, std::string> Event::TypeText = {
		{ Event::Type::CONTROLLER_PAIRED, "controller paired" },
		{ Event::Type::CONTROLLER_UNPAIRED, "controller unpaired" },
	};

	void EventEmitter::addListener( std::shared_ptr<Listener> listener_ ) {
		std::lock_guard<std::mutex> lock( this->m_listenersMutex );
		this->m_listeners.push_back( listener_ );
	};

	void EventEmitter::removeListener( std::shared_ptr<Listener> listener_ ) {
		std::lock_guard<std::mutex> lock( this->m_listenersMutex );
		for ( auto listenerIt = this->m_listeners.begin(); listenerIt != this->m_listeners.end(); ) {
			auto listener = listenerIt->lock();
			if (
				! listener
				|| listener == listener_
			) {
				listenerIt = this->m_listeners.erase( listenerIt );
			} else {
				listenerIt++;
			}
		}
	};

	void EventEmitter::emit( const Event& event_ ) {
		std::lock_guard<std::recursive_mutex> emitLock( this->m_emitMutex );

		// The listeners are collected first and called without holding the listeners mutex so they are free to
		// register or remove listeners.
		std::vector<std::shared_ptr<Listener>> listeners;
		{
			std::lock_guard<std::mutex> lock( this->m_listenersMutex );
			for ( auto listenerIt = this->m_listeners.begin(); listenerIt != this->m_listeners.end(); ) {
				auto listener = listenerIt->lock();
				if ( listener ) {
					listeners.push_back( listener );
					listenerIt++;
				} else {
					listenerIt = this->m_listeners.erase( listenerIt );
				}
			}
		}

		Logger::logr( Logger::LogLevel::DEBUG, this, "Emitting %s event for %s to %zu listener(s).", Event::resolveTextType( event_.getType() ).c_str(), event_.getId().toString().c_str(), listeners.size() );
		for ( auto listenerIt = listeners.begin(); listenerIt != listeners.end(); listenerIt++ ) {
			( *listenerIt )->onEvent( event_ );
		}
	};

}; // namespace homepair
