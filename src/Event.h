#pragma once

#include <vector>
#include <map>
#include <memory>
#include <mutex>

#include "Utils.h"
#include "Uuid.h"

namespace homepair {

	// =====
	// Event
	// =====

	class Event final {

	public:
		enum class Type: unsigned short {
			CONTROLLER_PAIRED   = 1,
			CONTROLLER_UNPAIRED = 2
		}; // enum class Type
		static const std::map<Type, std::string> TypeText;
		ENUM_UTIL_W_TEXT( Type, TypeText );

		Event( const Type& type_, const Uuid& id_ ) : m_type( type_ ), m_id( id_ ) { };

		friend std::ostream& operator<<( std::ostream& out_, const Event* event_ ) { out_ << "Event " << event_->m_type; return out_; }

		Type getType() const { return this->m_type; };
		const Uuid& getId() const { return this->m_id; };

	private:
		Type m_type;
		Uuid m_id;

	}; // class Event

	// ============
	// EventEmitter
	// ============

	// Dispatches events to the registered listeners, one event at a time. Listeners are called from the thread that
	// emits the event and may emit further events or (un)register listeners themselves.

	class EventEmitter final {

	public:
		class Listener {

		public:
			virtual ~Listener() { };
			virtual void onEvent( const Event& event_ ) = 0;

		}; // class Listener

		EventEmitter() { };

		EventEmitter( const EventEmitter& ) = delete; // do not copy
		EventEmitter& operator=( const EventEmitter& ) = delete; // do not copy-assign

		friend std::ostream& operator<<( std::ostream& out_, const EventEmitter* ) { out_ << "Events"; return out_; }

		void addListener( std::shared_ptr<Listener> listener_ );
		void removeListener( std::shared_ptr<Listener> listener_ );
		void emit( const Event& event_ );

	private:
		std::vector<std::weak_ptr<Listener>> m_listeners;
		mutable std::mutex m_listenersMutex;
		mutable std::recursive_mutex m_emitMutex;

	}; // class EventEmitter

}; // namespace homepair
