#include <cassert>
#include <memory>
#include <vector>

#include "Event.h"

using namespace homepair;

namespace {

	class Recorder : public EventEmitter::Listener {

	public:
		std::vector<Event> events;

		void onEvent( const Event& event_ ) override {
			this->events.push_back( event_ );
		};

	}; // class Recorder

	// Emits a follow-up event from within a listener, as a listener is allowed to.
	class Forwarder : public EventEmitter::Listener {

	public:
		Forwarder( EventEmitter& emitter_ ) : m_emitter( emitter_ ) { };

		void onEvent( const Event& event_ ) override {
			if ( event_.getType() == Event::Type::CONTROLLER_PAIRED ) {
				this->m_emitter.emit( Event( Event::Type::CONTROLLER_UNPAIRED, event_.getId() ) );
			}
		};

	private:
		EventEmitter& m_emitter;

	}; // class Forwarder

} // namespace

int main() {

	Uuid id = Uuid::parse( "a5d67b71-1a7f-4b0f-9d7e-1c8b6c2f0e11" );
	EventEmitter emitter;

	// Nothing happens without listeners.
	emitter.emit( Event( Event::Type::CONTROLLER_PAIRED, id ) );

	auto recorder = std::make_shared<Recorder>();
	emitter.addListener( recorder );
	emitter.emit( Event( Event::Type::CONTROLLER_PAIRED, id ) );
	assert( recorder->events.size() == 1 );
	assert( recorder->events[0].getType() == Event::Type::CONTROLLER_PAIRED );
	assert( recorder->events[0].getId() == id );

	auto forwarder = std::make_shared<Forwarder>( emitter );
	emitter.addListener( forwarder );
	emitter.emit( Event( Event::Type::CONTROLLER_PAIRED, id ) );
	assert( recorder->events.size() == 3 );
	assert( recorder->events[2].getType() == Event::Type::CONTROLLER_UNPAIRED );

	emitter.removeListener( forwarder );
	emitter.emit( Event( Event::Type::CONTROLLER_UNPAIRED, id ) );
	assert( recorder->events.size() == 4 );

	// Listeners that no longer exist are skipped.
	recorder = nullptr;
	emitter.emit( Event( Event::Type::CONTROLLER_PAIRED, id ) );

	assert( Event::resolveTextType( Event::Type::CONTROLLER_UNPAIRED ) == "controller unpaired" );

	return 0;
}
