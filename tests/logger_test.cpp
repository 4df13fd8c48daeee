#include <cassert>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "Logger.h"

using namespace homepair;

namespace {

	class Capture : public Logger::Receiver {

	public:
		std::vector<std::string> messages;

		void log( const Logger::LogLevel& logLevel_, const std::string& message_ ) override {
			this->messages.push_back( message_ );
		};

	}; // class Capture

} // namespace

int main() {

	auto capture = Logger::addReceiver<Capture>( Logger::LogLevel::NORMAL );

	// Messages above the level of the receiver are dropped.
	Logger::log( Logger::LogLevel::VERBOSE, "Test", "Not shown." );
	Logger::logr( Logger::LogLevel::NORMAL, "Test", "Pairing %s added as %s.", "a", "user" );
	assert( capture->messages.size() == 1 );
	assert( capture->messages[0] == "[Test] Pairing a added as user." );

	// Repeated messages are collapsed.
	Logger::log( Logger::LogLevel::WARNING, "Test", "Rejected." );
	Logger::log( Logger::LogLevel::WARNING, "Test", "Rejected." );
	Logger::log( Logger::LogLevel::WARNING, "Test", "Rejected." );
	assert( capture->messages.size() == 2 );
	Logger::log( Logger::LogLevel::ERROR, "Test", "Failed." );
	assert( capture->messages.size() == 4 );
	assert( capture->messages[2] == "Last message was repeated 2 times." );
	assert( capture->messages[3] == "[Test] Failed." );

	// Format characters in plain messages are left alone.
	Logger::log( Logger::LogLevel::NORMAL, "Test", "100%s" );
	assert( capture->messages.back() == "[Test] 100%s" );

	Logger::removeReceiver( capture );
	Logger::log( Logger::LogLevel::ERROR, "Test", "Gone." );
	assert( capture->messages.size() == 5 );

	std::stringstream out;
	auto console = Logger::addReceiver<ConsoleLogger>( Logger::LogLevel::DEBUG, out, false );
	Logger::log( Logger::LogLevel::ERROR, "Test", "Plain." );
	assert( out.str().find( "[Test] Plain.\n" ) != std::string::npos );
	assert( out.str().find( '\033' ) == std::string::npos );
	Logger::removeReceiver( console );

	return 0;
}
