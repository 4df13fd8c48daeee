#include <cstdio>
#include <unistd.h>
#include <ctime>
#include <tuple>
#include <iostream>

#include "Logger.h"

namespace homepair {

	// ======
	// Logger
	// ======

	void Logger::addReceiver( std::shared_ptr<Receiver> receiver_, LogLevel level_ ) {
		Logger& logger = Logger::get();
		std::lock_guard<std::mutex> lock( logger.m_receiversMutex );
		t_logReceiver receiver;
		receiver.receiver = receiver_;
		receiver.level = level_;
		receiver.last.level = Logger::LogLevel::NORMAL;
		receiver.last.count = 0;
		logger.m_receivers.push_back( receiver );
	};

	void Logger::removeReceiver( std::shared_ptr<Receiver> receiver_ ) {
		Logger& logger = Logger::get();
		std::lock_guard<std::mutex> lock( logger.m_receiversMutex );
		for ( auto receiversIt = logger.m_receivers.begin(); receiversIt != logger.m_receivers.end(); ) {
			if ( (*receiversIt).receiver.lock() == receiver_ ) {
				receiversIt = logger.m_receivers.erase( receiversIt );
			} else {
				receiversIt++;
			}
		}
	};

	void Logger::_doLog( const LogLevel& logLevel_, const std::string& message_, va_list* arguments_ ) {
		static char buffer[MAX_LOG_LINE_LENGTH];
		std::unique_lock<std::mutex> lock( this->m_receiversMutex );
		std::string message;
		if ( arguments_ ) {
			vsnprintf( buffer, sizeof( buffer ), message_.c_str(), *arguments_ );
			message.assign( buffer );
		} else {
			message = message_.substr( 0, MAX_LOG_LINE_LENGTH - 1 );
		}

		// First all log receivers eligible for this log message are gathered while the lock is held.
		std::vector<std::tuple<std::shared_ptr<Receiver>,LogLevel,std::string>> queue;
		for ( auto& receiverIt : this->m_receivers ) {
			std::shared_ptr<Receiver> receiver = receiverIt.receiver.lock();
			if (
				receiver
				&& logLevel_ <= receiverIt.level
			) {
				// Prevent logging the same message more than once per receiver. This can prevent endless-loops where
				// the logging of a message itself causes another log message.
				if (
					receiverIt.last.message == message
					&& receiverIt.last.level == logLevel_
				) {
					receiverIt.last.count++;
				} else {
					if ( receiverIt.last.count > 0 ) {
						queue.push_back( std::make_tuple( receiver, receiverIt.last.level, "Last message was repeated " + std::to_string( receiverIt.last.count ) + " times." ) );
					}
					receiverIt.last.message = message;
					receiverIt.last.level = logLevel_;
					receiverIt.last.count = 0;
					queue.push_back( std::make_tuple( receiver, logLevel_, message ) );
				}
			}
		}
		lock.unlock();

		// The actual logging is done with the lock released to make sure that any subsequent logging won't deadlock.
		for ( const auto& log : queue ) {
			std::get<0>( log )->log( std::get<1>( log ), std::get<2>( log ) );
		}
	};

	// =============
	// ConsoleLogger
	// =============

	ConsoleLogger::ConsoleLogger() :
		m_out( std::cerr ),
		m_colours( isatty( STDERR_FILENO ) == 1 )
	{
	};

	ConsoleLogger::ConsoleLogger( std::ostream& out_, bool colours_ ) :
		m_out( out_ ),
		m_colours( colours_ )
	{
	};

	void ConsoleLogger::log( const Logger::LogLevel& logLevel_, const std::string& message_ ) {
		time_t now = time( 0 );
		struct tm tstruct;
		char timebuf[80];
		localtime_r( &now, &tstruct );
		strftime( timebuf, sizeof( timebuf ), "%Y-%m-%d %H:%M:%S ", &tstruct );

		const char* colour = NULL;
		switch( logLevel_ ) {
			case Logger::LogLevel::WARNING:
				colour = "\033[0;36m";
				break;
			case Logger::LogLevel::ERROR:
				colour = "\033[0;31m";
				break;
			case Logger::LogLevel::VERBOSE:
			case Logger::LogLevel::DEBUG:
				colour = "\033[0;37m";
				break;
			case Logger::LogLevel::NOTICE:
				colour = "\033[0;33m";
				break;
			default:
				break;
		}
		if (
			this->m_colours
			&& colour != NULL
		) {
			this->m_out << colour << timebuf << message_ << "\033[0m\n";
		} else {
			this->m_out << timebuf << message_ << "\n";
		}
		this->m_out.flush();
	};

} // namespace homepair
