#pragma once

#include <string>
#include <mutex>
#include <memory>
#include <vector>
#include <sstream>
#include <ostream>
#include <utility>
#include <cstddef>
#include <stdarg.h>

#include "Utils.h"

#define MAX_LOG_LINE_LENGTH 65536

namespace homepair {

	// ======
	// Logger
	// ======

	class Logger final {

	public:
		enum class LogLevel: int {
			ERROR   = -99,
			WARNING = -98,
			NOTICE  = -1,
			NORMAL  = 0,
			VERBOSE = 1,
			DEBUG   = 99
		}; // enum class LogLevel
		ENUM_UTIL( LogLevel );

		// ========
		// Receiver
		// ========

		class Receiver {

		public:
			virtual ~Receiver() { };
			virtual void log( const LogLevel& logLevel_, const std::string& message_ ) = 0;

		}; // class Receiver

		Logger( const Logger& ) = delete; // do not copy
		Logger& operator=( const Logger& ) = delete; // do not copy-assign

		template<class T> static void logr( const LogLevel logLevel_, const T& instance_, std::string message_, ... ) {
			Logger& logger = Logger::get();
			std::stringstream message;
			message << "[" << instance_ << "] " << message_;
			va_list arguments;
			va_start( arguments, message_ );
			logger._doLog( logLevel_, message.str(), &arguments );
			va_end( arguments );
		};
		template<class T> static void log( const LogLevel logLevel_, const T& instance_, std::string message_ ) {
			Logger& logger = Logger::get();
			std::stringstream message;
			message << "[" << instance_ << "] " << message_;
			logger._doLog( logLevel_, message.str(), NULL );
		};

		static void addReceiver( std::shared_ptr<Receiver> receiver_, LogLevel level_ );
		static void removeReceiver( std::shared_ptr<Receiver> receiver_ );

		template<class T, typename... A> static std::shared_ptr<T> addReceiver( LogLevel level_, A&&... arguments_ ) {
			std::shared_ptr<T> receiver = std::make_shared<T>( std::forward<A>( arguments_ )... );
			Logger::addReceiver( receiver, level_ );
			return receiver;
		};

	private:
		struct t_logReceiver {
			std::weak_ptr<Receiver> receiver;
			LogLevel level;
			struct {
				std::string message;
				LogLevel level;
				unsigned int count;
			} last;
		};
		std::vector<t_logReceiver> m_receivers;
		mutable std::mutex m_receiversMutex;

		Logger() { }; // private constructor
		~Logger() { }; // private destructor

		static Logger& get() {
			// In c++11 static initialization is supposed to be thread-safe.
			static Logger instance;
			return instance;
		}

		// Formats the message if arguments_ is set, otherwise the message is logged as is.
		void _doLog( const LogLevel& logLevel_, const std::string& message_, va_list* arguments_ );

	}; // class Logger

	// =============
	// ConsoleLogger
	// =============

	// Writes timestamped lines to a stream, stderr by default. Colours are only used when the stream is a terminal.

	class ConsoleLogger : public Logger::Receiver {

	public:
		ConsoleLogger();
		ConsoleLogger( std::ostream& out_, bool colours_ );

		void log( const Logger::LogLevel& logLevel_, const std::string& message_ ) override;

	private:
		std::ostream& m_out;
		bool m_colours;

	}; // class ConsoleLogger

}; // namespace homepair
