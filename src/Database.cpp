// https://blogs.gnome.org/jnelson/2015/01/06/sqlite-vacuum-and-auto_vacuum/

#include <sstream>
#include <cstdarg>

#include "Database.h"
#include "Structs.h"
#include "Logger.h"

namespace homepair {

	Database::Database( const std::string& filename_ ) : m_connection( NULL ), m_queries( 0 ) {
		int result = sqlite3_open_v2( filename_.c_str(), &this->m_connection, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, NULL );
		if ( result == SQLITE_OK ) {
			Logger::logr( Logger::LogLevel::VERBOSE, this, "Database %s opened.", filename_.c_str() );
			try {
				this->_init();
			} catch( const std::runtime_error& exception_ ) {
				Logger::logr( Logger::LogLevel::ERROR, this, "Unable to initialize database %s (%s).", filename_.c_str(), exception_.what() );
				sqlite3_close( this->m_connection );
				this->m_connection = NULL;
				throw;
			}
		} else {
			// Even if opening fails sqlite allocates a connection handle which needs to be released.
			Logger::logr( Logger::LogLevel::ERROR, this, "Unable to open database %s (%s).", filename_.c_str(), sqlite3_errstr( result ) );
			sqlite3_close( this->m_connection );
			this->m_connection = NULL;
			throw QueryException( "unable to open database " + filename_ );
		}
	};

	Database::~Database() {
		int result = sqlite3_close( this->m_connection );
		if ( SQLITE_OK == result ) {
			Logger::logr( Logger::LogLevel::VERBOSE, this, "Database closed after %llu queries.", this->m_queries );
		} else {
			const char *error = sqlite3_errmsg( this->m_connection );
			Logger::logr( Logger::LogLevel::ERROR, this, "Database was not closed properly (%s).", error );
		}
	};

	std::vector<std::map<std::string, std::string>> Database::getQuery( const std::string query_, ... ) const {
		std::vector<std::map<std::string, std::string>> result;

		va_list arguments;
		va_start( arguments, query_ );
		try {
			this->_wrapQuery( query_, arguments, [&result]( sqlite3_stmt *statement_ ) {
				while ( SQLITE_ROW == sqlite3_step( statement_ ) ) {
					result.push_back( Database::_readRow( statement_ ) );
				}
			} );
		} catch( ... ) {
			va_end( arguments );
			throw; // re-throw exception
		}
		va_end( arguments );

		return result;
	};

	std::map<std::string, std::string> Database::getQueryRow( const std::string query_, ... ) const {
		std::map<std::string, std::string> result;

		va_list arguments;
		va_start( arguments, query_ );
		try {
			this->_wrapQuery( query_, arguments, [&result]( sqlite3_stmt *statement_ ) {
				if ( SQLITE_ROW != sqlite3_step( statement_ ) ) {
					throw NoResultsException( "resultset doesn't contain any rows" );
				}
				result = Database::_readRow( statement_ );
			} );
		} catch( ... ) {
			va_end( arguments );
			throw; // re-throw exception
		}
		va_end( arguments );

		return result;
	};

	std::map<std::string, std::string> Database::getQueryMap( const std::string query_, ... ) const {
		std::map<std::string, std::string> result;

		va_list arguments;
		va_start( arguments, query_ );
		try {
			this->_wrapQuery( query_, arguments, [&result]( sqlite3_stmt *statement_ ) {
				if ( 2 != sqlite3_column_count( statement_ ) ) {
					throw InvalidResultException( "resultset doesn't contain exactly two columns" );
				}
				while ( SQLITE_ROW == sqlite3_step( statement_ ) ) {
					result[Database::_readColumn( statement_, 0 )] = Database::_readColumn( statement_, 1 );
				}
			} );
		} catch( ... ) {
			va_end( arguments );
			throw; // re-throw exception
		}
		va_end( arguments );

		return result;
	};

	template<typename T> T Database::getQueryValue( const std::string query_, ... ) const {
		std::string result;

		va_list arguments;
		va_start( arguments, query_ );
		try {
			this->_wrapQuery( query_, arguments, [&result]( sqlite3_stmt *statement_ ) {
				result = Database::_readValue( statement_ );
			} );
		} catch( ... ) {
			va_end( arguments );
			throw; // re-throw exception
		}
		va_end( arguments );

		T value;
		std::istringstream stream( result );
		stream >> value;
		if ( stream.fail() ) {
			throw InvalidResultException( "value " + result + " has an unexpected type" );
		}
		return value;
	};

	// The above template is instantiated for the types listed below.
	template unsigned int Database::getQueryValue( const std::string query_, ... ) const;

	// Strings are returned as is, without passing through a stream that would stop at the first whitespace.
	template<> std::string Database::getQueryValue<std::string>( const std::string query_, ... ) const {
		std::string result;

		va_list arguments;
		va_start( arguments, query_ );
		try {
			this->_wrapQuery( query_, arguments, [&result]( sqlite3_stmt *statement_ ) {
				result = Database::_readValue( statement_ );
			} );
		} catch( ... ) {
			va_end( arguments );
			throw; // re-throw exception
		}
		va_end( arguments );

		return result;
	};

	long Database::putQuery( const std::string query_, ... ) const {
		long insertId = -1;

		va_list arguments;
		va_start( arguments, query_ );
		try {
			this->_wrapQuery( query_, arguments, [this,&insertId]( sqlite3_stmt *statement_ ) {
				if ( SQLITE_DONE != sqlite3_step( statement_ ) ) {
					const char *error = sqlite3_errmsg( this->m_connection );
					Logger::logr( Logger::LogLevel::ERROR, this, "Query rejected (%s).", error );
					throw QueryException( error );
				} else {
					insertId = sqlite3_last_insert_rowid( this->m_connection );
				}
			} );
		} catch( ... ) {
			va_end( arguments );
			throw; // re-throw exception
		}
		va_end( arguments );

		return insertId;
	};

	void Database::_init() const {
		// OFF = safe from crashes, not from system failures
		// NORMAL = ok
		this->putQuery( "PRAGMA synchronous=NORMAL" );
		this->putQuery( "PRAGMA foreign_keys=ON" );
		std::string mode = this->getQueryValue<std::string>( "PRAGMA journal_mode=WAL" );
		Logger::logr( Logger::LogLevel::DEBUG, this, "Using journal mode %s.", mode.c_str() );

		Logger::log( Logger::LogLevel::NORMAL, this, "Optimizing database." );
		this->putQuery( "VACUUM" );

		unsigned int version = this->getQueryValue<unsigned int>( "PRAGMA user_version" );
		if ( version < c_queries.size() ) {
			for ( auto queryIt = c_queries.begin() + version; queryIt != c_queries.end(); queryIt++ ) {
				this->putQuery( *queryIt );
			}
			this->putQuery( "PRAGMA user_version=%d", static_cast<int>( c_queries.size() ) );
		}
	};

	void Database::_wrapQuery( const std::string& query_, va_list arguments_, const std::function<void(sqlite3_stmt*)>&& process_ ) const {
		if ( ! this->m_connection ) {
			Logger::log( Logger::LogLevel::ERROR, this, "Database not open." );
			throw QueryException( "database not open" );
		}

		char* query = sqlite3_vmprintf( query_.c_str(), arguments_ );
		if ( ! query ) {
			Logger::log( Logger::LogLevel::ERROR, this, "Out of memory or invalid printf style query." );
			throw QueryException( "invalid printf style query" );
		}

#ifdef _DEBUG
		Logger::log( Logger::LogLevel::DEBUG, this, std::string( query ) );
#endif // _DEBUG

		sqlite3_stmt *statement;
		if ( SQLITE_OK == sqlite3_prepare_v2( this->m_connection, query, -1, &statement, NULL ) ) {
			try {
				process_( statement );
			} catch( ... ) {
				sqlite3_finalize( statement );
				sqlite3_free( query );
				throw; // re-throw exception
			}
			sqlite3_finalize( statement );
			this->m_queries++;
		} else {
			const char* error = sqlite3_errmsg( this->m_connection );
			Logger::logr( Logger::LogLevel::ERROR, this, "Query rejected (%s).", error );
			sqlite3_free( query );
			throw QueryException( error );
		}

		sqlite3_free( query );
	};

	std::string Database::_readColumn( sqlite3_stmt *statement_, int column_ ) {
		// NULL columns are read as empty strings.
		const unsigned char* value = sqlite3_column_text( statement_, column_ );
		if ( value != NULL ) {
			return std::string( reinterpret_cast<const char*>( value ), sqlite3_column_bytes( statement_, column_ ) );
		}
		return "";
	};

	std::map<std::string, std::string> Database::_readRow( sqlite3_stmt *statement_ ) {
		std::map<std::string, std::string> row;
		int columns = sqlite3_column_count( statement_ );
		for ( int column = 0; column < columns; column++ ) {
			row[sqlite3_column_name( statement_, column )] = Database::_readColumn( statement_, column );
		}
		return row;
	};

	std::string Database::_readValue( sqlite3_stmt *statement_ ) {
		if ( SQLITE_ROW != sqlite3_step( statement_ ) ) {
			throw NoResultsException( "resultset doesn't contain any rows" );
		}
		if ( sqlite3_column_count( statement_ ) != 1 ) {
			throw InvalidResultException( "resultset doesn't contain exactly one column" );
		}
		return Database::_readColumn( statement_, 0 );
	};

} // namespace homepair
