#pragma once

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <stdexcept>
#include <ostream>
#include <stdarg.h>

#include <sqlite3.h>

namespace homepair {

	class Database final {

	public:
		class NoResultsException: public std::runtime_error {
		public:
			using runtime_error::runtime_error;
		}; // class NoResultsException

		class InvalidResultException: public std::runtime_error {
		public:
			using runtime_error::runtime_error;
		}; // class InvalidResultException

		class QueryException: public std::runtime_error {
		public:
			using runtime_error::runtime_error;
		}; // class QueryException

		Database( const std::string& filename_ );
		~Database();

		Database( const Database& ) = delete; // do not copy
		Database& operator=( const Database& ) = delete; // do not copy-assign
		Database( const Database&& ) = delete; // do not move
		Database& operator=( Database&& ) = delete; // do not move-assign

		friend std::ostream& operator<<( std::ostream& out_, const Database* ) { out_ << "Database"; return out_; }

		std::vector<std::map<std::string, std::string>> getQuery( const std::string query_, ... ) const;
		std::map<std::string, std::string> getQueryRow( const std::string query_, ... ) const;
		std::map<std::string, std::string> getQueryMap( const std::string query_, ... ) const;
		template<typename T> T getQueryValue( const std::string query_, ... ) const;
		long putQuery( const std::string query_, ... ) const;

	private:
		sqlite3 *m_connection;
		mutable unsigned long long m_queries;

		void _init() const;
		static std::string _readColumn( sqlite3_stmt *statement_, int column_ );
		static std::map<std::string, std::string> _readRow( sqlite3_stmt *statement_ );
		static std::string _readValue( sqlite3_stmt *statement_ );
		void _wrapQuery( const std::string& query_, va_list arguments_, const std::function<void(sqlite3_stmt*)>&& process_ ) const;

	}; // class Database

	template<> std::string Database::getQueryValue<std::string>( const std::string query_, ... ) const;

}; // namespace homepair
