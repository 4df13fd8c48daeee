#pragma once

#include <string>
#include <map>
#include <vector>
#include <memory>
#include <mutex>
#include <sstream>
#include <iomanip>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace homepair {

	class Database;

	class SettingValue: public std::string {

	public:
		SettingValue( const unsigned long& value_ );
		SettingValue( const long& value_ );
		SettingValue( const unsigned int& value_ );
		SettingValue( const int& value_ );
		SettingValue( const double& value_ );
		SettingValue( const bool& value_ );
		SettingValue( const std::string& value_ );
		SettingValue( const char* value_ );
	}; // class SettingValue

	// ========
	// Settings
	// ========

	// Generic key/value settings stored in the settings table. The settings are read from the database on first
	// access and changes are written back on commit or destruction.

	class Settings final {

	public:
		Settings( std::shared_ptr<Database> database_ );
		~Settings();

		Settings( const Settings& ) = delete; // do not copy
		Settings& operator=( const Settings& ) = delete; // do not copy-assign

		friend std::ostream& operator<<( std::ostream& out_, const Settings* ) { out_ << "Settings"; return out_; }

		void commit();
		bool contains( const std::string& key_ ) const;
		void remove( const std::string& key_ );
		unsigned int count() const;
		bool isDirty() const;

		std::string get( const std::string& key_ ) const;
		template<typename V> V get( const std::string& key_ ) const {
			// Unfortunately, to be able to use all types, the implementation needs to be in the header.
			std::lock_guard<std::mutex> lock( this->m_settingsMutex );
			this->_populateOnce();
			V value;
			std::istringstream stream( this->m_settings.at( key_ ) );
			stream >> std::boolalpha >> std::fixed >> std::setprecision( 3 ) >> value;
			if ( stream.fail() ) {
				throw std::invalid_argument( "invalid value for setting " + key_ );
			}
			return value;
		};

		std::string get( const std::string& key_, const std::string& default_ ) const;
		template<typename V> V get( const std::string& key_, const V& default_ ) const {
			// Unfortunately, to be able to use all types, the implementation needs to be in the header.
			std::lock_guard<std::mutex> lock( this->m_settingsMutex );
			this->_populateOnce();
			auto find = this->m_settings.find( key_ );
			if ( find == this->m_settings.end() ) {
				return default_;
			}
			V value;
			std::istringstream( find->second ) >> std::boolalpha >> std::fixed >> std::setprecision( 3 ) >> value;
			return value;
		};

		void put( const std::string& key_, const SettingValue& value_ );
		void put( const nlohmann::json& data_ );

		std::map<std::string, std::string> getAll() const;

	private:
		std::shared_ptr<Database> m_database;
		// NOTE is marked mutable to allow the populate method to be called as late as possible.
		mutable std::map<std::string, std::string> m_settings;
		mutable bool m_populated;
		std::vector<std::string> m_dirty;
		mutable std::mutex m_settingsMutex;

		void _populateOnce() const;

	}; // class Settings

}; // namespace homepair
