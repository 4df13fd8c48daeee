#include "Settings.h"

#include "Database.h"
#include "Logger.h"

namespace homepair {

	using namespace nlohmann;

	SettingValue::SettingValue( const unsigned long& value_ ) {
		this->assign( std::to_string( value_ ) );
	};

	SettingValue::SettingValue( const long& value_ ) {
		this->assign( std::to_string( value_ ) );
	};

	SettingValue::SettingValue( const unsigned int& value_ ) {
		this->assign( std::to_string( value_ ) );
	};

	SettingValue::SettingValue( const int& value_ ) {
		this->assign( std::to_string( value_ ) );
	};

	SettingValue::SettingValue( const double& value_ ) {
		std::stringstream ss;
		ss << std::fixed << std::setprecision( 6 ) << value_;
		this->assign( ss.str() );
	};

	SettingValue::SettingValue( const bool& value_ ) {
		std::stringstream ss;
		ss << std::boolalpha << value_;
		this->assign( ss.str() );
	};

	SettingValue::SettingValue( const std::string& value_ ) {
		this->assign( value_ );
	};

	SettingValue::SettingValue( const char* value_ ) {
		this->assign( value_ );
	};

	Settings::Settings( std::shared_ptr<Database> database_ ) :
		m_database( database_ ),
		m_populated( false )
	{
	};

	Settings::~Settings() {
		if ( this->isDirty() ) {
			try {
				this->commit();
			} catch( const std::runtime_error& exception_ ) {
				Logger::logr( Logger::LogLevel::ERROR, this, "Unable to commit settings (%s).", exception_.what() );
			}
		}
	};

	void Settings::commit() {
		std::lock_guard<std::mutex> lock( this->m_settingsMutex );
		for ( auto dirtyIt = this->m_dirty.begin(); dirtyIt != this->m_dirty.end(); dirtyIt++ ) {
			auto setting = this->m_settings.find( *dirtyIt );
			if ( setting != this->m_settings.end() ) {
				this->m_database->putQuery(
					"REPLACE INTO `settings` (`key`, `value`) "
					"VALUES (%Q, %Q)",
					setting->first.c_str(),
					setting->second.c_str()
				);
			} else {
				this->m_database->putQuery(
					"DELETE FROM `settings` "
					"WHERE `key`=%Q ",
					( *dirtyIt ).c_str()
				);
			}
		}
		this->m_dirty.clear();
	};

	bool Settings::contains( const std::string& key_ ) const {
		std::lock_guard<std::mutex> lock( this->m_settingsMutex );
		this->_populateOnce();
		return this->m_settings.find( key_ ) != this->m_settings.end();
	};

	void Settings::remove( const std::string& key_ ) {
		std::lock_guard<std::mutex> lock( this->m_settingsMutex );
		this->_populateOnce();
		this->m_settings.erase( key_ );
		this->m_dirty.push_back( key_ );
	};

	unsigned int Settings::count() const {
		std::lock_guard<std::mutex> lock( this->m_settingsMutex );
		this->_populateOnce();
		return this->m_settings.size();
	};

	bool Settings::isDirty() const {
		std::lock_guard<std::mutex> lock( this->m_settingsMutex );
		return this->m_dirty.size() > 0;
	};

	std::string Settings::get( const std::string& key_ ) const {
		std::lock_guard<std::mutex> lock( this->m_settingsMutex );
		this->_populateOnce();
		return this->m_settings.at( key_ );
	};

	std::string Settings::get( const std::string& key_, const std::string& default_ ) const {
		std::lock_guard<std::mutex> lock( this->m_settingsMutex );
		this->_populateOnce();
		auto find = this->m_settings.find( key_ );
		if ( find != this->m_settings.end() ) {
			return find->second;
		} else {
			return default_;
		}
	};

	void Settings::put( const std::string& key_, const SettingValue& value_ ) {
		std::lock_guard<std::mutex> lock( this->m_settingsMutex );
		this->_populateOnce();
		if (
			this->m_settings.find( key_ ) == this->m_settings.end() // does not exist
			|| value_ != this->m_settings.at( key_ ) // is not the same
		) {
			this->m_settings[key_] = value_;
			this->m_dirty.push_back( key_ );
		}
	};

	void Settings::put( const json& data_ ) {
		if ( ! data_.is_object() ) {
			throw std::runtime_error( "settings should be a json object" );
		}
		for ( auto dataIt = data_.begin(); dataIt != data_.end(); dataIt++ ) {
			if ( (*dataIt).is_string() ) {
				this->put( dataIt.key(), (*dataIt).get<std::string>() );
			} else if ( (*dataIt).is_number_float() ) {
				this->put( dataIt.key(), (*dataIt).get<double>() );
			} else if ( (*dataIt).is_number() ) {
				this->put( dataIt.key(), (*dataIt).get<long>() );
			} else if ( (*dataIt).is_boolean() ) {
				this->put( dataIt.key(), (*dataIt).get<bool>() );
			} else if ( (*dataIt).is_null() ) {
				this->remove( dataIt.key() );
			} else {
				throw std::runtime_error( "invalid type for setting " + dataIt.key() );
			}
		}
	};

	std::map<std::string, std::string> Settings::getAll() const {
		std::lock_guard<std::mutex> lock( this->m_settingsMutex );
		this->_populateOnce();
		std::map<std::string, std::string> result;
		result.insert( this->m_settings.begin(), this->m_settings.end() );
		return result;
	};

	void Settings::_populateOnce() const {
		// NOTE Only call this method with held lock on settings mutex.
		if ( ! this->m_populated ) {
			this->m_settings.clear();
			auto results = this->m_database->getQueryMap(
				"SELECT `key`, `value` "
				"FROM `settings` "
			);
			this->m_settings.insert( results.begin(), results.end() );
			this->m_populated = true;
		}
	};

}; // namespace homepair
