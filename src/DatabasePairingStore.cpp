#include "DatabasePairingStore.h"

#include "Database.h"
#include "Logger.h"

namespace homepair {

	DatabasePairingStore::DatabasePairingStore( std::shared_ptr<Database> database_ ) :
		m_database( database_ )
	{
	};

	Pairing DatabasePairingStore::load( const Uuid& id_ ) const {
		try {
			auto row = this->m_database->getQueryRow(
				"SELECT `id`, `public_key`, `permissions` "
				"FROM `pairings` "
				"WHERE `id`=%Q",
				id_.toString().c_str()
			);
			return DatabasePairingStore::_fromRow( row );
		} catch( const Database::NoResultsException& ) {
			throw NotFoundException( "pairing " + id_.toString() + " not found" );
		} catch( const Database::QueryException& exception_ ) {
			throw StoreException( exception_.what() );
		}
	};

	void DatabasePairingStore::save( const Pairing& pairing_ ) {
		try {
			this->m_database->putQuery(
				"INSERT INTO `pairings` (`id`, `public_key`, `permissions`) "
				"VALUES (%Q, %Q, %d) "
				"ON CONFLICT(`id`) DO UPDATE "
				"SET `public_key`=excluded.`public_key`, `permissions`=excluded.`permissions`",
				pairing_.getId().toString().c_str(),
				hexEncode( pairing_.getPublicKey() ).c_str(),
				static_cast<int>( Pairing::permissionsToByte( pairing_.getPermissions() ) )
			);
		} catch( const Database::QueryException& exception_ ) {
			throw StoreException( exception_.what() );
		}
		Logger::logr( Logger::LogLevel::DEBUG, this, "Pairing %s saved.", pairing_.getId().toString().c_str() );
	};

	void DatabasePairingStore::remove( const Uuid& id_ ) {
		try {
			this->m_database->putQuery(
				"DELETE FROM `pairings` "
				"WHERE `id`=%Q",
				id_.toString().c_str()
			);
		} catch( const Database::QueryException& exception_ ) {
			throw StoreException( exception_.what() );
		}
		Logger::logr( Logger::LogLevel::DEBUG, this, "Pairing %s removed.", id_.toString().c_str() );
	};

	std::vector<Pairing> DatabasePairingStore::list() const {
		std::vector<Pairing> result;
		try {
			auto rows = this->m_database->getQuery(
				"SELECT `id`, `public_key`, `permissions` "
				"FROM `pairings` "
				"ORDER BY `rowid`"
			);
			for ( auto rowsIt = rows.begin(); rowsIt != rows.end(); rowsIt++ ) {
				result.push_back( DatabasePairingStore::_fromRow( *rowsIt ) );
			}
		} catch( const Database::QueryException& exception_ ) {
			throw StoreException( exception_.what() );
		}
		return result;
	};

	unsigned int DatabasePairingStore::count() const {
		try {
			return this->m_database->getQueryValue<unsigned int>(
				"SELECT COUNT(*) "
				"FROM `pairings`"
			);
		} catch( const Database::QueryException& exception_ ) {
			throw StoreException( exception_.what() );
		}
	};

	Pairing DatabasePairingStore::_fromRow( const std::map<std::string, std::string>& row_ ) {
		// A row that no longer maps onto a valid pairing means the table was tampered with.
		try {
			return Pairing(
				Uuid::parse( row_.at( "id" ) ),
				hexDecode( row_.at( "public_key" ) ),
				Pairing::permissionsFromByte( static_cast<uint8_t>( std::stoi( row_.at( "permissions" ) ) ) )
			);
		} catch( const std::exception& exception_ ) {
			throw StoreException( std::string( "invalid pairing record (" ) + exception_.what() + ")" );
		}
	};

}; // namespace homepair
