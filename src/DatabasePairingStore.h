#pragma once

#include <memory>

#include "PairingStore.h"

namespace homepair {

	class Database;

	// ====================
	// DatabasePairingStore
	// ====================

	class DatabasePairingStore final : public PairingStore {

	public:
		DatabasePairingStore( std::shared_ptr<Database> database_ );

		friend std::ostream& operator<<( std::ostream& out_, const DatabasePairingStore* ) { out_ << "Pairings"; return out_; }

		Pairing load( const Uuid& id_ ) const override;
		void save( const Pairing& pairing_ ) override;
		void remove( const Uuid& id_ ) override;
		std::vector<Pairing> list() const override;
		unsigned int count() const override;

	private:
		std::shared_ptr<Database> m_database;

		static Pairing _fromRow( const std::map<std::string, std::string>& row_ );

	}; // class DatabasePairingStore

}; // namespace homepair
