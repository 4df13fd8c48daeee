#pragma once

#include <vector>
#include <mutex>
#include <stdexcept>

#include "Pairing.h"
#include "Uuid.h"

namespace homepair {

	// ============
	// PairingStore
	// ============

	// Persists pairings keyed by their identifier. The individual operations do not lock; callers that need a
	// consistent view over more than one operation hold the lock returned by lock() for the duration.

	class PairingStore {

	public:
		class NotFoundException: public std::runtime_error {
		public:
			using runtime_error::runtime_error;
		}; // class NotFoundException

		class StoreException: public std::runtime_error {
		public:
			using runtime_error::runtime_error;
		}; // class StoreException

		PairingStore() { };
		virtual ~PairingStore() { };

		PairingStore( const PairingStore& ) = delete; // do not copy
		PairingStore& operator=( const PairingStore& ) = delete; // do not copy-assign

		friend std::ostream& operator<<( std::ostream& out_, const PairingStore* ) { out_ << "PairingStore"; return out_; }

		std::unique_lock<std::mutex> lock() const;

		virtual Pairing load( const Uuid& id_ ) const =0;
		virtual void save( const Pairing& pairing_ ) =0;
		virtual void remove( const Uuid& id_ ) =0;
		virtual std::vector<Pairing> list() const =0;
		virtual unsigned int count() const =0;

	protected:
		mutable std::mutex m_storeMutex;

	}; // class PairingStore

}; // namespace homepair
