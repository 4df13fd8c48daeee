#pragma once

#include <mutex>

#include "Uuid.h"

namespace homepair {

	// ============
	// ControllerId
	// ============

	// The identifier of the controller on the other end of the session, as established by pair-verify. A session
	// that has not been verified has no identifier.

	class ControllerId final {

	public:
		ControllerId() : m_set( false ) { };

		friend std::ostream& operator<<( std::ostream& out_, const ControllerId* ) { out_ << "Controller"; return out_; }

		// Returns false if the session has no identifier, otherwise stores the identifier in id_.
		bool get( Uuid& id_ ) const;
		void set( const Uuid& id_ );
		void clear();

	private:
		bool m_set;
		Uuid m_id;
		mutable std::mutex m_idMutex;

	}; // class ControllerId

}; // namespace homepair
