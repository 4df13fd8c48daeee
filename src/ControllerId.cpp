#include "ControllerId.h"

namespace homepair {

	bool ControllerId::get( Uuid& id_ ) const {
		std::lock_guard<std::mutex> lock( this->m_idMutex );
		if ( this->m_set ) {
			id_ = this->m_id;
		}
		return this->m_set;
	};

	void ControllerId::set( const Uuid& id_ ) {
		std::lock_guard<std::mutex> lock( this->m_idMutex );
		this->m_id = id_;
		this->m_set = true;
	};

	void ControllerId::clear() {
		std::lock_guard<std::mutex> lock( this->m_idMutex );
		this->m_id = Uuid();
		this->m_set = false;
	};

}; // namespace homepair
