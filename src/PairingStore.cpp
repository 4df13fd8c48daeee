#include "PairingStore.h"

namespace homepair {

	std::unique_lock<std::mutex> PairingStore::lock() const {
		return std::unique_lock<std::mutex>( this->m_storeMutex );
	};

}; // namespace homepair
