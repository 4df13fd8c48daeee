#include <algorithm>

#include "Arguments.h"

namespace homepair {

	Arguments::Arguments( int &argc_, char **argv_ ) {
		if ( argc_ > 0 ) {
			this->m_program = std::string( argv_[0] );
		}
		for ( int i = 1; i < argc_; ++i ) {
			this->m_arguments.push_back( std::string( argv_[i] ) );
		}
	};

	std::string Arguments::get( std::initializer_list<std::string> options_, const std::string& default_ ) const {
		auto argumentIt = this->_find( options_ );
		if (
			argumentIt != this->m_arguments.end()
			&& ++argumentIt != this->m_arguments.end()
		) {
			return *argumentIt;
		}
		return default_;
	};

	bool Arguments::exists( std::initializer_list<std::string> options_ ) const {
		return this->_find( options_ ) != this->m_arguments.end();
	};

	std::vector<std::string>::const_iterator Arguments::_find( std::initializer_list<std::string> options_ ) const {
		return std::find_first_of( this->m_arguments.begin(), this->m_arguments.end(), options_.begin(), options_.end() );
	};

}; // namespace homepair
