#pragma once

#include <string>
#include <vector>
#include <initializer_list>

namespace homepair {

	// =========
	// Arguments
	// =========

	// Command line options. Every option can be given under several names, for instance -d and --datadir.

	class Arguments final {

	public:
		Arguments( int &argc_, char **argv_ );

		std::string get( std::initializer_list<std::string> options_, const std::string& default_ = "" ) const;
		bool exists( std::initializer_list<std::string> options_ ) const;
		const std::string& getProgram() const { return this->m_program; };

	private:
		std::string m_program;
		std::vector<std::string> m_arguments;

		std::vector<std::string>::const_iterator _find( std::initializer_list<std::string> options_ ) const;

	}; // class Arguments

}; // namespace homepair
