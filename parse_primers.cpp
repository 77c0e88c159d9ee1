#include "ampsim.h"

#include <fstream>
#include <sstream>

using namespace std;

void parse_primer_file(const string &m_filename, deque<PrimerPair> &m_primers)
{
	ifstream fin( m_filename.c_str() );

	if(!fin){
		throw __FILE__ ":parse_primer_file: Unable to open primer file for reading";
	}

	parse_primers(fin, m_primers);
}

void parse_primers(istream &m_in, deque<PrimerPair> &m_primers)
{
	string line;

	while( getline(m_in, line) ){

		// Strip comments
		const string::size_type loc = line.find('#');

		if(loc != string::npos){
			line = line.substr(0, loc);
		}

		stringstream ssin(line);

		PrimerPair p;

		if( !(ssin >> p.name) ){

			// Skip empty lines
			continue;
		}

		if( !(ssin >> p.forward >> p.reverse) ){
			throw __FILE__ ":parse_primers: Expected \"name forward reverse\"";
		}

		string extra;

		if(ssin >> extra){
			throw __FILE__ ":parse_primers: Unexpected text after reverse primer";
		}

		for(string::const_iterator i = p.forward.begin();i != p.forward.end();++i){
			base_to_bits(*i);
		}

		for(string::const_iterator i = p.reverse.begin();i != p.reverse.end();++i){
			base_to_bits(*i);
		}

		m_primers.push_back(p);
	}
}
