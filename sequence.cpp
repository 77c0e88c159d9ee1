#include "sequence.h"
#include <ctype.h>

using namespace std;

string Sequence::name() const
{
	string::const_iterator begin = def.begin();

	while( ( begin != def.end() ) && ( (*begin == '>') || isspace(*begin) ) ){
		++begin;
	}

	string::const_iterator end = begin;

	while( ( end != def.end() ) && !isspace(*end) ){
		++end;
	}

	return string(begin, end);
}

string reverse_complement(const string &m_seq)
{
	string ret(m_seq.size(), 'N');

	string::iterator out = ret.begin();

	for(string::const_reverse_iterator i = m_seq.rbegin();i != m_seq.rend();++i, ++out){
		*out = complement_base(*i);
	}

	return ret;
}

string to_upper(const string &m_seq)
{
	string ret(m_seq);

	for(string::iterator i = ret.begin();i != ret.end();++i){
		*i = toupper(*i);
	}

	return ret;
}

unsigned int gc_count(const string &m_seq)
{
	unsigned int ret = 0;

	for(string::const_iterator i = m_seq.begin();i != m_seq.end();++i){

		switch(*i){
			case 'G': case 'g':
			case 'C': case 'c':
				++ret;
				break;
		};
	}

	return ret;
}

void pad_to_equal_length(string &m_a, string &m_b)
{
	if( m_a.size() < m_b.size() ){
		m_a.append(m_b.size() - m_a.size(), 'N');
	}
	else if( m_b.size() < m_a.size() ){
		m_b.append(m_a.size() - m_b.size(), 'N');
	}
}
