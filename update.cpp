#include "update.h"
#include <iostream>

using namespace std;

void UpdateInfo::init(const string &m_prefix)
{
	out << m_prefix;

	buffer_size = 0;
	num_complete = 0;
}

void UpdateInfo::flush()
{
	const string tmp = str();

	// Erase the previous message
	out << string(buffer_size, '\b')
		<< string(buffer_size, ' ')
		<< string(buffer_size, '\b');

	buffer_size = tmp.size();

	out << tmp;
	out.flush();

	// Clear the stringstream buffer
	str( string() );
}

void UpdateInfo::advance(const size_t &m_count)
{
	num_complete += m_count;

	if(num_total == 0){
		*this << num_complete;
	}
	else{
		*this << (100.0f*num_complete)/num_total << "% (" << num_complete
			<< " of " << num_total << ")";
	}

	flush();
}

void UpdateInfo::close()
{
	out << endl;

	// Clear the stringstream buffer
	str( string() );
}
