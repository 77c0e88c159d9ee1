#ifndef __MPI_UTIL
#define __MPI_UTIL

#include <mpi.h>

#include <string>
#include <deque>
#include <vector>
#include <string.h>

// Serialization for sending and receiving objects with MPI. The default templates handle
// plain old data types. Objects that own memory (strings, containers and structures that
// contain them) provide their own specializations.

template<class T>
size_t mpi_size(const T &m_obj)
{
	return sizeof(m_obj);
}

template<class T>
unsigned char* mpi_pack(unsigned char* m_ptr, const T &m_obj)
{
	memcpy( m_ptr, &m_obj, sizeof(m_obj) );
	m_ptr += sizeof(m_obj);

	return m_ptr;
}

template<class T>
unsigned char* mpi_unpack(unsigned char* m_ptr, T &m_obj)
{
	memcpy( &m_obj, m_ptr, sizeof(m_obj) );
	m_ptr += sizeof(m_obj);

	return m_ptr;
}

template<> size_t mpi_size(const std::string &m_str);
template<> unsigned char* mpi_pack(unsigned char* m_ptr, const std::string &m_str);
template<> unsigned char* mpi_unpack(unsigned char* m_ptr, std::string &m_str);

/////////////////////////////////////////////////////////////////////////////////////////
// Overloads for std::deque
/////////////////////////////////////////////////////////////////////////////////////////
template<class T>
size_t mpi_size(const std::deque<T> &m_obj)
{
	size_t ret = sizeof(size_t);

	for(typename std::deque<T>::const_iterator i = m_obj.begin();i != m_obj.end();++i){
		ret += mpi_size(*i);
	}

	return ret;
}

template<class T>
unsigned char* mpi_pack(unsigned char* m_ptr, const std::deque<T> &m_obj)
{
	size_t len = m_obj.size();

	memcpy( m_ptr, &len, sizeof(size_t) );
	m_ptr += sizeof(size_t);

	for(typename std::deque<T>::const_iterator i = m_obj.begin();i != m_obj.end();++i){
		m_ptr = mpi_pack(m_ptr, *i);
	}

	return m_ptr;
}

template<class T>
unsigned char* mpi_unpack(unsigned char* m_ptr, std::deque<T> &m_obj)
{
	size_t len;

	memcpy( &len, m_ptr, sizeof(size_t) );
	m_ptr += sizeof(size_t);

	m_obj.clear();
	m_obj.resize(len);

	for(typename std::deque<T>::iterator i = m_obj.begin();i != m_obj.end();++i){
		m_ptr = mpi_unpack(m_ptr, *i);
	}

	return m_ptr;
}

// Send an object from the m_src rank to all other ranks
template<class T>
void broadcast(T &m_obj, int m_rank, int m_src)
{
	unsigned int len = (m_rank == m_src) ? mpi_size(m_obj) : 0;

	MPI_Bcast( (void*)&len, 1, MPI_UNSIGNED, m_src, MPI_COMM_WORLD );

	unsigned char *buffer = new unsigned char[len];

	if(buffer == NULL){
		throw __FILE__ ":broadcast: Unable to allocate buffer";
	}

	if(m_rank == m_src){
		mpi_pack(buffer, m_obj);
	}

	MPI_Bcast(buffer, len, MPI_BYTE, m_src, MPI_COMM_WORLD);

	if(m_rank != m_src){
		mpi_unpack(buffer, m_obj);
	}

	delete [] buffer;
}

// Collect the per-rank report strings on rank 0. On return, rank 0 holds every report in
// global job order, assuming that job j was assigned to rank j % m_numtasks (round-robin).
// The m_output deque is unchanged on all other ranks.
void gather_reports(std::deque<std::string> &m_output, const size_t &m_num_job,
	int m_rank, int m_numtasks);

#endif // __MPI_UTIL
