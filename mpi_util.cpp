#include "mpi_util.h"
#include "ampsim.h"
#include <string.h>

using namespace std;

// MPI messages
#define	REPORT_LEN	2000
#define	REPORT_DATA	2001

/////////////////////////////////////////////////////////////////////////////////////////
// Specialization for std::string
/////////////////////////////////////////////////////////////////////////////////////////
template<>
size_t mpi_size<string>(const string &m_str)
{
	return sizeof(size_t) + m_str.size();
}

template<>
unsigned char* mpi_pack<string>(unsigned char* m_ptr, const string &m_str)
{
	size_t len = m_str.size();

	memcpy( m_ptr, &len, sizeof(size_t) );
	m_ptr += sizeof(size_t);

	memcpy(m_ptr, m_str.c_str(), len);
	m_ptr += len;

	return m_ptr;
}

template<>
unsigned char* mpi_unpack<string>(unsigned char* m_ptr, string &m_str)
{
	size_t len;

	memcpy( &len, m_ptr, sizeof(size_t) );
	m_ptr += sizeof(size_t);

	m_str.assign( (char*)m_ptr, len );
	m_ptr += len;

	return m_ptr;
}

/////////////////////////////////////////////////////////////////////////////////////////
// Specialization for Sequence
/////////////////////////////////////////////////////////////////////////////////////////

template<>
size_t mpi_size(const Sequence &m_obj)
{
	return mpi_size(m_obj.def) + mpi_size(m_obj.seq);
};

template<>
unsigned char* mpi_unpack(unsigned char* m_ptr, Sequence &m_obj)
{
	m_ptr = mpi_unpack(m_ptr, m_obj.def);
	m_ptr = mpi_unpack(m_ptr, m_obj.seq);

	return m_ptr;
}

template<>
unsigned char* mpi_pack(unsigned char* m_ptr, const Sequence &m_obj)
{
	m_ptr = mpi_pack(m_ptr, m_obj.def);
	m_ptr = mpi_pack(m_ptr, m_obj.seq);

	return m_ptr;
}

/////////////////////////////////////////////////////////////////////////////////////////
// Specialization for PrimerPair
/////////////////////////////////////////////////////////////////////////////////////////

template<>
size_t mpi_size(const PrimerPair &m_obj)
{
	size_t ret = 0;

	#define VARIABLE(A, B) ret += mpi_size(m_obj.B);
		PRIMER_PAIR_MEMBERS
	#undef VARIABLE

	return ret;
};

template<>
unsigned char* mpi_unpack(unsigned char* m_ptr, PrimerPair &m_obj)
{
	#define VARIABLE(A, B) m_ptr = mpi_unpack(m_ptr, m_obj.B);
		PRIMER_PAIR_MEMBERS
	#undef VARIABLE

	return m_ptr;
}

template<>
unsigned char* mpi_pack(unsigned char* m_ptr, const PrimerPair &m_obj)
{
	#define VARIABLE(A, B) m_ptr = mpi_pack(m_ptr, m_obj.B);
		PRIMER_PAIR_MEMBERS
	#undef VARIABLE

	return m_ptr;
}

/////////////////////////////////////////////////////////////////////////////////////////
// Specialization for PCRConfig
/////////////////////////////////////////////////////////////////////////////////////////

template<>
size_t mpi_size(const PCRConfig &m_obj)
{
	size_t ret = 0;

	#define VARIABLE(A, B) ret += mpi_size(m_obj.B);
		PCR_CONFIG_MEMBERS
	#undef VARIABLE

	return ret;
};

template<>
unsigned char* mpi_unpack(unsigned char* m_ptr, PCRConfig &m_obj)
{
	#define VARIABLE(A, B) m_ptr = mpi_unpack(m_ptr, m_obj.B);
		PCR_CONFIG_MEMBERS
	#undef VARIABLE

	return m_ptr;
}

template<>
unsigned char* mpi_pack(unsigned char* m_ptr, const PCRConfig &m_obj)
{
	#define VARIABLE(A, B) m_ptr = mpi_pack(m_ptr, m_obj.B);
		PCR_CONFIG_MEMBERS
	#undef VARIABLE

	return m_ptr;
}

/////////////////////////////////////////////////////////////////////////////////////////
// Specialization for Options
/////////////////////////////////////////////////////////////////////////////////////////

template<>
size_t mpi_size(const Options &m_obj)
{
	size_t ret = 0;

	#define VARIABLE(A, B) ret += mpi_size(m_obj.B);
		OPTIONS_MEMBERS
	#undef VARIABLE

	return ret;
};

template<>
unsigned char* mpi_unpack(unsigned char* m_ptr, Options &m_obj)
{
	#define VARIABLE(A, B) m_ptr = mpi_unpack(m_ptr, m_obj.B);
		OPTIONS_MEMBERS
	#undef VARIABLE

	return m_ptr;
}

template<>
unsigned char* mpi_pack(unsigned char* m_ptr, const Options &m_obj)
{
	#define VARIABLE(A, B) m_ptr = mpi_pack(m_ptr, m_obj.B);
		OPTIONS_MEMBERS
	#undef VARIABLE

	return m_ptr;
}

/////////////////////////////////////////////////////////////////////////////////////////
// Collect the rendered reports on rank 0
/////////////////////////////////////////////////////////////////////////////////////////
void gather_reports(deque<string> &m_output, const size_t &m_num_job,
	int m_rank, int m_numtasks)
{
	if(m_numtasks <= 1){
		return;
	}

	if(m_rank == 0){

		// Reports indexed by rank, in the order that each rank ran its jobs
		vector< deque<string> > local(m_numtasks);

		local[0].swap(m_output);

		MPI_Status status;

		for(int task = 1;task < m_numtasks;++task){

			unsigned int len = 0;

			if(MPI_Recv(&len, 1, MPI_UNSIGNED, task, REPORT_LEN, MPI_COMM_WORLD, &status) != MPI_SUCCESS){
				throw __FILE__ ":gather_reports: Error receiving msg";
			}

			unsigned char *buffer = new unsigned char[len];

			if(buffer == NULL){
				throw __FILE__ ":gather_reports: Unable to allocate receive buffer";
			}

			if(MPI_Recv(buffer, len, MPI_BYTE, task, REPORT_DATA, MPI_COMM_WORLD, &status) != MPI_SUCCESS){

				delete [] buffer;
				throw __FILE__ ":gather_reports: Error receiving data";
			}

			mpi_unpack(buffer, local[task]);

			delete [] buffer;
		}

		m_output.clear();

		for(size_t i = 0;i < m_num_job;++i){

			const deque<string> &src = local[i%m_numtasks];
			const size_t index = i/m_numtasks;

			if( index >= src.size() ){
				throw __FILE__ ":gather_reports: Missing report";
			}

			m_output.push_back(src[index]);
		}
	}
	else{

		unsigned int len = mpi_size(m_output);

		unsigned char *buffer = new unsigned char[len];

		if(buffer == NULL){
			throw __FILE__ ":gather_reports: Unable to allocate send buffer";
		}

		mpi_pack(buffer, m_output);

		if(MPI_Send( (void*)&len, 1, MPI_UNSIGNED, 0, REPORT_LEN, MPI_COMM_WORLD ) != MPI_SUCCESS){

			delete [] buffer;
			throw __FILE__ ":gather_reports: Error sending msg";
		}

		if(MPI_Send(buffer, len, MPI_BYTE, 0, REPORT_DATA, MPI_COMM_WORLD ) != MPI_SUCCESS){

			delete [] buffer;
			throw __FILE__ ":gather_reports: Error sending data";
		}

		delete [] buffer;
	}
}
