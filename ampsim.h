#ifndef __AMPSIM
#define __AMPSIM

#include <string>
#include <deque>
#include <iostream>
#include "sequence.h"
#include "pcr_config.h"
#include "mpi_util.h"

#define	AMPSIM_MAJOR_VERSION	"0"
#define	AMPSIM_MINOR_VERSION	"2"

// A named pair of PCR primers, both written 5' -> 3'
struct PrimerPair
{
	#define PRIMER_PAIR_MEMBERS \
		VARIABLE(std::string, name) \
		VARIABLE(std::string, forward) \
		VARIABLE(std::string, reverse)

	#define VARIABLE(A, B) A B;
		PRIMER_PAIR_MEMBERS
	#undef VARIABLE

	PrimerPair()
	{
	};

	PrimerPair(const std::string &m_name, const std::string &m_forward,
		const std::string &m_reverse) :
		name(m_name), forward(m_forward), reverse(m_reverse)
	{
	};
};

template<> size_t mpi_size(const PrimerPair &m_obj);
template<> unsigned char* mpi_pack(unsigned char* m_ptr, const PrimerPair &m_obj);
template<> unsigned char* mpi_unpack(unsigned char* m_ptr, PrimerPair &m_obj);

template<> size_t mpi_size(const Sequence &m_obj);
template<> unsigned char* mpi_pack(unsigned char* m_ptr, const Sequence &m_obj);
template<> unsigned char* mpi_unpack(unsigned char* m_ptr, Sequence &m_obj);

template<> size_t mpi_size(const PCRConfig &m_obj);
template<> unsigned char* mpi_pack(unsigned char* m_ptr, const PCRConfig &m_obj);
template<> unsigned char* mpi_unpack(unsigned char* m_ptr, PCRConfig &m_obj);

struct Options
{
	typedef enum {
		SILENT,
		VERBOSE,
		EVERYTHING,
		UNKNOWN_VERBOSITY
	} Verbosity;

	typedef enum {
		TEXT_OUTPUT,
		JSON_OUTPUT,
		FASTA_OUTPUT,
		UNKNOWN_OUTPUT
	} OutputFormat;

	// Use X Macros (https://en.wikipedia.org/wiki/X_Macro) to
	// ensure that structure variable are correctly serialized.
	#define OPTIONS_MEMBERS \
		VARIABLE(Verbosity, output_filter) \
		VARIABLE(OutputFormat, output_format) \
		VARIABLE(std::string, template_filename) \
		VARIABLE(std::string, primer_filename) \
		VARIABLE(std::string, forward_primer) \
		VARIABLE(std::string, reverse_primer) \
		VARIABLE(std::string, output_filename) \
		VARIABLE(unsigned int, max_thread) \
		VARIABLE(PCRConfig, config) \
		VARIABLE(bool, quit) \
		VARIABLE(bool, error)

	#define VARIABLE(A, B) A B;
		OPTIONS_MEMBERS
	#undef VARIABLE

	Options();

	void load(int argc, char *argv[]);
};

template<> size_t mpi_size(const Options &m_obj);
template<> unsigned char* mpi_pack(unsigned char* m_ptr, const Options &m_obj);
template<> unsigned char* mpi_unpack(unsigned char* m_ptr, Options &m_obj);

// In parse_primers.cpp
// Read whitespace delimited "name forward reverse" lines. Text following a '#' is a comment.
void parse_primer_file(const std::string &m_filename, std::deque<PrimerPair> &m_primers);
void parse_primers(std::istream &m_in, std::deque<PrimerPair> &m_primers);

// In options.cpp
std::string tolower(const std::string &m_str);

#endif // __AMPSIM
