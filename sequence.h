#ifndef __SEQUENCE
#define __SEQUENCE

#include <string>
#include <deque>
#include "base_table.h"

// A single FASTA record. Template sequences are stored upper case; primer
// sequences are consumed as-is.
struct Sequence
{
	std::string def;
	std::string seq;

	Sequence()
	{
	};

	Sequence(const std::string &m_def, const std::string &m_seq) :
		def(m_def), seq(m_seq)
	{
	};

	inline size_t length() const
	{
		return seq.size();
	};

	inline bool empty() const
	{
		return seq.empty();
	};

	// The template name is the first white-space delimited word of the
	// defline (minus the leading '>')
	std::string name() const;
};

// Complement each IUPAC symbol (including ambiguity codes) and reverse the order.
// The case of each symbol is preserved.
std::string reverse_complement(const std::string &m_seq);

// True if the two IUPAC symbols share at least one concrete base (case-insensitive)
inline bool bases_match(char m_a, char m_b)
{
	if(m_a == m_b){
		return true;
	}

	return ( base_to_bits(m_a) & base_to_bits(m_b) ) != 0;
};

std::string to_upper(const std::string &m_seq);

// Number of unambiguous G and C bases
unsigned int gc_count(const std::string &m_seq);

// Right-pad the shorter of the two sequences with 'N' so that both
// sequences have the same length
void pad_to_equal_length(std::string &m_a, std::string &m_b);

// In parse_fasta.cpp
void parse_fasta(const std::string &m_filename, std::deque<Sequence> &m_dbase);

#endif // __SEQUENCE
