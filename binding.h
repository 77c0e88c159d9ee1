#ifndef __BINDING
#define __BINDING

#include <string>
#include <vector>
#include <deque>
#include "pcr_config.h"

// The number of 3' (and 5') terminal bases used for end-specific analysis
#define	TERMINAL_REGION_LENGTH		5

// Penalties (kcal/mol) for the 3' end dinucleotide stacks that are not perfect matches
#define	THREE_PRIME_MISMATCH_PENALTY	1.5f
#define	THREE_PRIME_DEGEN_PENALTY	0.5f

// Per-mismatch reduction in binding Tm (degrees C)
#define	THREE_PRIME_MISMATCH_TM_PENALTY	10.0f
#define	FIVE_PRIME_MISMATCH_TM_PENALTY	5.0f

#define	MIN_BINDING_TM			30.0f
#define	MAX_BINDING_TM			90.0f

// 3' end stability limits (kcal/mol) for advisory notes
#define	THREE_PRIME_DG_STRONG		-9.0f
#define	THREE_PRIME_DG_WEAK		-3.0f

typedef enum {
	Seq_strand_plus,
	Seq_strand_minus
} Strand;

inline char strand_symbol(const Strand &m_strand)
{
	return (m_strand == Seq_strand_plus) ? '+' : '-';
};

//////////////////////////////////////////////////////////////////////////////////////////////////////
// A candidate primer binding site. The position is always the 0-indexed start of the binding
// site on the plus strand of the template, regardless of the primer strand:
//
// 5' ---[F------>]-----------------------[<------R]--- 3' (template plus strand)
//       ^ forward.position               ^ reverse.position
//
// The target sequence and alignment string are written 5' -> 3' in the orientation of the
// primer, so the last character is always the primer 3' end.
//////////////////////////////////////////////////////////////////////////////////////////////////////
struct PrimerBinding
{
	std::string name;
	std::string primer_seq;
	std::string target_seq;

	Strand strand;
	int position;

	unsigned int matches;
	unsigned int mismatches;
	float match_percent;

	// The number of perfectly matched bases at the primer 3' end
	unsigned int three_prime_match;
	float three_prime_dg;

	unsigned int five_prime_mismatch;

	float binding_tm;
	float binding_dg;

	bool is_valid;
	std::deque<std::string> notes;

	std::string alignment;

	PrimerBinding() :
		strand(Seq_strand_plus), position(0), matches(0), mismatches(0),
		match_percent(0.0f), three_prime_match(0), three_prime_dg(0.0f),
		five_prime_mismatch(0), binding_tm(0.0f), binding_dg(0.0f),
		is_valid(false)
	{
	};

	inline size_t length() const
	{
		return primer_seq.size();
	};
};

// Sort bindings by decreasing match percentage, then by decreasing 3' match
struct sort_by_binding_quality
{
	inline bool operator()(const PrimerBinding &m_a, const PrimerBinding &m_b) const
	{
		if(m_a.match_percent != m_b.match_percent){
			return (m_a.match_percent > m_b.match_percent);
		}

		return (m_a.three_prime_match > m_b.three_prime_match);
	};
};

// In binding.cpp
float match_percent(const unsigned int &m_matches, const size_t &m_len);

unsigned int count_matches(const std::string &m_primer, const std::string &m_target);

unsigned int three_prime_run(const std::string &m_primer, const std::string &m_target);

float three_prime_dg(const std::string &m_primer_3, const std::string &m_target_3,
	const float &m_na_conc);

float binding_tm(const std::string &m_primer, const std::string &m_target);

// Evaluate a single primer/target alignment. Both sequences are 5' -> 3' in the orientation
// of the primer. Sequences of unequal length are right-padded with 'N'.
PrimerBinding analyze_binding(const std::string &m_name,
	const std::string &m_primer, const std::string &m_target,
	const Strand &m_strand, const int &m_position,
	const PCRConfig &m_config);

// In binding_search.cpp
void find_binding_sites(std::vector<PrimerBinding> &m_bindings,
	const std::string &m_name, const std::string &m_primer,
	const std::string &m_template, const Strand &m_strand,
	const PCRConfig &m_config);

size_t count_valid(const std::vector<PrimerBinding> &m_bindings);

#endif // __BINDING
