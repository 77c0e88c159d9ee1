#include "binding.h"
#include "sequence.h"
#include <math.h>
#include <ctype.h>
#include <sstream>
#include <algorithm>

using namespace std;

float nearest_neighbor_dg(char m_5, char m_3);
float round_to(const double &m_value, const double &m_scale);
string format_float(const float &m_value, const int &m_precision);

float match_percent(const unsigned int &m_matches, const size_t &m_len)
{
	if(m_len == 0){
		return 0.0f;
	}

	return (100.0f*m_matches)/m_len;
}

unsigned int count_matches(const string &m_primer, const string &m_target)
{
	const size_t len = min( m_primer.size(), m_target.size() );

	unsigned int ret = 0;

	for(size_t i = 0;i < len;++i){
		ret += bases_match(m_primer[i], m_target[i]) ? 1 : 0;
	}

	return ret;
}

// The number of consecutive matching bases, starting from the 3' end of the primer
// (i.e. the last base) and stopping at the first mismatch.
unsigned int three_prime_run(const string &m_primer, const string &m_target)
{
	unsigned int ret = 0;

	string::const_reverse_iterator p = m_primer.rbegin();
	string::const_reverse_iterator t = m_target.rbegin();

	for(;(p != m_primer.rend()) && (t != m_target.rend());++p, ++t){

		if( !bases_match(*p, *t) ){
			break;
		}

		++ret;
	}

	return ret;
}

// A simplified nearest-neighbor estimate of the 3' end free energy (kcal/mol). Every
// dinucleotide that is an exact match contributes its stacking energy; a dinucleotide that
// is only compatible through an IUPAC ambiguity code costs THREE_PRIME_DEGEN_PENALTY and
// a dinucleotide containing a true mismatch costs THREE_PRIME_MISMATCH_PENALTY.
// The sum is scaled by a monovalent salt correction and rounded to 0.01 kcal/mol.
float three_prime_dg(const string &m_primer_3, const string &m_target_3,
	const float &m_na_conc)
{
	const size_t len = min( m_primer_3.size(), m_target_3.size() );

	double total_dg = 0.0;

	for(size_t i = 0;(i + 1) < len;++i){

		const char p1 = toupper(m_primer_3[i]);
		const char p2 = toupper(m_primer_3[i + 1]);
		const char t1 = toupper(m_target_3[i]);
		const char t2 = toupper(m_target_3[i + 1]);

		if( !bases_match(p1, t1) || !bases_match(p2, t2) ){
			total_dg += THREE_PRIME_MISMATCH_PENALTY;
		}
		else if( (p1 == t1) && (p2 == t2) ){
			total_dg += nearest_neighbor_dg(p1, p2);
		}
		else{
			total_dg += THREE_PRIME_DEGEN_PENALTY;
		}
	}

	const double salt_factor = 1.0 + 0.02*(m_na_conc/50.0 - 1.0);

	return round_to(total_dg*salt_factor, 100.0);
}

// A %GC-based melting temperature for the primer, reduced for every mismatch with the
// target. Mismatches within TERMINAL_REGION_LENGTH bases of the primer 3' end are penalized
// twice as much as mismatches elsewhere. The result is clamped to [MIN_BINDING_TM, MAX_BINDING_TM]
// and rounded to 0.1 degrees.
float binding_tm(const string &m_primer, const string &m_target)
{
	const size_t len = m_primer.size();

	if(len == 0){
		return MIN_BINDING_TM;
	}

	double tm = 64.9 + 41.0*(gc_count(m_primer) - 16.4)/len;

	for(size_t i = 0;i < len;++i){

		if( (i < m_target.size() ) && bases_match(m_primer[i], m_target[i]) ){
			continue;
		}

		const size_t dist_from_3 = len - 1 - i;

		tm -= (dist_from_3 < TERMINAL_REGION_LENGTH) ?
			THREE_PRIME_MISMATCH_TM_PENALTY :
			FIVE_PRIME_MISMATCH_TM_PENALTY;
	}

	tm = max( double(MIN_BINDING_TM), min( double(MAX_BINDING_TM), tm ) );

	return round_to(tm, 10.0);
}

PrimerBinding analyze_binding(const string &m_name,
	const string &m_primer, const string &m_target,
	const Strand &m_strand, const int &m_position,
	const PCRConfig &m_config)
{
	PrimerBinding ret;

	ret.name = m_name;
	ret.primer_seq = m_primer;
	ret.target_seq = m_target;
	ret.strand = m_strand;
	ret.position = m_position;

	string primer(m_primer);
	string target(m_target);

	pad_to_equal_length(primer, target);

	const size_t len = primer.size();

	ret.matches = count_matches(primer, target);
	ret.mismatches = len - ret.matches;
	ret.match_percent = match_percent(ret.matches, len);

	ret.three_prime_match = three_prime_run(primer, target);

	const size_t terminal_len = min(size_t(TERMINAL_REGION_LENGTH), len);

	ret.three_prime_dg = three_prime_dg( primer.substr(len - terminal_len),
		target.substr(len - terminal_len), m_config.na_conc );

	ret.five_prime_mismatch = terminal_len - count_matches( primer.substr(0, terminal_len),
		target.substr(0, terminal_len) );

	ret.binding_tm = binding_tm(primer, target);
	ret.binding_dg = round_to(-1.5*ret.matches + 1.0*ret.mismatches, 100.0);

	const int max_mismatch = int(len) - m_config.min_3prime_match + m_config.max_5prime_mismatch;

	ret.is_valid = true;

	if(ret.match_percent < m_config.min_total_match_percent){

		ret.is_valid = false;
		ret.notes.push_back("Match (" + format_float(ret.match_percent, 1) + "%) < required (" +
			format_float(m_config.min_total_match_percent, 1) + "%)");
	}

	if( int(ret.three_prime_match) < m_config.min_3prime_match ){

		stringstream ssout;

		ssout << "3' match (" << ret.three_prime_match << "bp) < required ("
			<< m_config.min_3prime_match << "bp)";

		ret.is_valid = false;
		ret.notes.push_back( ssout.str() );
	}

	if(int(ret.mismatches) > max_mismatch){

		stringstream ssout;

		ssout << "Mismatches (" << ret.mismatches << ") > allowed (" << max_mismatch << ")";

		ret.is_valid = false;
		ret.notes.push_back( ssout.str() );
	}

	// The remaining notes are advisory and do not change the validity of the binding site
	if(ret.three_prime_dg > m_config.three_prime_dg_max){
		ret.notes.push_back("3' dG (" + format_float(ret.three_prime_dg, 2) + " kcal/mol) > max (" +
			format_float(m_config.three_prime_dg_max, 2) + " kcal/mol)");
	}

	if(ret.three_prime_dg < THREE_PRIME_DG_STRONG){
		ret.notes.push_back("3' end may be too stable (dG=" + format_float(ret.three_prime_dg, 1) +
			" kcal/mol). Consider redesign for better specificity.");
	}
	else if(ret.three_prime_dg > THREE_PRIME_DG_WEAK){
		ret.notes.push_back("3' end may be too weak (dG=" + format_float(ret.three_prime_dg, 1) +
			" kcal/mol). May result in poor amplification.");
	}

	if(ret.is_valid){
		ret.notes.push_back("All requirements met");
	}

	ret.alignment.resize(len);

	for(size_t i = 0;i < len;++i){
		ret.alignment[i] = bases_match(primer[i], target[i]) ? '|' : 'x';
	}

	return ret;
}

// Stacking free energies (kcal/mol) indexed by the 5' and 3' base of the dinucleotide
float nearest_neighbor_dg(char m_5, char m_3)
{
	//                           A     C     G     T
	const float nn_dg[4][4] = {{-1.0f, -1.4f, -1.5f, -0.9f},  // A
	                           {-1.3f, -1.5f, -2.1f, -1.5f},  // C
	                           {-1.4f, -2.4f, -1.5f, -1.4f},  // G
	                           {-0.6f, -1.4f, -1.3f, -1.0f}}; // T

	int index[2];
	const char b[2] = {m_5, m_3};

	for(int i = 0;i < 2;++i){

		switch(b[i]){
			case 'A':
				index[i] = 0;
				break;
			case 'C':
				index[i] = 1;
				break;
			case 'G':
				index[i] = 2;
				break;
			case 'T': case 'U':
				index[i] = 3;
				break;
			default:
				// Identical ambiguity codes (e.g. N/N) use a generic stacking energy
				return -1.0f;
		};
	}

	return nn_dg[ index[0] ][ index[1] ];
}

float round_to(const double &m_value, const double &m_scale)
{
	return float( round(m_value*m_scale)/m_scale );
}

string format_float(const float &m_value, const int &m_precision)
{
	stringstream ssout;

	ssout.setf(ios::fixed);
	ssout.precision(m_precision);

	ssout << m_value;

	return ssout.str();
}
