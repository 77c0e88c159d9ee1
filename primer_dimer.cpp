#include "primer_dimer.h"
#include "sequence.h"
#include <sstream>
#include <algorithm>

using namespace std;

// Check the complementarity of the forward and reverse primers to each other (i.e.
// independent of any template). Annealing of the two primers is detected by sliding the
// forward primer along the reverse complement of the reverse primer:
//
//      5'-FFFFFFFFFFFFFFFF-3'
//            |||||
//         3'-RRRRRRRRRRRRRRRR-5'
//
PrimerDimer check_primer_dimer(const string &m_forward, const string &m_reverse,
	const unsigned int &m_min_complementary)
{
	PrimerDimer ret;

	const string fwd = to_upper(m_forward);
	const string rev_rc = to_upper( reverse_complement(m_reverse) );

	const int fwd_len = fwd.size();
	const int rev_len = rev_rc.size();

	for(int offset = 1 - fwd_len;offset < rev_len;++offset){

		unsigned int run = 0;
		unsigned int run_start = 0;

		for(int i = 0;i < fwd_len;++i){

			const int j = i + offset;

			if( (j < 0) || (j >= rev_len) ){
				continue;
			}

			if( bases_match(fwd[i], rev_rc[j]) ){

				if(run == 0){
					run_start = i;
				}

				++run;
				continue;
			}

			if(run >= m_min_complementary){
				ret.regions.push_back( DimerRegion(run_start, i) );
			}

			ret.max_complementary = max(ret.max_complementary, run);
			run = 0;
		}

		if(run >= m_min_complementary){
			ret.regions.push_back( DimerRegion(run_start, run_start + run) );
		}

		ret.max_complementary = max(ret.max_complementary, run);
	}

	if(ret.regions.size() > MAX_DIMER_REGIONS){
		ret.regions.resize(MAX_DIMER_REGIONS);
	}

	// Compare the 3' ends of the two primers
	const string fwd_3 = fwd.substr( fwd.size() - min(fwd.size(), size_t(DIMER_THREE_PRIME_LENGTH) ) );
	const string rev = to_upper(m_reverse);
	const string rev_3_rc = reverse_complement( rev.substr( rev.size() - min(rev.size(), size_t(DIMER_THREE_PRIME_LENGTH) ) ) );

	const size_t len_3 = min( fwd_3.size(), rev_3_rc.size() );

	for(size_t i = 0;i < len_3;++i){

		if( bases_match(fwd_3[i], rev_3_rc[i]) ){
			++ret.three_prime_complementary;
		}
	}

	ret.has_dimer = (ret.max_complementary >= m_min_complementary);

	if( (ret.max_complementary >= 8) || (ret.three_prime_complementary >= 4) ){
		ret.severity = DIMER_SEVERE;
	}
	else if( (ret.max_complementary >= 6) || (ret.three_prime_complementary >= 3) ){
		ret.severity = DIMER_MODERATE;
	}
	else if(ret.max_complementary >= m_min_complementary){
		ret.severity = DIMER_LOW;
	}

	if(ret.severity != DIMER_NONE){

		stringstream ssout;

		switch(ret.severity){
			case DIMER_SEVERE:
				ssout << "High";
				break;
			case DIMER_MODERATE:
				ssout << "Moderate";
				break;
			default:
				ssout << "Low";
				break;
		};

		ssout << " primer-dimer risk: " << ret.max_complementary
			<< " consecutive complementary bases";

		ret.warning = ssout.str();
	}

	return ret;
}

string severity_name(const DimerSeverity &m_severity)
{
	switch(m_severity){
		case DIMER_NONE:
			return "none";
		case DIMER_LOW:
			return "low";
		case DIMER_MODERATE:
			return "moderate";
		case DIMER_SEVERE:
			return "severe";
	};

	throw __FILE__ ":severity_name: Unknown dimer severity";
	return "unknown";
}
