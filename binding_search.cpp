#include "binding.h"
#include "sequence.h"
#include "sort.h"
#include <algorithm>

using namespace std;

// Slide the primer along the template and report every window whose match percentage is
// at least m_config.report_threshold. For the minus strand, the reverse complement of the
// primer is matched against the plus strand of the template, so that all binding positions
// (and downstream amplicon coordinates) share the plus strand coordinate system.
void find_binding_sites(vector<PrimerBinding> &m_bindings,
	const string &m_name, const string &m_primer,
	const string &m_template, const Strand &m_strand,
	const PCRConfig &m_config)
{
	m_bindings.clear();

	const size_t primer_len = m_primer.size();

	if(primer_len == 0){
		return;
	}

	// A circular template is extended by its own first (primer_len - 1) bases so that
	// windows can span the origin. Every window still starts within the original template.
	string search_template(m_template);

	if(m_config.circular){
		search_template += m_template.substr( 0, min(primer_len - 1, m_template.size() ) );
	}

	const size_t search_len = search_template.size();

	if(primer_len > search_len){
		return;
	}

	const string search_primer = (m_strand == Seq_strand_minus) ?
		reverse_complement(m_primer) : m_primer;

	// For the minus strand, each binding site is evaluated from the point of view of the
	// primer (5' -> 3'), i.e. against the reverse complement of the template window. Window i of
	// the template corresponds to window (search_len - primer_len - i) of the reverse complement.
	string rc_template;

	if(m_strand == Seq_strand_minus){
		rc_template = reverse_complement(search_template);
	}

	const size_t last = search_len - primer_len;

	for(size_t i = 0;i <= last;++i){

		const unsigned int matches = count_matches( search_primer,
			search_template.substr(i, primer_len) );

		if(match_percent(matches, primer_len) < m_config.report_threshold){
			continue;
		}

		const string target = (m_strand == Seq_strand_minus) ?
			rc_template.substr(last - i, primer_len) :
			search_template.substr(i, primer_len);

		m_bindings.push_back( analyze_binding(m_name, m_primer, target,
			m_strand, int(i), m_config) );
	}

	STABLE_SORT( m_bindings.begin(), m_bindings.end(), sort_by_binding_quality() );
}

size_t count_valid(const vector<PrimerBinding> &m_bindings)
{
	size_t ret = 0;

	for(vector<PrimerBinding>::const_iterator i = m_bindings.begin();i != m_bindings.end();++i){

		if(i->is_valid){
			++ret;
		}
	}

	return ret;
}
