#include "engine.h"
#include "binding_cache.h"
#include "sequence.h"

#include <sstream>

using namespace std;

// Local functions
void check_symbols(const string &m_seq, const char *m_error);

InsilicoPCR::InsilicoPCR(const PCRConfig &m_config, BindingCache *m_cache_ptr,
	ostream *m_log_ptr) :
	config(m_config), cache_ptr(m_cache_ptr), log_ptr(m_log_ptr)
{
	config.validate();
}

InsilicoPCRResult InsilicoPCR::run(const string &m_template,
	const string &m_forward_primer, const string &m_reverse_primer,
	const string &m_template_name) const
{
	InsilicoPCRResult ret;

	ret.template_name = m_template_name;
	ret.template_length = m_template.size();
	ret.forward_primer = m_forward_primer;
	ret.reverse_primer = m_reverse_primer;
	ret.parameters = config;

	////////////////////////////////////////////////////////////////////////////
	// Validating
	////////////////////////////////////////////////////////////////////////////
	ret.state = ENGINE_VALIDATING;

	if(m_template.size() < MIN_TEMPLATE_LENGTH){

		stringstream ssout;

		ssout << "Template sequence too short (< " << MIN_TEMPLATE_LENGTH << "bp)";

		ret.errors.push_back( ssout.str() );
		ret.success = false;

		if(log_ptr != NULL){

			#pragma omp critical (engine_log)
			*log_ptr << m_template_name << ": " << ret.errors.back() << endl;
		}

		return ret;
	}

	// Illegal symbols are structural errors and must be detected before the
	// searches start (exceptions can not leave an OpenMP section)
	check_symbols(m_template, __FILE__ ":InsilicoPCR::run: Illegal base in template");
	check_symbols(m_forward_primer, __FILE__ ":InsilicoPCR::run: Illegal base in forward primer");
	check_symbols(m_reverse_primer, __FILE__ ":InsilicoPCR::run: Illegal base in reverse primer");

	////////////////////////////////////////////////////////////////////////////
	// SearchingForward and SearchingReverse
	////////////////////////////////////////////////////////////////////////////

	// The two searches are independent of each other
	ret.state = ENGINE_SEARCHING_FORWARD;

	#pragma omp parallel sections
	{
		#pragma omp section
		search(ret.forward_bindings, "forward", m_forward_primer, m_template, Seq_strand_plus);

		#pragma omp section
		search(ret.reverse_bindings, "reverse", m_reverse_primer, m_template, Seq_strand_minus);
	}

	ret.state = ENGINE_SEARCHING_REVERSE;

	if( ret.forward_bindings.empty() ){
		ret.warnings.push_back("No forward primer binding sites found");
	}

	if( ret.reverse_bindings.empty() ){
		ret.warnings.push_back("No reverse primer binding sites found");
	}

	////////////////////////////////////////////////////////////////////////////
	// PredictingProducts
	////////////////////////////////////////////////////////////////////////////
	ret.state = ENGINE_PREDICTING_PRODUCTS;

	predict_products(ret.products, ret.forward_bindings, ret.reverse_bindings,
		m_template, config);

	////////////////////////////////////////////////////////////////////////////
	// CheckingDimer
	////////////////////////////////////////////////////////////////////////////
	ret.state = ENGINE_CHECKING_DIMER;

	ret.primer_dimer = check_primer_dimer(m_forward_primer, m_reverse_primer);
	ret.has_primer_dimer = ret.primer_dimer.has_dimer;

	if(ret.primer_dimer.severity != DIMER_NONE){
		ret.warnings.push_back(ret.primer_dimer.warning);
	}

	// Product count warnings follow the dimer warning
	if( ret.products.empty() ){
		ret.warnings.push_back("No valid products predicted");
	}
	else if(ret.products.size() > 1){

		stringstream ssout;

		ssout << "Multiple products (" << ret.products.size()
			<< ") - potential non-specific amplification";

		ret.warnings.push_back( ssout.str() );
	}

	////////////////////////////////////////////////////////////////////////////
	// Assembled
	////////////////////////////////////////////////////////////////////////////
	ret.state = ENGINE_ASSEMBLED;

	ret.success = !ret.products.empty() && ret.errors.empty();

	if(log_ptr != NULL){

		#pragma omp critical (engine_log)
		{
			*log_ptr << m_template_name << ": "
				<< ret.forward_bindings.size() << " forward ("
				<< count_valid(ret.forward_bindings) << " valid) and "
				<< ret.reverse_bindings.size() << " reverse ("
				<< count_valid(ret.reverse_bindings) << " valid) binding sites; "
				<< ret.products.size() << " product(s)" << endl;
		}
	}

	return ret;
}

void InsilicoPCR::search(vector<PrimerBinding> &m_bindings, const string &m_name,
	const string &m_primer, const string &m_template, const Strand &m_strand) const
{
	if( (cache_ptr != NULL) &&
	    cache_ptr->find(m_bindings, m_name, m_primer, m_strand, m_template, config) ){
		return;
	}

	find_binding_sites(m_bindings, m_name, m_primer, m_template, m_strand, config);

	if(cache_ptr != NULL){
		cache_ptr->insert(m_bindings, m_primer, m_strand, m_template, config);
	}
}

void check_symbols(const string &m_seq, const char *m_error)
{
	for(string::const_iterator i = m_seq.begin();i != m_seq.end();++i){

		try{
			base_to_bits(*i);
		}
		catch(const char *error){
			throw m_error;
		}
	}
}

string state_name(const EngineState &m_state)
{
	switch(m_state){
		case ENGINE_VALIDATING:
			return "Validating";
		case ENGINE_SEARCHING_FORWARD:
			return "SearchingForward";
		case ENGINE_SEARCHING_REVERSE:
			return "SearchingReverse";
		case ENGINE_PREDICTING_PRODUCTS:
			return "PredictingProducts";
		case ENGINE_CHECKING_DIMER:
			return "CheckingDimer";
		case ENGINE_ASSEMBLED:
			return "Assembled";
	};

	throw __FILE__ ":state_name: Unknown engine state";
	return "unknown";
}
