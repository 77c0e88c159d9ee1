#include "amplicon.h"
#include "sort.h"
#include <sstream>
#include <algorithm>

using namespace std;

float binding_score(const PrimerBinding &m_binding)
{
	return 0.7f*m_binding.match_percent + 3.0f*min(10u, m_binding.three_prime_match);
}

void predict_products(vector<AmpliconPrediction> &m_products,
	const vector<PrimerBinding> &m_forward,
	const vector<PrimerBinding> &m_reverse,
	const string &m_template, const PCRConfig &m_config)
{
	m_products.clear();

	const int template_len = m_template.size();

	for(vector<PrimerBinding>::const_iterator f = m_forward.begin();f != m_forward.end();++f){

		// Only individually valid bindings can produce an amplicon
		if(!f->is_valid){
			continue;
		}

		for(vector<PrimerBinding>::const_iterator r = m_reverse.begin();r != m_reverse.end();++r){

			if(!r->is_valid){
				continue;
			}

			const int start = f->position;
			const int end = r->position + int( r->length() );

			const int product_size = end - start;

			// This test also rejects reverse primers that bind upstream of the forward primer
			if( (product_size < m_config.product_size_min) ||
			    (product_size > m_config.product_size_max) ){
				continue;
			}

			m_products.push_back( AmpliconPrediction() );

			AmpliconPrediction &ref = m_products.back();

			ref.forward = *f;
			ref.reverse = *r;
			ref.start = start;
			ref.end = end;
			ref.product_size = product_size;

			if(end <= template_len){
				ref.product_seq = m_template.substr(start, product_size);
			}
			else{
				// Only a reverse primer that binds across the origin of a circular
				// template can extend past the end of the template
				ref.product_seq = m_template.substr(start) +
					m_template.substr( 0, min(end - template_len, template_len) );
			}

			const float likelihood = 0.5f*( binding_score(*f) + binding_score(*r) );

			ref.likelihood = max( 0.0f, min(MAX_LIKELIHOOD_SCORE, likelihood) );

			if(product_size > m_config.max_amplicon_for_extension){

				stringstream ssout;

				ssout << "Long amplicon (" << product_size
					<< "bp) may need extended extension time";

				ref.warnings.push_back( ssout.str() );
			}

			ref.extension_time = (product_size/1000.0f)*EXTENSION_SEC_PER_KB;
		}
	}

	STABLE_SORT( m_products.begin(), m_products.end(), sort_by_likelihood() );

	if( !m_products.empty() ){
		m_products.front().is_primary = true;
	}

	if( m_products.size() > size_t(m_config.max_products) ){
		m_products.resize(m_config.max_products);
	}
}
