#include "pcr_config.h"
#include <stdlib.h>
#include <errno.h>
#include <limits.h>
#include <fstream>
#include <sstream>
#include <iostream>
#include <functional>

using namespace std;

void parse_value(const string &m_value, int &m_param);
void parse_value(const string &m_value, float &m_param);
void parse_value(const string &m_value, bool &m_param);

void parse_value(const json::JSON &m_value, int &m_param);
void parse_value(const json::JSON &m_value, float &m_param);
void parse_value(const json::JSON &m_value, bool &m_param);

PCRConfig::PCRConfig()
{
	min_3prime_match = DEFAULT_MIN_3PRIME_MATCH;
	max_5prime_mismatch = DEFAULT_MAX_5PRIME_MISMATCH;
	min_total_match_percent = DEFAULT_MIN_TOTAL_MATCH_PERCENT;
	three_prime_dg_max = DEFAULT_THREE_PRIME_DG_MAX;

	na_conc = DEFAULT_NA_CONC;
	mg_conc = DEFAULT_MG_CONC;
	dntp_conc = DEFAULT_DNTP_CONC;

	product_size_min = DEFAULT_PRODUCT_SIZE_MIN;
	product_size_max = DEFAULT_PRODUCT_SIZE_MAX;
	max_products = DEFAULT_MAX_PRODUCTS;
	report_threshold = DEFAULT_REPORT_THRESHOLD;

	circular = false;

	max_amplicon_for_extension = DEFAULT_MAX_AMPLICON_FOR_EXTENSION;
}

void PCRConfig::set(const string &m_key, const string &m_value)
{
	#define VARIABLE(A, B) \
		if(m_key == #B){ \
			parse_value(m_value, B); \
			return; \
		}
		PCR_CONFIG_MEMBERS
	#undef VARIABLE

	cerr << "Unknown configuration parameter: " << m_key << endl;
	throw __FILE__ ":PCRConfig::set: Unknown configuration parameter";
}

void PCRConfig::set(const string &m_key, const json::JSON &m_value)
{
	#define VARIABLE(A, B) \
		if(m_key == #B){ \
			parse_value(m_value, B); \
			return; \
		}
		PCR_CONFIG_MEMBERS
	#undef VARIABLE

	cerr << "Unknown configuration parameter: " << m_key << endl;
	throw __FILE__ ":PCRConfig::set: Unknown configuration parameter";
}

void PCRConfig::load_json(const json::JSON &m_conf)
{
	if(m_conf.get_type() != json::JSON::JSON_MAP){
		throw __FILE__ ":PCRConfig::load_json: Configuration must be a JSON map";
	}

	// Check every key before assigning any of them, so that a bad configuration
	// leaves the current parameters untouched
	const vector<string> conf_keys = m_conf.keys();

	for(vector<string>::const_iterator i = conf_keys.begin();i != conf_keys.end();++i){

		if( !is_key(*i) ){

			cerr << "Unknown configuration parameter: " << *i << endl;
			throw __FILE__ ":PCRConfig::load_json: Unknown configuration parameter";
		}
	}

	PCRConfig local(*this);

	for(vector<string>::const_iterator i = conf_keys.begin();i != conf_keys.end();++i){
		local.set(*i, m_conf[*i]);
	}

	*this = local;
}

void PCRConfig::load_json_file(const string &m_filename)
{
	ifstream fin( m_filename.c_str() );

	if(!fin){

		cerr << "Unable to open configuration file: " << m_filename << endl;
		throw __FILE__ ":PCRConfig::load_json_file: Unable to open configuration file";
	}

	stringstream ssin;

	ssin << fin.rdbuf();

	load_json( json::JSON( ssin.str() ) );
}

void PCRConfig::validate() const
{
	if(min_3prime_match < 0){
		throw __FILE__ ":PCRConfig::validate: min_3prime_match must be >= 0";
	}

	if(max_5prime_mismatch < 0){
		throw __FILE__ ":PCRConfig::validate: max_5prime_mismatch must be >= 0";
	}

	if( (min_total_match_percent < 0.0f) || (min_total_match_percent > 100.0f) ){
		throw __FILE__ ":PCRConfig::validate: min_total_match_percent must be in [0, 100]";
	}

	if( (report_threshold < 0.0f) || (report_threshold > 100.0f) ){
		throw __FILE__ ":PCRConfig::validate: report_threshold must be in [0, 100]";
	}

	if( (na_conc < 0.0f) || (mg_conc < 0.0f) || (dntp_conc < 0.0f) ){
		throw __FILE__ ":PCRConfig::validate: Concentrations must be >= 0";
	}

	if(product_size_min < 0){
		throw __FILE__ ":PCRConfig::validate: product_size_min must be >= 0";
	}

	if(product_size_max < product_size_min){
		throw __FILE__ ":PCRConfig::validate: product_size_max must be >= product_size_min";
	}

	if(max_products <= 0){
		throw __FILE__ ":PCRConfig::validate: max_products must be > 0";
	}

	if(max_amplicon_for_extension < 0){
		throw __FILE__ ":PCRConfig::validate: max_amplicon_for_extension must be >= 0";
	}
}

size_t PCRConfig::hash() const
{
	size_t ret = 0;

	// Combine the per-parameter hash values (boost::hash_combine)
	#define VARIABLE(A, B) \
		ret ^= std::hash<A>()(B) + 0x9e3779b9 + (ret << 6) + (ret >> 2);
		PCR_CONFIG_MEMBERS
	#undef VARIABLE

	return ret;
}

bool PCRConfig::is_key(const string &m_key)
{
	#define VARIABLE(A, B) \
		if(m_key == #B){ \
			return true; \
		}
		PCR_CONFIG_MEMBERS
	#undef VARIABLE

	return false;
}

vector<string> PCRConfig::keys()
{
	vector<string> ret;

	#define VARIABLE(A, B) ret.push_back(#B);
		PCR_CONFIG_MEMBERS
	#undef VARIABLE

	return ret;
}

bool PCRConfig::operator==(const PCRConfig &m_rhs) const
{
	#define VARIABLE(A, B) \
		if( !(B == m_rhs.B) ){ \
			return false; \
		}
		PCR_CONFIG_MEMBERS
	#undef VARIABLE

	return true;
}

ostream& operator<<(ostream &m_s, const PCRConfig &m_config)
{
	const ios::fmtflags flags = m_s.flags();

	m_s << boolalpha;

	#define VARIABLE(A, B) m_s << #B << " = " << m_config.B << endl;
		PCR_CONFIG_MEMBERS
	#undef VARIABLE

	m_s.flags(flags);

	return m_s;
}

void parse_value(const string &m_value, int &m_param)
{
	if( m_value.empty() ){
		throw __FILE__ ":parse_value: Empty integer value";
	}

	char *end = NULL;

	errno = 0;

	const long ret = strtol(m_value.c_str(), &end, 10);

	if( (errno != 0) || (*end != '\0') ){

		cerr << "Unable to parse integer value: " << m_value << endl;
		throw __FILE__ ":parse_value: Invalid integer value";
	}

	if( (ret < INT_MIN) || (ret > INT_MAX) ){

		cerr << "Integer value out of range: " << m_value << endl;
		throw __FILE__ ":parse_value: Integer value out of range";
	}

	m_param = int(ret);
}

void parse_value(const string &m_value, float &m_param)
{
	if( m_value.empty() ){
		throw __FILE__ ":parse_value: Empty numeric value";
	}

	char *end = NULL;

	errno = 0;

	const double ret = strtod(m_value.c_str(), &end);

	if( (errno != 0) || (*end != '\0') ){

		cerr << "Unable to parse numeric value: " << m_value << endl;
		throw __FILE__ ":parse_value: Invalid numeric value";
	}

	m_param = float(ret);
}

void parse_value(const string &m_value, bool &m_param)
{
	if( (m_value == "true") || (m_value == "True") || (m_value == "TRUE") ||
	    (m_value == "yes") || (m_value == "1") ){

		m_param = true;
		return;
	}

	if( (m_value == "false") || (m_value == "False") || (m_value == "FALSE") ||
	    (m_value == "no") || (m_value == "0") ){

		m_param = false;
		return;
	}

	cerr << "Unable to parse boolean value: " << m_value << endl;
	throw __FILE__ ":parse_value: Invalid boolean value";
}

void parse_value(const json::JSON &m_value, int &m_param)
{
	const double value = m_value.get_number();

	// Range check before the conversion to int
	if( !( (value >= double(INT_MIN)) && (value <= double(INT_MAX)) ) ){
		throw __FILE__ ":parse_value: Integer value out of range";
	}

	if( value != double( int(value) ) ){
		throw __FILE__ ":parse_value: Expected an integer JSON value";
	}

	m_param = int(value);
}

void parse_value(const json::JSON &m_value, float &m_param)
{
	m_param = float( m_value.get_number() );
}

void parse_value(const json::JSON &m_value, bool &m_param)
{
	m_param = m_value.get_bool();
}
