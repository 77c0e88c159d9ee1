#include "report.h"
#include "JSON.h"

#include <iomanip>
#include <vector>
#include <deque>

using namespace std;

// Local functions
void write_text_binding(ostream &m_out, const string &m_label, const PrimerBinding &m_binding);
void write_json_binding(ostream &m_out, const PrimerBinding &m_binding, const string &m_indent);
void write_json_product(ostream &m_out, const AmpliconPrediction &m_product, const string &m_indent);
template<class T> void write_json_strings(ostream &m_out, const T &m_str, const string &m_indent);
void write_json_config(ostream &m_out, const PCRConfig &m_config, const string &m_indent);

void write_text_report(ostream &m_out, const InsilicoPCRResult &m_result)
{
	// Save the stream state, since we change the floating point precision
	const ios::fmtflags flags = m_out.flags();
	const streamsize precision = m_out.precision();

	m_out << fixed << setprecision(1);

	m_out << "# Template: " << m_result.template_name << " (" << m_result.template_length << " bp)" << endl;
	m_out << "# Forward primer: " << m_result.forward_primer << endl;
	m_out << "# Reverse primer: " << m_result.reverse_primer << endl;

	m_out << "Forward binding sites = " << m_result.forward_bindings.size()
		<< " (" << count_valid(m_result.forward_bindings) << " valid)" << endl;
	m_out << "Reverse binding sites = " << m_result.reverse_bindings.size()
		<< " (" << count_valid(m_result.reverse_bindings) << " valid)" << endl;

	m_out << "Products = " << m_result.products.size() << endl;

	size_t index = 1;

	for(vector<AmpliconPrediction>::const_iterator i = m_result.products.begin();
		i != m_result.products.end();++i, ++index){

		m_out << "Product " << index << (i->is_primary ? " (primary)" : "") << endl;
		m_out << "\tsize = " << i->product_size << " bp" << endl;
		m_out << "\tposition = " << i->start << "-" << i->end << endl;
		m_out << "\tlikelihood = " << i->likelihood << '%' << endl;
		m_out << "\textension time = " << i->extension_time << " sec" << endl;

		write_text_binding(m_out, "forward", i->forward);
		write_text_binding(m_out, "reverse", i->reverse);

		for(vector<string>::const_iterator j = i->warnings.begin();j != i->warnings.end();++j){
			m_out << "\twarning: " << *j << endl;
		}
	}

	m_out << "Primer dimer = " << severity_name(m_result.primer_dimer.severity)
		<< " (max complementary = " << m_result.primer_dimer.max_complementary
		<< " bp, 3' complementary = " << m_result.primer_dimer.three_prime_complementary
		<< " bp)" << endl;

	for(vector<string>::const_iterator i = m_result.warnings.begin();i != m_result.warnings.end();++i){
		m_out << "Warning: " << *i << endl;
	}

	for(vector<string>::const_iterator i = m_result.errors.begin();i != m_result.errors.end();++i){
		m_out << "Error: " << *i << endl;
	}

	m_out << "Success = " << (m_result.success ? "yes" : "no") << endl;

	m_out.flags(flags);
	m_out.precision(precision);
}

void write_text_binding(ostream &m_out, const string &m_label, const PrimerBinding &m_binding)
{
	m_out << '\t' << m_label << ": pos " << m_binding.position
		<< " (" << strand_symbol(m_binding.strand) << "), "
		<< m_binding.match_percent << "% match, "
		<< m_binding.mismatches << " mismatches, 3' match = "
		<< m_binding.three_prime_match << " bp, Tm = "
		<< m_binding.binding_tm << " C" << endl;

	m_out << "\t\t" << m_binding.primer_seq << endl;
	m_out << "\t\t" << m_binding.alignment << endl;
	m_out << "\t\t" << m_binding.target_seq << endl;
}

void write_json_report(ostream &m_out, const InsilicoPCRResult &m_result, const string &m_indent)
{
	const string indent = m_indent + '\t';

	m_out << "{\n"
		<< indent << "\"template\":\"" << json::escape(m_result.template_name) << "\",\n"
		<< indent << "\"template length\":" << m_result.template_length << ",\n"
		<< indent << "\"forward primer\":\"" << json::escape(m_result.forward_primer) << "\",\n"
		<< indent << "\"reverse primer\":\"" << json::escape(m_result.reverse_primer) << "\",\n"
		<< indent << "\"success\":" << (m_result.success ? "true" : "false") << ",\n"
		<< indent << "\"state\":\"" << state_name(m_result.state) << "\",\n";

	m_out << indent << "\"products\":[";

	for(vector<AmpliconPrediction>::const_iterator i = m_result.products.begin();
		i != m_result.products.end();++i){

		m_out << ( (i == m_result.products.begin()) ? "\n" : ",\n" ) << indent << '\t';

		write_json_product(m_out, *i, indent + '\t');
	}

	if( !m_result.products.empty() ){
		m_out << '\n' << indent;
	}

	m_out << "],\n";

	m_out << indent << "\"forward bindings\":[";

	for(vector<PrimerBinding>::const_iterator i = m_result.forward_bindings.begin();
		i != m_result.forward_bindings.end();++i){

		m_out << ( (i == m_result.forward_bindings.begin()) ? "\n" : ",\n" ) << indent << '\t';

		write_json_binding(m_out, *i, indent + '\t');
	}

	if( !m_result.forward_bindings.empty() ){
		m_out << '\n' << indent;
	}

	m_out << "],\n";

	m_out << indent << "\"reverse bindings\":[";

	for(vector<PrimerBinding>::const_iterator i = m_result.reverse_bindings.begin();
		i != m_result.reverse_bindings.end();++i){

		m_out << ( (i == m_result.reverse_bindings.begin()) ? "\n" : ",\n" ) << indent << '\t';

		write_json_binding(m_out, *i, indent + '\t');
	}

	if( !m_result.reverse_bindings.empty() ){
		m_out << '\n' << indent;
	}

	m_out << "],\n";

	const PrimerDimer &dimer = m_result.primer_dimer;

	m_out << indent << "\"primer dimer\":{\n"
		<< indent << "\t\"severity\":\"" << severity_name(dimer.severity) << "\",\n"
		<< indent << "\t\"max complementary\":" << dimer.max_complementary << ",\n"
		<< indent << "\t\"3' complementary\":" << dimer.three_prime_complementary << ",\n"
		<< indent << "\t\"regions\":[";

	for(vector<DimerRegion>::const_iterator i = dimer.regions.begin();i != dimer.regions.end();++i){

		m_out << ( (i == dimer.regions.begin()) ? "" : "," )
			<< "{\"start\":" << i->start << ",\"end\":" << i->end
			<< ",\"length\":" << i->length() << '}';
	}

	m_out << "],\n"
		<< indent << "\t\"warning\":\"" << json::escape(dimer.warning) << "\"\n"
		<< indent << "},\n";

	m_out << indent << "\"has primer dimer\":" << (m_result.has_primer_dimer ? "true" : "false") << ",\n";

	m_out << indent << "\"warnings\":";
	write_json_strings(m_out, m_result.warnings, indent);
	m_out << ",\n";

	m_out << indent << "\"errors\":";
	write_json_strings(m_out, m_result.errors, indent);
	m_out << ",\n";

	m_out << indent << "\"parameters\":";
	write_json_config(m_out, m_result.parameters, indent);
	m_out << '\n' << m_indent << '}';
}

void write_json_product(ostream &m_out, const AmpliconPrediction &m_product, const string &m_indent)
{
	const string indent = m_indent + '\t';

	m_out << "{\n"
		<< indent << "\"size\":" << m_product.product_size << ",\n"
		<< indent << "\"start\":" << m_product.start << ",\n"
		<< indent << "\"end\":" << m_product.end << ",\n"
		<< indent << "\"likelihood\":" << m_product.likelihood << ",\n"
		<< indent << "\"primary\":" << (m_product.is_primary ? "true" : "false") << ",\n"
		<< indent << "\"extension time\":" << m_product.extension_time << ",\n"
		<< indent << "\"sequence\":\"" << json::escape(m_product.product_seq) << "\",\n"
		<< indent << "\"warnings\":";

	write_json_strings(m_out, m_product.warnings, indent);

	m_out << ",\n" << indent << "\"forward\":";

	write_json_binding(m_out, m_product.forward, indent);

	m_out << ",\n" << indent << "\"reverse\":";

	write_json_binding(m_out, m_product.reverse, indent);

	m_out << '\n' << m_indent << '}';
}

void write_json_binding(ostream &m_out, const PrimerBinding &m_binding, const string &m_indent)
{
	const string indent = m_indent + '\t';

	m_out << "{\n"
		<< indent << "\"name\":\"" << json::escape(m_binding.name) << "\",\n"
		<< indent << "\"primer\":\"" << json::escape(m_binding.primer_seq) << "\",\n"
		<< indent << "\"target\":\"" << json::escape(m_binding.target_seq) << "\",\n"
		<< indent << "\"strand\":\"" << strand_symbol(m_binding.strand) << "\",\n"
		<< indent << "\"position\":" << m_binding.position << ",\n"
		<< indent << "\"match percent\":" << m_binding.match_percent << ",\n"
		<< indent << "\"mismatches\":" << m_binding.mismatches << ",\n"
		<< indent << "\"3' match\":" << m_binding.three_prime_match << ",\n"
		<< indent << "\"3' dG\":" << m_binding.three_prime_dg << ",\n"
		<< indent << "\"5' mismatches\":" << m_binding.five_prime_mismatch << ",\n"
		<< indent << "\"Tm\":" << m_binding.binding_tm << ",\n"
		<< indent << "\"dG\":" << m_binding.binding_dg << ",\n"
		<< indent << "\"valid\":" << (m_binding.is_valid ? "true" : "false") << ",\n"
		<< indent << "\"alignment\":\"" << m_binding.alignment << "\",\n"
		<< indent << "\"notes\":";

	write_json_strings(m_out, m_binding.notes, indent);

	m_out << '\n' << m_indent << '}';
}

template<class T>
void write_json_strings(ostream &m_out, const T &m_str, const string &m_indent)
{
	if( m_str.empty() ){

		m_out << "[]";
		return;
	}

	m_out << '[';

	for(typename T::const_iterator i = m_str.begin();i != m_str.end();++i){

		m_out << ( (i == m_str.begin()) ? "\n" : ",\n" )
			<< m_indent << "\t\"" << json::escape(*i) << '"';
	}

	m_out << '\n' << m_indent << ']';
}

void write_json_config(ostream &m_out, const PCRConfig &m_config, const string &m_indent)
{
	m_out << "{\n";

	bool first = true;

	#define VARIABLE(A, B) \
		m_out << (first ? "" : ",\n") << m_indent << "\t\"" << #B << "\":" << m_config.B; \
		first = false;

	// Booleans are written as "true" and "false"
	const ios::fmtflags flags = m_out.flags();

	m_out << boolalpha;

		PCR_CONFIG_MEMBERS

	m_out.flags(flags);

	#undef VARIABLE

	m_out << '\n' << m_indent << '}';
}

void write_fasta_amplicons(ostream &m_out, const InsilicoPCRResult &m_result)
{
	const ios::fmtflags flags = m_out.flags();
	const streamsize precision = m_out.precision();

	m_out << fixed << setprecision(1);

	size_t index = 1;

	for(vector<AmpliconPrediction>::const_iterator i = m_result.products.begin();
		i != m_result.products.end();++i, ++index){

		m_out << '>' << m_result.template_name << "_amplicon" << index
			<< (i->is_primary ? "_PRIMARY" : "")
			<< " size=" << i->product_size << "bp"
			<< " pos=" << i->start << '-' << i->end
			<< " likelihood=" << i->likelihood << '%' << endl;

		for(size_t j = 0;j < i->product_seq.size();j += FASTA_LINE_WIDTH){
			m_out << i->product_seq.substr(j, FASTA_LINE_WIDTH) << endl;
		}
	}

	m_out.flags(flags);
	m_out.precision(precision);
}
