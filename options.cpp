#include "ampsim.h"
#include <limits.h>
#include <stdlib.h>
#include <getopt.h>
#include <ctype.h>

#include <iostream>
#include <utility>

using namespace std;

Options::Verbosity parse_verbosity(string m_buffer);

Options::Options()
{
	// Set the default options
	output_filter = VERBOSE;
	output_format = TEXT_OUTPUT;

	// A max_thread of 0 uses all available threads
	max_thread = 0;

	quit = false;
	error = false;
}

void Options::load(int argc, char *argv[])
{
	bool print_usage = (argc <= 1);

	// Command line options:
	// -t <fasta file of template sequences (optionally gzip compressed)>
	// -f <forward primer (5'->3')>
	// -r <reverse primer (5'->3')>
	// -p <file of primer pairs ("name forward reverse" per line)>
	// [-o <output file> (default is stdout)]
	// [--o.text (output results as text; default)]
	// [--o.json (output results in JSON format)]
	// [--o.fasta (output predicted amplicons in FASTA format)]
	// [--json <JSON file of PCR parameters>]
	// [--set <parameter>=<value>]
	// [--circular (treat the template sequences as circular)]
	// [--size.min <minimum product size>]
	// [--size.max <maximum product size>]
	// [--max-products <maximum number of reported products>]
	// [--threshold.report <minimum match percent of reported binding sites>]
	// [--threshold.match <minimum match percent of valid binding sites>]
	// [--3prime.min <minimum number of matching 3' bases>]
	// [--5prime.mismatch <maximum number of additional mismatches>]
	// [--salt.na <Na+ concentration in mM>]
	// [--salt.mg <Mg++ concentration in mM>]
	// [--dntp <dNTP concentration in mM>]
	// [--extension.max <product size that triggers an extension time warning>]
	// [--thread <maximum number of OpenMP threads> (default is all)]
	// [-v <verbosity level: silent, verbose, everything>]

	const char* options = "t:f:r:p:o:v:?h";
	int config_opt = 0;
	int long_index = 0;

	struct option long_opts[] = {
		{"o.text", false, &config_opt, 1},
		{"o.json", false, &config_opt, 2},
		{"o.fasta", false, &config_opt, 3},
		{"json", true, &config_opt, 4},
		{"set", true, &config_opt, 5},
		{"circular", false, &config_opt, 6},
		{"size.min", true, &config_opt, 7},
		{"size.max", true, &config_opt, 8},
		{"max-products", true, &config_opt, 9},
		{"threshold.report", true, &config_opt, 10},
		{"threshold.match", true, &config_opt, 11},
		{"3prime.min", true, &config_opt, 12},
		{"5prime.mismatch", true, &config_opt, 13},
		{"salt.na", true, &config_opt, 14},
		{"salt.mg", true, &config_opt, 15},
		{"dntp", true, &config_opt, 16},
		{"extension.max", true, &config_opt, 17},
		{"thread", true, &config_opt, 18},
		{0,0,0,0} // Terminate options list
	};

	int opt_code;
	opterr = 0;

	string json_file;

	// Command line parameters are applied, in order, after the JSON file
	deque< pair<string, string> > param;

	while( (opt_code = getopt_long( argc, argv, options, long_opts, &long_index) ) != EOF ){

		switch( opt_code ){
			case 0:

				if(config_opt == 1){ // o.text

					output_format = TEXT_OUTPUT;
					break;
				}

				if(config_opt == 2){ // o.json

					output_format = JSON_OUTPUT;
					break;
				}

				if(config_opt == 3){ // o.fasta

					output_format = FASTA_OUTPUT;
					break;
				}

				if(config_opt == 4){ // json

					json_file = optarg;
					break;
				}

				if(config_opt == 5){ // set

					const string buffer(optarg);
					const string::size_type loc = buffer.find('=');

					if( (loc == string::npos) || (loc == 0) ){

						cerr << "Please specify --set <parameter>=<value>" << endl;

						error = true;
						quit = true;
						return;
					}

					param.push_back( make_pair( buffer.substr(0, loc), buffer.substr(loc + 1) ) );
					break;
				}

				if(config_opt == 6){ // circular

					param.push_back( make_pair("circular", "true") );
					break;
				}

				if(config_opt == 7){ // size.min

					param.push_back( make_pair("product_size_min", optarg) );
					break;
				}

				if(config_opt == 8){ // size.max

					param.push_back( make_pair("product_size_max", optarg) );
					break;
				}

				if(config_opt == 9){ // max-products

					param.push_back( make_pair("max_products", optarg) );
					break;
				}

				if(config_opt == 10){ // threshold.report

					param.push_back( make_pair("report_threshold", optarg) );
					break;
				}

				if(config_opt == 11){ // threshold.match

					param.push_back( make_pair("min_total_match_percent", optarg) );
					break;
				}

				if(config_opt == 12){ // 3prime.min

					param.push_back( make_pair("min_3prime_match", optarg) );
					break;
				}

				if(config_opt == 13){ // 5prime.mismatch

					param.push_back( make_pair("max_5prime_mismatch", optarg) );
					break;
				}

				if(config_opt == 14){ // salt.na

					param.push_back( make_pair("na_conc", optarg) );
					break;
				}

				if(config_opt == 15){ // salt.mg

					param.push_back( make_pair("mg_conc", optarg) );
					break;
				}

				if(config_opt == 16){ // dntp

					param.push_back( make_pair("dntp_conc", optarg) );
					break;
				}

				if(config_opt == 17){ // extension.max

					param.push_back( make_pair("max_amplicon_for_extension", optarg) );
					break;
				}

				if(config_opt == 18){ // thread

					max_thread = abs( atoi(optarg) );
					break;
				}

				cerr << "Unknown command line flag!" << endl;

				error = true;
				quit = true;
				return;

			case 't':
				template_filename = optarg;
				break;
			case 'f':
				forward_primer = optarg;
				break;
			case 'r':
				reverse_primer = optarg;
				break;
			case 'p':
				primer_filename = optarg;
				break;
			case 'o':
				output_filename = optarg;
				break;
			case 'v':
				output_filter = parse_verbosity(optarg);

				if(output_filter == UNKNOWN_VERBOSITY){

					cerr <<  "Please enter a valid verbosity flag: \"silent\", \"verbose\", \"everything\""
						<< endl;

					error = true;
					quit = true;
					return;
				}

				break;
			case 'h':
			case '?':
				print_usage = true;
				break;
			default:
				cerr << '\"' << (char)opt_code << "\" is not a valid option!" << endl;

				error = true;
				quit = true;
				return;
		};
	}

	if(print_usage){

		cerr << "AmpSim version "
			<< AMPSIM_MAJOR_VERSION << "."
			<< AMPSIM_MINOR_VERSION << endl;
		cerr << "Usage:" << endl;
		cerr << "\t-t <template fasta file (may be gzip compressed)>" << endl;
		cerr << "\t-f <forward primer (5'->3')>" << endl;
		cerr << "\t-r <reverse primer (5'->3')>" << endl;
		cerr << "\t-p <primer file of \"name forward reverse\" lines> (instead of -f and -r)" << endl;
		cerr << "\t[-o <output file> (default is stdout)]" << endl;
		cerr << "\t[--o.text (output results as text; default)]" << endl;
		cerr << "\t[--o.json (output results in JSON format)]" << endl;
		cerr << "\t[--o.fasta (output predicted amplicon sequences in FASTA format)]" << endl;
		cerr << "\t[--json <JSON file of PCR parameters>]" << endl;
		cerr << "\t[--set <parameter>=<value> (set any PCR parameter by name)]" << endl;
		cerr << "\t[--circular (treat templates as circular)]" << endl;
		cerr << "\t[--size.min <minimum product size> (default is " << DEFAULT_PRODUCT_SIZE_MIN << ")]" << endl;
		cerr << "\t[--size.max <maximum product size> (default is " << DEFAULT_PRODUCT_SIZE_MAX << ")]" << endl;
		cerr << "\t[--max-products <maximum number of products> (default is " << DEFAULT_MAX_PRODUCTS << ")]" << endl;
		cerr << "\t[--threshold.report <minimum reported binding match %> (default is " << DEFAULT_REPORT_THRESHOLD << ")]" << endl;
		cerr << "\t[--threshold.match <minimum valid binding match %> (default is " << DEFAULT_MIN_TOTAL_MATCH_PERCENT << ")]" << endl;
		cerr << "\t[--3prime.min <minimum 3' match length> (default is " << DEFAULT_MIN_3PRIME_MATCH << ")]" << endl;
		cerr << "\t[--5prime.mismatch <allowed 5' mismatches> (default is " << DEFAULT_MAX_5PRIME_MISMATCH << ")]" << endl;
		cerr << "\t[--salt.na <Na+ in mM> (default is " << DEFAULT_NA_CONC << ")]" << endl;
		cerr << "\t[--salt.mg <Mg++ in mM> (default is " << DEFAULT_MG_CONC << ")]" << endl;
		cerr << "\t[--dntp <dNTP in mM> (default is " << DEFAULT_DNTP_CONC << ")]" << endl;
		cerr << "\t[--extension.max <long amplicon warning size> (default is " << DEFAULT_MAX_AMPLICON_FOR_EXTENSION << ")]" << endl;
		cerr << "\t[--thread <maximum number of OpenMP threads> (default is all)]" << endl;
		cerr << "\t[-v <verbosity level: silent, verbose, everything>]" << endl;
		cerr << "PCR parameters (for --set and --json):" << endl;

		const vector<string> k = PCRConfig::keys();

		for(vector<string>::const_iterator i = k.begin();i != k.end();++i){
			cerr << "\t" << *i << endl;
		}

		quit = true;
		return;
	}

	try{

		if( !json_file.empty() ){
			config.load_json_file(json_file);
		}

		for(deque< pair<string, string> >::const_iterator i = param.begin();i != param.end();++i){
			config.set(i->first, i->second);
		}

		config.validate();
	}
	catch(const char *msg){

		cerr << "Invalid PCR parameters: " << msg << endl;

		error = true;
		quit = true;
		return;
	}

	if( template_filename.empty() ){

		cerr << "Please specify a template filename (-t)" << endl;

		error = true;
		quit = true;
		return;
	}

	if( primer_filename.empty() ){

		if( forward_primer.empty() || reverse_primer.empty() ){

			cerr << "Please specify both a forward (-f) and reverse (-r) primer, or a primer file (-p)" << endl;

			error = true;
			quit = true;
			return;
		}
	}
	else{

		if( !forward_primer.empty() || !reverse_primer.empty() ){

			cerr << "Please specify either a primer file (-p) or individual primers (-f and -r), but not both" << endl;

			error = true;
			quit = true;
			return;
		}
	}
};

Options::Verbosity parse_verbosity(string m_buffer)
{
	m_buffer = tolower(m_buffer);

	if(m_buffer == "silent"){
		return Options::SILENT;
	}

	if(m_buffer == "verbose"){
		return Options::VERBOSE;
	}

	if(m_buffer == "everything"){
		return Options::EVERYTHING;
	}

	return Options::UNKNOWN_VERBOSITY;
}

string tolower(const string &m_str)
{
	string ret(m_str);

	for(string::iterator i = ret.begin();i != ret.end();++i){
		*i = ::tolower(*i);
	}

	return ret;
}
