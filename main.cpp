// AmpSim: in-silico PCR simulation
// Predicts primer binding sites and PCR products for one or more primer pairs against
// one or more template sequences.

#include <iostream>
#include <fstream>
#include <sstream>
#include <vector>
#include <deque>
#include <algorithm>
#include <stdlib.h>
#include <math.h>
#include <time.h>

#include <mpi.h>

// Still no openmp support on the clang compiler that ships with OSX
#ifdef _OPENMP
#include <omp.h>
#endif // _OPENMP

#include "update.h"
#include "ampsim.h"
#include "engine.h"
#include "binding_cache.h"
#include "report.h"

using namespace std;

// Global variables for MPI
int mpi_numtasks;
int mpi_rank;

string time_to_str(const time_t &m_elapsed);
void check_primer(const string &m_primer);

int main(int argc, char *argv[])
{
	try{
		MPI_Init(&argc, &argv);
		MPI_Comm_size(MPI_COMM_WORLD, &mpi_numtasks);
		MPI_Comm_rank(MPI_COMM_WORLD, &mpi_rank);

		time_t profile = time(NULL);

		const bool is_root = (mpi_rank == 0);

		Options opt;

		if(is_root){
			opt.load(argc, argv);
		}

		// Share the options with all workers
		broadcast(opt, mpi_rank, 0);

		if(opt.quit){

			MPI_Finalize();

			// Printing the usage is not an error, but invalid arguments are
			return opt.error ? EXIT_FAILURE : EXIT_SUCCESS;
		}

		if(opt.max_thread > 0){

			#ifdef _OPENMP
			omp_set_num_threads(opt.max_thread);
			#endif // _OPENMP
		}

		ofstream fnull("/dev/null");

		if(!fnull){
			throw "Unable to open /dev/null";
		}

		ostream &vout = ( (opt.output_filter == Options::SILENT) || !is_root ) ? fnull : cerr;

		vout << "AmpSim version "
			<< AMPSIM_MAJOR_VERSION << "."
			<< AMPSIM_MINOR_VERSION << endl;

		if(mpi_numtasks > 1){
			vout << "Running in MPI mode with " << mpi_numtasks << " workers" << endl;
		}

		deque<Sequence> template_seq;
		deque<PrimerPair> primers;

		if(is_root){

			vout << "Reading template sequences from " << opt.template_filename << endl;

			parse_fasta(opt.template_filename, template_seq);

			if( opt.primer_filename.empty() ){
				primers.push_back( PrimerPair("primers", opt.forward_primer, opt.reverse_primer) );
			}
			else{

				vout << "Reading primer pairs from " << opt.primer_filename << endl;

				parse_primer_file(opt.primer_filename, primers);
			}

			// Catch illegal primer bases before the simulations start
			for(deque<PrimerPair>::const_iterator i = primers.begin();i != primers.end();++i){

				check_primer(i->forward);
				check_primer(i->reverse);
			}
		}

		broadcast(template_seq, mpi_rank, 0);
		broadcast(primers, mpi_rank, 0);

		vout << "Found " << template_seq.size() << " template sequence(s) and "
			<< primers.size() << " primer pair(s)" << endl;

		vout << opt.config;

		const size_t num_primers = primers.size();
		const size_t num_job = template_seq.size()*num_primers;

		// Jobs are assigned to MPI ranks in round-robin order
		vector<size_t> local_job;

		for(size_t i = mpi_rank;i < num_job;i += mpi_numtasks){
			local_job.push_back(i);
		}

		const int num_local_job = local_job.size();

		vector<string> local_report(num_local_job);

		// Each primer binding search is shared by every pair that contains the same primer
		BindingCache cache;

		const InsilicoPCR engine(opt.config, &cache,
			(opt.output_filter == Options::EVERYTHING) ? &vout : NULL);

		unsigned int local_success = 0;

		UpdateInfo progress("Simulating PCR: ", num_local_job, vout);

		#pragma omp parallel for schedule(dynamic)
		for(int i = 0;i < num_local_job;++i){

			const size_t job = local_job[i];

			const Sequence &tmpl = template_seq[job/num_primers];
			const PrimerPair &primer_pair = primers[job%num_primers];

			InsilicoPCRResult result = engine.run(tmpl.seq, primer_pair.forward, primer_pair.reverse, tmpl.name());

			stringstream ssout;

			switch(opt.output_format){
				case Options::TEXT_OUTPUT:

					ssout << "# Primer pair: " << primer_pair.name << endl;
					write_text_report(ssout, result);
					break;

				case Options::JSON_OUTPUT:

					ssout << "\t\t{\n\t\t\t\"primer pair\":\"" << json::escape(primer_pair.name) << "\",\n"
						<< "\t\t\t\"result\":";

					write_json_report(ssout, result, "\t\t\t");

					ssout << "\n\t\t}";
					break;

				case Options::FASTA_OUTPUT:

					// Keep the FASTA record names unique when there are multiple primer pairs
					if(num_primers > 1){
						result.template_name += "_" + primer_pair.name;
					}

					write_fasta_amplicons(ssout, result);
					break;

				default:
					throw __FILE__ ":main: Unknown output format";
			};

			local_report[i] = ssout.str();

			#pragma omp critical
			{
				if(result.success){
					++local_success;
				}

				progress.advance();
			}
		}

		progress.close();

		unsigned int num_success = 0;

		MPI_Reduce(&local_success, &num_success, 1, MPI_UNSIGNED, MPI_SUM, 0, MPI_COMM_WORLD);

		deque<string> report( local_report.begin(), local_report.end() );

		// Collect every report on the rank 0 task, in job order
		gather_reports(report, num_job, mpi_rank, mpi_numtasks);

		if(is_root){

			ofstream fout;

			if( !opt.output_filename.empty() ){

				fout.open( opt.output_filename.c_str() );

				if(!fout){
					throw __FILE__ ":main: Unable to open output file for writing";
				}
			}

			ostream &out = opt.output_filename.empty() ? cout : fout;

			switch(opt.output_format){
				case Options::TEXT_OUTPUT:

					out << "AmpSim version "
						<< AMPSIM_MAJOR_VERSION << '.'
						<< AMPSIM_MINOR_VERSION << endl;

					// Write the command line arguments to disk
					out << "Command line:";

					for(int i = 0;i < argc;++i){
						out << ' ' << argv[i];
					}

					out << endl;

					for(deque<string>::const_iterator i = report.begin();i != report.end();++i){
						out << *i << endl;
					}

					break;

				case Options::JSON_OUTPUT:

					out << "{\n\t\"program\":\"AmpSim\",\n"
						<< "\t\"version\":\"" << AMPSIM_MAJOR_VERSION << '.'
						<< AMPSIM_MINOR_VERSION << "\",\n\t"
						<< "\"command line\":\"" << json::escape(argv[0]);

					for(int i = 1;i < argc;++i){
						out << ' ' << json::escape(argv[i]);
					}

					out << "\",\n\t\"number of simulations\":" << num_job
						<< ",\n\t\"number of successful simulations\":" << num_success
						<< ",\n\t\"results\":[";

					for(deque<string>::const_iterator i = report.begin();i != report.end();++i){
						out << ( (i == report.begin()) ? "\n" : ",\n" ) << *i;
					}

					out << "\n\t]\n}" << endl;

					break;

				case Options::FASTA_OUTPUT:

					for(deque<string>::const_iterator i = report.begin();i != report.end();++i){
						out << *i;
					}

					break;

				default:
					throw __FILE__ ":main: Unknown output format";
			};
		}

		vout << num_success << " of " << num_job << " simulation(s) predicted a PCR product" << endl;

		vout << "Binding site cache: " << cache.hits() << " hits, " << cache.misses() << " misses" << endl;

		profile = time(NULL) - profile;
		vout << "Finished in " << time_to_str(profile) << endl;
	}
	catch(const char *error){

		cerr << "Caught the error " << error << endl;

		MPI_Finalize();

		return EXIT_FAILURE;
	}
	catch(const string error){

		cerr << "Caught the error " << error << endl;

		MPI_Finalize();

		return EXIT_FAILURE;
	}
	catch(...){

		cerr << "Caught an unhandled error" << endl;

		MPI_Finalize();

		return EXIT_FAILURE;
	}

	MPI_Finalize();

	return EXIT_SUCCESS;
}

string time_to_str(const time_t &m_elapsed)
{
	const float elapsed_sec = m_elapsed % 60;

	float elapsed_time = (m_elapsed - elapsed_sec)/60.0f; // In min

	const float elapsed_min = fmod(elapsed_time, 60.0f);
	elapsed_time = (elapsed_time - elapsed_min)/60.0f; // In hour

	stringstream sout;

	sout << "Run time is "
		<< elapsed_time
		<< ( (elapsed_time == 1) ? " hour, " : " hours, ")
		<< elapsed_min
		<< " min and "
		<< elapsed_sec
		<< " sec";

	return sout.str();
}

void check_primer(const string &m_primer)
{
	if( m_primer.empty() ){
		throw __FILE__ ":check_primer: Empty primer sequence";
	}

	for(string::const_iterator i = m_primer.begin();i != m_primer.end();++i){
		base_to_bits(*i);
	}
}
