#include "sequence.h"
#include <string.h>
#include <ctype.h>

#include <zlib.h>

using namespace std;

char normalize_template_base(char m_base);

// Read every record of a (possibly gzip-compressed) fasta file. Template
// bases are converted to upper case and any ambiguity code is replaced by 'N'.
void parse_fasta(const string &m_filename, deque<Sequence> &m_dbase)
{
	// Use zlib to read both compressed and uncompressed fasta files.
	gzFile fin = gzopen(m_filename.c_str(), "r");

	if(fin == NULL){

		cerr << "Error opening: " << m_filename << endl;
		throw __FILE__ ":parse_fasta: Unable to open fasta file";
	}

	const int buffer_len = 2048;
	char buffer[buffer_len];

	string defline;
	string seq;

	bool has_record = false;

	// gzgets() returns at most buffer_len - 1 characters, so a single long line
	// may be split across several reads.
	bool line_start = true;
	bool in_defline = false;

	try{
		while( gzgets(fin, buffer, buffer_len) ){

			if(line_start && (buffer[0] == '>') ){

				if(has_record){
					m_dbase.push_back( Sequence(defline, seq) );
				}

				has_record = true;
				in_defline = true;

				defline.clear();
				seq.clear();
			}

			const size_t len = strlen(buffer);

			line_start = (len > 0) && (buffer[len - 1] == '\n');

			if(in_defline){

				for(char* p = buffer;*p != '\0';++p){

					if( (*p != '\n') && (*p != '\r') ){
						defline.push_back(*p);
					}
				}

				if(line_start){
					in_defline = false;
				}

				continue;
			}

			for(char* p = buffer;*p != '\0';++p){

				if( !isspace(*p) ){

					if(!has_record){
						throw __FILE__ ":parse_fasta: Sequence data found before the first defline";
					}

					seq.push_back( normalize_template_base(*p) );
				}
			}
		}
	}
	catch(const char *error){

		gzclose(fin);

		cerr << "Error reading: " << m_filename << endl;
		throw error;
	}

	if(has_record){
		m_dbase.push_back( Sequence(defline, seq) );
	}

	gzclose(fin);
}

char normalize_template_base(char m_base)
{
	// Throws for symbols that are not valid IUPAC bases
	const unsigned char bits = base_to_bits(m_base);

	if( is_degen(bits) ){
		return 'N';
	}

	switch(bits){
		case Base::A:
			return 'A';
		case Base::C:
			return 'C';
		case Base::G:
			return 'G';
		case Base::T:
			return 'T';
	};

	return 'N';
}
