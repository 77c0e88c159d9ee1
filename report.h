#ifndef __REPORT
#define __REPORT

#include <ostream>
#include <string>
#include "engine.h"

// FASTA sequence lines are wrapped at this many columns
#define	FASTA_LINE_WIDTH	60

// Human readable summary of a single simulation
void write_text_report(std::ostream &m_out, const InsilicoPCRResult &m_result);

// A single JSON object (no trailing comma or newline). Every line after the first is prefixed
// by m_indent so that the object can be nested inside a larger document.
void write_json_report(std::ostream &m_out, const InsilicoPCRResult &m_result,
	const std::string &m_indent = "");

// One FASTA record per predicted product:
// ><template>_amplicon<i>[_PRIMARY] size=<n>bp pos=<start>-<end> likelihood=<x>%
void write_fasta_amplicons(std::ostream &m_out, const InsilicoPCRResult &m_result);

#endif // __REPORT
