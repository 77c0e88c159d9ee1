#ifndef __BASE_TABLE
#define  __BASE_TABLE

#include <iostream>

// Each nucleotide symbol is stored as the set of concrete bases it
// represents (one bit per base). Two symbols are compatible when their
// sets intersect.
namespace Base
{
	enum {
		A = (1 << 0),
		C = (1 << 1),
		G = (1 << 2),
		T = (1 << 3),
		M = (A | C),
		R = (G | A),
		S = (G | C),
		V = (G | C | A),
		W = (A | T),
		Y = (T | C),
		H = (A | C | T),
		K = (G | T),
		D = (G | A | T),
		B = (G | T | C),
		N = (A | T | C | G)
	};
}

inline unsigned char base_to_bits(char m_base)
{
	switch(m_base){
		case 'A': case 'a':
			return Base::A;
		case 'T': case 't':
		case 'U': case 'u':
			return Base::T;
		case 'G': case 'g':
			return Base::G;
		case 'C': case 'c':
			return Base::C;
		case 'M': case 'm':
			return Base::M;
		case 'R': case 'r':
			return Base::R;
		case 'S': case 's':
			return Base::S;
		case 'V': case 'v':
			return Base::V;
		case 'W': case 'w':
			return Base::W;
		case 'Y': case 'y':
			return Base::Y;
		case 'H': case 'h':
			return Base::H;
		case 'K': case 'k':
			return Base::K;
		case 'D': case 'd':
			return Base::D;
		case 'B': case 'b':
			return Base::B;
		case 'N': case 'n':
			return Base::N;
		default:
			std::cerr << "base_to_bits() does not understand the symbol \'"
				<< m_base << "\' (" << int(m_base) << ")" << std::endl;

			throw __FILE__ ":base_to_bits: Illegal base";
			break;
	};
};

// Complement each IUPAC symbol, preserving case. Ambiguity codes complement to the
// code for the complementary base set (S, W and N are self-complementary).
inline char complement_base(char m_base)
{
	switch(m_base){
		case 'A': return 'T';
		case 'a': return 't';
		case 'T': return 'A';
		case 't': return 'a';
		case 'U': return 'A';
		case 'u': return 'a';
		case 'G': return 'C';
		case 'g': return 'c';
		case 'C': return 'G';
		case 'c': return 'g';
		case 'M': return 'K';
		case 'm': return 'k';
		case 'K': return 'M';
		case 'k': return 'm';
		case 'R': return 'Y';
		case 'r': return 'y';
		case 'Y': return 'R';
		case 'y': return 'r';
		case 'B': return 'V';
		case 'b': return 'v';
		case 'V': return 'B';
		case 'v': return 'b';
		case 'D': return 'H';
		case 'd': return 'h';
		case 'H': return 'D';
		case 'h': return 'd';
		case 'S': case 's':
		case 'W': case 'w':
		case 'N': case 'n':
			return m_base;
		default:
			std::cerr << "complement_base() does not understand the symbol \'"
				<< m_base << "\' (" << int(m_base) << ")" << std::endl;

			throw __FILE__ ":complement_base: Illegal base";
			break;
	};

	// We should never get here
	return 'N';
};

inline bool is_degen(unsigned char m_base)
{
	switch(m_base){
		case Base::A:
		case Base::T:
		case Base::G:
		case Base::C:
			return false;
		default:
			return true;
	};

	return true;
}

#endif // __BASE_TABLE
