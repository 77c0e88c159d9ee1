#ifndef __UPDATE
#define __UPDATE

#include <string>
#include <sstream>
#include <iostream>

// In-place progress reporting for long running batches. Each call to flush() erases the
// previous message (with backspaces) and writes the current contents of the stream.
class UpdateInfo : public std::stringstream {

	private:
		size_t buffer_size;
		size_t num_total;
		size_t num_complete;
		std::ostream &out;
	public:

		UpdateInfo(const std::string &m_prefix, const size_t &m_num_total,
			std::ostream &m_out = std::cerr) :
			num_total(m_num_total), num_complete(0), out(m_out)
		{
			init(m_prefix);
		};

		void init(const std::string &m_prefix);
		void flush();
		void close();

		// Record m_count completed items and display the percent complete
		void advance(const size_t &m_count = 1);

		inline size_t complete() const
		{
			return num_complete;
		};

		inline size_t total() const
		{
			return num_total;
		};
};

#endif // __UPDATE
