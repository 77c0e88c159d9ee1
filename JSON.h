#ifndef __AMPSIM_JSON
#define __AMPSIM_JSON

#include <map>
#include <deque>
#include <vector>
#include <string>

// A small, read-only JSON reader for configuration and primer files, plus the
// string escaping needed to write JSON reports.
namespace json
{
	class JSON
	{
		public:
			typedef enum {
				JSON_BOOL,
				JSON_NUMBER,
				JSON_STRING,
				JSON_ARRAY,
				JSON_MAP,
				JSON_NONE	// null
			} Type;

			typedef std::deque<JSON> Array;
			typedef std::map<std::string, JSON> Map;

		private:

			Type value_type;

			bool bool_value;
			double number_value;
			std::string string_value;

			// Arrays and maps are stored by pointer, since a JSON object
			// is an incomplete type within its own definition
			Array *array_ptr;
			Map *map_ptr;

			void parse(const std::string &m_text, size_t &m_pos);
			void parse_literal(const std::string &m_text, size_t &m_pos);
			void parse_number(const std::string &m_text, size_t &m_pos);
			void parse_array(const std::string &m_text, size_t &m_pos);
			void parse_map(const std::string &m_text, size_t &m_pos);

			void copy(const JSON &m_rhs);

		public:

			JSON() :
				value_type(JSON_NONE), bool_value(false), number_value(0.0),
				array_ptr(NULL), map_ptr(NULL)
			{
			};

			// Parse a complete JSON document. Trailing non-white space text is an error.
			explicit JSON(const std::string &m_text);

			JSON(const JSON &m_rhs) :
				value_type(JSON_NONE), bool_value(false), number_value(0.0),
				array_ptr(NULL), map_ptr(NULL)
			{
				copy(m_rhs);
			};

			~JSON()
			{
				clear();
			};

			JSON& operator=(const JSON &m_rhs)
			{
				if(this != &m_rhs){

					// Copy before clearing, since m_rhs may be a child of this object
					JSON tmp(m_rhs);

					clear();

					value_type = tmp.value_type;
					bool_value = tmp.bool_value;
					number_value = tmp.number_value;
					string_value.swap(tmp.string_value);

					array_ptr = tmp.array_ptr;
					map_ptr = tmp.map_ptr;

					tmp.array_ptr = NULL;
					tmp.map_ptr = NULL;
					tmp.value_type = JSON_NONE;
				}

				return *this;
			};

			void clear()
			{
				if(array_ptr != NULL){

					delete array_ptr;
					array_ptr = NULL;
				}

				if(map_ptr != NULL){

					delete map_ptr;
					map_ptr = NULL;
				}

				string_value.clear();
				value_type = JSON_NONE;
			};

			inline Type get_type() const
			{
				return value_type;
			};

			size_t size() const;

			bool get_bool() const;
			double get_number() const;
			int get_int() const;
			std::string get_string() const;

			bool has_key(const std::string &m_key) const;

			// The sorted map keys
			std::vector<std::string> keys() const;

			// Access a map element
			const JSON& operator[](const std::string &m_key) const;

			// Access an array element
			const JSON& operator[](const size_t &m_index) const;
	};

	// Escape a string for inclusion (between double quotes) in a JSON document
	std::string escape(const std::string &m_str);
}

#endif // __AMPSIM_JSON
