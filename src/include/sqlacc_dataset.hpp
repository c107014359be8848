//
// Dataset Loader - BIRD-style JSON query files
//

#ifndef SQLACC_DATASET_HPP
#define SQLACC_DATASET_HPP

#include "sqlacc_value.hpp"

namespace sqlacc {

// One entry of a dataset file. Only `sql` is required.
struct QueryDescriptor {
	string sql;
	bool has_question_id = false;
	int64_t question_id = 0;
	string db_id;
	string difficulty;

	QueryDescriptor() = default;
	explicit QueryDescriptor(string sql_p) : sql(std::move(sql_p)) {
	}
};

class DatasetLoader {
public:
	// Read a JSON file holding an array of objects, each with at least a "SQL" string.
	// Throws duckdb::IOException if the file cannot be read and duckdb::InvalidInputException if the content
	// is malformed.
	static vector<QueryDescriptor> LoadFromFile(const string &path);

	// Same as LoadFromFile, on JSON text
	static vector<QueryDescriptor> Parse(const string &json);
};

} // namespace sqlacc

#endif // SQLACC_DATASET_HPP
