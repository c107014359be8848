//
// Result-set equivalence: exact set match, then a subset-tolerant fallback.
//

#ifndef SQLACC_COMPARATOR_HPP
#define SQLACC_COMPARATOR_HPP

#include "sqlacc_value.hpp"

namespace sqlacc {

// Values of a row as an unordered set. (5, 5) becomes {5}; (5, 'a') and ('a', 5) are the same set.
ValueSet ValueSetOf(const NormalizedRow &row);

// True if every member of `subset` is also in `superset`.
bool IsSubset(const ValueSet &subset, const ValueSet &superset);

// Decide whether `predicted` holds the same data as `actual`.
//
// 1. Equal sets are equivalent.
// 2. Otherwise each predicted row must find some actual row whose value set contains, or is contained in, its
//    own value set (tolerates extra or missing columns). The first predicted row without such a partner
//    makes the result false.
// 3. The number of matched predicted rows must equal the number of rows in `actual`.
//
// Step 3 counts against |actual| even though the matches are counted over `predicted`. A predicted set with more
// rows than `actual` fails even when every row matches; this is the established scoring contract and is kept.
// Column correspondence and duplicate values inside a row are not taken into account.
bool IsEquivalent(const NormalizedResultSet &actual, const NormalizedResultSet &predicted);

} // namespace sqlacc

#endif // SQLACC_COMPARATOR_HPP
