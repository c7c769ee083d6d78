// SPDX-License-Identifier: MIT

#pragma once
#include "inference_table.hpp"
#include <vector>

namespace qth {

// Chains two tables: pre maps x -> y, post maps y -> z, the result maps
// x -> union of post[y] over pre[x]. pre's output (register and time) must be
// post's input, otherwise MalformedError. Keys whose predictions become empty
// are kept with an empty set and listed in contradictions(); with `strict`
// a ContradictionError is thrown instead.
InferenceTable consistency(const InferenceTable& pre, const InferenceTable& post, bool strict = false);

// As above, each merged entry further intersected with reference[key] where
// the reference has that key. The reference must relate the same input and
// output as the merged table.
InferenceTable consistency(const InferenceTable& pre, const InferenceTable& post,
                           const InferenceTable& reference, bool strict = false);

// Left-to-right fold: consistency(consistency(t0, t1), t2) ...
InferenceTable consistency_chain(const std::vector<InferenceTable>& tables, bool strict = false);

} // namespace qth
