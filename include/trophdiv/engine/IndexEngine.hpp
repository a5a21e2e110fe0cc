#pragma once

#include "trophdiv/core/Errors.hpp"
#include "trophdiv/core/Tables.hpp"

namespace trophdiv {

// IndexEngine: abundance table + trophic levels -> one row of ten indices per community.
//
// validate() runs the structural checks (species count, missing trophic levels,
// species identifiers and order) and throws InputError on the first failure.
// compute() validates, then evaluates every community independently. Communities
// without any present species yield an undefined row plus a warning; they never
// abort the other rows.
class IndexEngine {
public:
  IndexEngine() = default;

  // Emit NoSpeciesPresent warnings on stderr as they are recorded.
  explicit IndexEngine(bool log_warnings) : log_warnings_(log_warnings) {}

  static void validate(const AbundanceTable& ab, const TrophicLevels& tl);

  ResultTable compute(const AbundanceTable& ab, const TrophicLevels& tl) const;

private:
  bool log_warnings_ = true;
};

} // namespace trophdiv
