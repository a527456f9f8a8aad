#pragma once

#include "settings.h"

#include <ostream>

namespace ocrscore {

// Score the inputs named by settings (--request, --input or --gt/--ocr) and
// write the JSON report to --outfile, or to out when none is given.
// Returns the process exit status: 0 on success, 1 for missing inputs or an
// incomplete corpus (reported as a JSON error envelope). Usage and verbose
// summary lines go to err. Other failures propagate as exceptions.
int run(const ScoreSettings& settings, std::ostream& out, std::ostream& err);

} // namespace ocrscore
