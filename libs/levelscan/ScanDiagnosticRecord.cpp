// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ScanDiagnosticRecord.h"

namespace mkc_levelscan
{
  std::string candidateOutcomeToString (CandidateOutcome outcome)
  {
    switch (outcome)
      {
      case CandidateOutcome::COMPLETED:
	return "COMPLETED";
      case CandidateOutcome::NO_RETEST:
	return "NO_RETEST";
      case CandidateOutcome::NO_TAKEOFF:
	return "NO_TAKEOFF";
      }

    return "UNKNOWN";
  }
}
