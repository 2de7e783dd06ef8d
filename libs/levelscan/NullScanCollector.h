// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEVELSCAN_NULL_SCAN_COLLECTOR_H
#define __LEVELSCAN_NULL_SCAN_COLLECTOR_H 1

#include "IScanObserver.h"

namespace mkc_levelscan
{
  class NullScanCollector : public IScanObserver
  {
  public:
    NullScanCollector() = default;
    ~NullScanCollector() override = default;

    void onCandidateResolved(const ScanDiagnosticRecord& /*record*/) override {}
  };
}

#endif
