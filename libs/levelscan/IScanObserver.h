// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEVELSCAN_ISCAN_OBSERVER_H
#define __LEVELSCAN_ISCAN_OBSERVER_H 1

#include "ScanDiagnosticRecord.h"

namespace mkc_levelscan
{
  class IScanObserver
  {
  public:
    virtual ~IScanObserver() = default;
    virtual void onCandidateResolved(const ScanDiagnosticRecord& record) = 0;
  };
}

#endif
