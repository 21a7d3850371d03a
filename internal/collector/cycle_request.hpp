#pragma once

#include <future>
#include <string>

#include "internal/core/cycle_report.hpp"

namespace portwatch::collector {

/*
  An out-of-band "scan now" request.

  The worker fulfils the promise with the cycle's report, or with the
  exception the cycle raised.
*/
struct CycleRequest {
  std::string                     reason;
  std::promise<core::CycleReport> done;
};

}
