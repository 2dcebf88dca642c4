#include "chatsan/domain/notices.h"

namespace chatsan::domain {

std::string_view orphan_reason_name(const OrphanReason reason) {
  switch (reason) {
    case OrphanReason::kMissingTarget:
      return "missing_target";
    case OrphanReason::kCycle:
      return "cycle";
  }
  return "missing_target";
}

}  // namespace chatsan::domain
