#pragma once

#include <memory>
#include <string>

#include "alerts/v1/sync.pb.h"
#include "internal/util/cancellation.hpp"

namespace alerts::sync {

/*
  A received payload waiting to be applied.
*/
struct ReplicationTask {
  alerts::v1::SyncPayload payload;

  std::shared_ptr<alerts::util::CancellationToken> cancel = std::make_shared<alerts::util::CancellationToken>();

  const std::string& Id() const {
    return payload.id();
  }
};

} // namespace alerts::sync
