
#ifndef CHUNKSYNC_OUTCOME_HPP
#define CHUNKSYNC_OUTCOME_HPP

#include <libp2p/outcome/outcome.hpp>

namespace outcome {
  using libp2p::outcome::result;
  using libp2p::outcome::success;
  using libp2p::outcome::failure;
}

#endif  // CHUNKSYNC_OUTCOME_HPP
