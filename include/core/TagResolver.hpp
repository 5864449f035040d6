#pragma once
/** @file  TagResolver.hpp
 *  @brief Rewrites tag references into positions and drops Tag steps.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <vector>

// cycleflow headers
#include "core/ResolvedSequence.hpp"
#include "protocols/CyclingProtocol.hpp"
#include "protocols/Step.hpp"

namespace cycleflow::core {

  /**
 * @brief Resolve tags on a private copy of \p method.
 *
 *  * A tag anchors the next executable step; its name maps to that step's new
 *    1-based position.
 *  * Numeric targets refer to pre-resolution positions and are renumbered.
 *  * Idempotent: an already resolved method comes back unchanged.
 *
 *  @throws protocols::MissingTagError  loop names an unknown or later tag
 *  @throws protocols::StructuralError  target not strictly before its loop
 */
  ResolvedSequence resolveTags(const std::vector<protocols::Step>& method);

  /// Convenience overload for a validated protocol.
  ResolvedSequence resolveTags(const protocols::CyclingProtocol& protocol);

} // namespace cycleflow::core
