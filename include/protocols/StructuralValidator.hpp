#pragma once
/** @file  StructuralValidator.hpp
 *  @brief Construction-time loop/tag checks on an unresolved step method.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <vector>

// cycleflow headers
#include "protocols/Step.hpp"

namespace cycleflow::protocols {

  /**
 * @brief Reject a method whose loops and tags cannot be resolved.
 *
 *  Positions are the original 1-based positions, tags included. The first
 *  violation found is thrown:
 *  * empty method, duplicate tag names (all of them listed);
 *  * numeric target on or after the loop;
 *  * unknown tag (`MissingTagError`), tag placed after its loop;
 *  * no executable step between the anchor and the loop (empty body).
 *
 *  @throws StructuralError
 */
  void validateStructure(const std::vector<Step>& method);

} // namespace cycleflow::protocols
