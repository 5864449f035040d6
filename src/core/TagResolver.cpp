/* @file TagResolver.cpp
 * @brief Single forward pass: tag names → positions, old positions → new positions.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>

// cycleflow headers
#include "core/TagResolver.hpp"
#include "protocols/ProtocolErrors.hpp"

using namespace cycleflow::protocols;

namespace cycleflow::core {

  ResolvedSequence resolveTags(const std::vector<Step>& method) {
    std::vector<Step> resolved;
    resolved.reserve(method.size());

    std::vector<std::size_t> newPosition(method.size(), 0); ///< old index → new 1-based position
    std::unordered_map<std::string, std::size_t> tagPosition;
    std::size_t j = 0; ///< executable steps emitted so far

    for (std::size_t i = 0; i < method.size(); ++i) {
      const Step& step = method[i];

      if (const auto* tag = std::get_if<Tag>(&step)) {
        tagPosition[tag->name()] = j + 1;
        newPosition[i] = j + 1;
        continue;
      }

      ++j;
      newPosition[i] = j;

      const auto* loop = std::get_if<Loop>(&step);
      if (!loop) {
        resolved.push_back(step);
        continue;
      }

      std::size_t target = 0;
      if (loop->isSymbolic()) {
        auto it = tagPosition.find(loop->tagName());
        if (it == tagPosition.end())
          throw MissingTagError(loop->tagName(), "Loop step with tag '" + loop->tagName() +
                                                     "' does not have a corresponding tag step.");
        target = it->second;
      } else {
        const std::size_t old = loop->position();
        if (old > i)
          throw StructuralError("Loop start index " + std::to_string(old) +
                                " cannot be on or after the loop index " + std::to_string(i + 1) +
                                ".");
        target = newPosition[old - 1];
      }

      if (target >= j)
        throw StructuralError("Loop at position " + std::to_string(j) +
                              " resolves to an empty loop body (target " + std::to_string(target) +
                              ").");
      resolved.push_back(loop->retargeted(target));
    }

    return ResolvedSequence(std::move(resolved));
  }

  ResolvedSequence resolveTags(const CyclingProtocol& protocol) {
    return resolveTags(protocol.method());
  }

} // namespace cycleflow::core
